#ifndef PROJECTIONMANAGER_H
#define PROJECTIONMANAGER_H

#include <QObject>
#include <QImage>
#include <QPointer>
#include <QWidget>

class QScreen;

// Frameless surface covering one screen; draws the current image letterboxed on black.
class ProjectionWindow : public QWidget {
    Q_OBJECT

public:
    explicit ProjectionWindow(QWidget* parent = nullptr);

    void setImage(const QImage& image);
    const QImage& image() const { return m_image; }

signals:
    void framePresented();

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    QImage m_image;
};

/**
 * @brief Opens and drives the audience-facing projection window.
 *
 * The window goes full screen on the configured screen, or on the first
 * non-primary screen when none is configured, falling back to the primary one.
 */
class ProjectionManager : public QObject {
    Q_OBJECT

public:
    explicit ProjectionManager(QObject* parent = nullptr);
    ~ProjectionManager() override;

    // screenIndex < 0 picks a secondary screen automatically
    bool openProjection(int screenIndex = -1);
    void updateImage(const QImage& image);
    // Returns whether a projection window was open
    bool closeProjection();
    void dispose();

    bool isOpen() const;
    bool isDisposed() const { return m_disposed; }
    ProjectionWindow* window() const { return m_window; }
    QImage currentImage() const { return m_currentImage; }

    static QScreen* targetScreen(int screenIndex);

signals:
    void projectionStateChanged(bool open);
    void framePresented();

private:
    QPointer<ProjectionWindow> m_window;
    QImage m_currentImage;
    bool m_disposed = false;
};

#endif // PROJECTIONMANAGER_H
