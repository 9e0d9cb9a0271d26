#ifndef WINDOWEVENTHANDLER_H
#define WINDOWEVENTHANDLER_H

#include <QObject>
#include <QCloseEvent>
#include <QEvent>
#include <QResizeEvent>

class MainWindow;

/**
 * @brief Handler for main window lifecycle events
 *
 * Manages:
 * - Close: runs the shutdown sequence once, then lets the window close
 * - Resize and state changes: keeps the stored geometry current and pauses
 *   frame-rate sampling while minimized
 */
class WindowEventHandler : public QObject
{
    Q_OBJECT

public:
    explicit WindowEventHandler(MainWindow* mainWindow, QObject* parent = nullptr);
    ~WindowEventHandler() override = default;

    void handleCloseEvent(QCloseEvent* event);
    void handleResizeEvent(QResizeEvent* event);
    void handleChangeEvent(QEvent* event);

private:
    MainWindow* m_mainWindow;
};

#endif // WINDOWEVENTHANDLER_H
