#ifndef FPSMONITOR_H
#define FPSMONITOR_H

#include <QObject>
#include <QElapsedTimer>

class QTimer;

/**
 * @brief FpsMonitor - Measures frame rate of the main canvas and the projection surface
 *
 * Render code calls recordMainFrame() / recordProjectionFrame() once per
 * presented frame. While monitoring, counters are sampled once per second and
 * reported through fpsUpdated().
 */
class FpsMonitor : public QObject {
    Q_OBJECT

public:
    static constexpr int SAMPLE_INTERVAL_MS = 1000;

    explicit FpsMonitor(QObject* parent = nullptr);
    ~FpsMonitor() override;

    /**
     * @brief Start periodic sampling. No-op after dispose().
     */
    void startMonitoring();

    /**
     * @brief Stop sampling and reset counters
     */
    void stopMonitoring();

    /**
     * @brief Stop and release the sampling timer; the monitor cannot be restarted
     * @return true if the monitor was running when disposed
     */
    bool dispose();

    void recordMainFrame();
    void recordProjectionFrame();

    bool isMonitoring() const;
    bool isDisposed() const { return m_disposed; }
    double mainFps() const { return m_mainFps; }
    double projectionFps() const { return m_projectionFps; }

signals:
    void fpsUpdated(double mainFps, double projectionFps);

private slots:
    void sample();

private:
    QTimer* m_sampleTimer;
    QElapsedTimer m_clock;
    int m_mainFrames = 0;
    int m_projectionFrames = 0;
    double m_mainFps = 0.0;
    double m_projectionFps = 0.0;
    bool m_disposed = false;
};

#endif // FPSMONITOR_H
