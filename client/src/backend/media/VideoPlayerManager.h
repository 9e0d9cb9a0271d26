#ifndef VIDEOPLAYERMANAGER_H
#define VIDEOPLAYERMANAGER_H

#include <QObject>
#include <QList>
#include <QMap>
#include <QString>
#include <QUrl>

class QMediaPlayer;
class QAudioOutput;
class QVideoSink;

// Observer for playback events. Override only what you need.
class IVideoPlayerListener {
public:
    virtual ~IVideoPlayerListener() = default;

    virtual void onVideoTrackDetected(bool /*hasVideo*/) {}
    virtual void onPlayStateChanged(bool /*playing*/) {}
    virtual void onMediaChanged(const QString& /*filePath*/) {}
    virtual void onMediaEnded() {}
    virtual void onProgressUpdated(qint64 /*positionMs*/, qint64 /*durationMs*/) {}
};

/**
 * @brief Single shared player for video and audio media.
 *
 * Listeners are registered with subscribe(), which returns a handle; the same
 * handle is given back to unsubscribe(). The QMediaPlayer is created on first
 * load, so constructing the manager never touches the multimedia backend.
 */
class VideoPlayerManager : public QObject {
    Q_OBJECT

public:
    explicit VideoPlayerManager(QObject* parent = nullptr);
    ~VideoPlayerManager() override;

    int subscribe(IVideoPlayerListener* listener);
    bool unsubscribe(int handle);
    int unsubscribeAll();
    int listenerCount() const { return m_listeners.size(); }
    bool isSubscribed(int handle) const { return m_listeners.contains(handle); }

    bool load(const QString& filePath);
    void play();
    void pause();
    void stop();
    // Stops playback and releases the player; later calls are no-ops until load() runs again
    void dispose();

    bool isPlaying() const { return m_playing; }
    bool hasPlayer() const { return m_player != nullptr; }
    bool isDisposed() const { return m_disposed; }
    QString currentFile() const { return m_currentFile; }
    QVideoSink* videoSink() const { return m_sink; }

    void setLoopEnabled(bool enabled) { m_loop = enabled; }
    bool isLoopEnabled() const { return m_loop; }
    void setVolume(float volume);

private:
    void ensurePlayer();
    void setPlaying(bool playing);
    template<typename Fn> void notify(Fn&& fn);

    QMediaPlayer* m_player = nullptr;
    QAudioOutput* m_audio = nullptr;
    QVideoSink* m_sink = nullptr;

    QMap<int, IVideoPlayerListener*> m_listeners;
    int m_nextHandle = 1;
    QString m_currentFile;
    bool m_playing = false;
    bool m_loop = false;
    bool m_disposed = false;
    float m_volume = 1.0f;
};

#endif // VIDEOPLAYERMANAGER_H
