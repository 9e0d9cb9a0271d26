#include "backend/media/VideoPlayerManager.h"
#include <QAudioOutput>
#include <QDebug>
#include <QFileInfo>
#include <QMediaPlayer>
#include <QVideoSink>

VideoPlayerManager::VideoPlayerManager(QObject* parent)
    : QObject(parent)
{
}

VideoPlayerManager::~VideoPlayerManager() {
    m_listeners.clear();
    dispose();
}

template<typename Fn>
void VideoPlayerManager::notify(Fn&& fn) {
    // Listeners may unsubscribe from inside a callback
    const QMap<int, IVideoPlayerListener*> snapshot = m_listeners;
    for (auto it = snapshot.cbegin(); it != snapshot.cend(); ++it) {
        if (m_listeners.contains(it.key())) {
            fn(it.value());
        }
    }
}

int VideoPlayerManager::subscribe(IVideoPlayerListener* listener) {
    if (!listener) return 0;
    for (auto it = m_listeners.cbegin(); it != m_listeners.cend(); ++it) {
        if (it.value() == listener) return it.key();
    }
    const int handle = m_nextHandle++;
    m_listeners.insert(handle, listener);
    return handle;
}

bool VideoPlayerManager::unsubscribe(int handle) {
    return m_listeners.remove(handle) > 0;
}

int VideoPlayerManager::unsubscribeAll() {
    const int removed = m_listeners.size();
    m_listeners.clear();
    return removed;
}

void VideoPlayerManager::ensurePlayer() {
    if (m_player) return;

    m_player = new QMediaPlayer(this);
    m_audio = new QAudioOutput(this);
    m_sink = new QVideoSink(this);
    m_audio->setVolume(m_volume);
    m_player->setAudioOutput(m_audio);
    m_player->setVideoSink(m_sink);

    connect(m_player, &QMediaPlayer::hasVideoChanged, this, [this](bool hasVideo) {
        notify([hasVideo](IVideoPlayerListener* l) { l->onVideoTrackDetected(hasVideo); });
    });
    connect(m_player, &QMediaPlayer::playbackStateChanged, this, [this](QMediaPlayer::PlaybackState state) {
        setPlaying(state == QMediaPlayer::PlayingState);
    });
    connect(m_player, &QMediaPlayer::positionChanged, this, [this](qint64 position) {
        const qint64 duration = m_player ? m_player->duration() : 0;
        notify([position, duration](IVideoPlayerListener* l) { l->onProgressUpdated(position, duration); });
    });
    connect(m_player, &QMediaPlayer::mediaStatusChanged, this, [this](QMediaPlayer::MediaStatus status) {
        if (status != QMediaPlayer::EndOfMedia) return;
        notify([](IVideoPlayerListener* l) { l->onMediaEnded(); });
        if (m_loop && m_player) {
            m_player->setPosition(0);
            m_player->play();
        }
    });
    connect(m_player, &QMediaPlayer::errorOccurred, this, [this](QMediaPlayer::Error error, const QString& errorString) {
        qWarning() << "VideoPlayerManager: Playback error" << error << errorString << "for" << m_currentFile;
    });
}

bool VideoPlayerManager::load(const QString& filePath) {
    if (!QFileInfo::exists(filePath)) {
        qWarning() << "VideoPlayerManager: File not found" << filePath;
        return false;
    }
    m_disposed = false;
    ensurePlayer();
    m_currentFile = filePath;
    m_player->setSource(QUrl::fromLocalFile(filePath));
    notify([&filePath](IVideoPlayerListener* l) { l->onMediaChanged(filePath); });
    return true;
}

void VideoPlayerManager::play() {
    if (m_player) m_player->play();
}

void VideoPlayerManager::pause() {
    if (m_player) m_player->pause();
}

void VideoPlayerManager::stop() {
    if (m_player) m_player->stop();
    setPlaying(false);
}

void VideoPlayerManager::setVolume(float volume) {
    m_volume = qBound(0.0f, volume, 1.0f);
    if (m_audio) m_audio->setVolume(m_volume);
}

void VideoPlayerManager::setPlaying(bool playing) {
    if (m_playing == playing) return;
    m_playing = playing;
    notify([playing](IVideoPlayerListener* l) { l->onPlayStateChanged(playing); });
}

void VideoPlayerManager::dispose() {
    if (m_disposed) return;
    m_disposed = true;
    if (m_player) {
        disconnect(m_player, nullptr, this, nullptr);
        m_player->stop();
        m_player->setSource(QUrl());
        delete m_player;
        m_player = nullptr;
    }
    delete m_audio;
    m_audio = nullptr;
    delete m_sink;
    m_sink = nullptr;
    m_playing = false;
    m_currentFile.clear();
    qDebug() << "VideoPlayerManager: Disposed";
}
