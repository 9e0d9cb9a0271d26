#include "backend/managers/system/GlobalHotKeyManager.h"
#include <QCoreApplication>
#include <QDebug>
#include <QKeyEvent>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace {
#ifdef Q_OS_WIN
    UINT nativeModifiers(Qt::KeyboardModifiers modifiers) {
        UINT native = MOD_NOREPEAT;
        if (modifiers & Qt::ControlModifier) native |= MOD_CONTROL;
        if (modifiers & Qt::AltModifier) native |= MOD_ALT;
        if (modifiers & Qt::ShiftModifier) native |= MOD_SHIFT;
        if (modifiers & Qt::MetaModifier) native |= MOD_WIN;
        return native;
    }

    UINT nativeKey(Qt::Key key) {
        if (key >= Qt::Key_F1 && key <= Qt::Key_F24) return VK_F1 + (key - Qt::Key_F1);
        if (key >= Qt::Key_A && key <= Qt::Key_Z) return 'A' + (key - Qt::Key_A);
        if (key >= Qt::Key_0 && key <= Qt::Key_9) return '0' + (key - Qt::Key_0);
        switch (key) {
        case Qt::Key_Space: return VK_SPACE;
        case Qt::Key_Escape: return VK_ESCAPE;
        case Qt::Key_Left: return VK_LEFT;
        case Qt::Key_Right: return VK_RIGHT;
        case Qt::Key_Up: return VK_UP;
        case Qt::Key_Down: return VK_DOWN;
        case Qt::Key_PageUp: return VK_PRIOR;
        case Qt::Key_PageDown: return VK_NEXT;
        case Qt::Key_Home: return VK_HOME;
        case Qt::Key_End: return VK_END;
        default: return 0;
        }
    }
#endif
}

GlobalHotKeyManager::GlobalHotKeyManager(QObject* parent)
    : QObject(parent)
{
}

GlobalHotKeyManager::~GlobalHotKeyManager() {
    dispose();
}

bool GlobalHotKeyManager::isRegistered(const QKeySequence& sequence) const {
    return !sequence.isEmpty() && m_hotKeys.contains(sequence[0].toCombined());
}

bool GlobalHotKeyManager::registerHotKey(const QKeySequence& sequence, const Handler& handler) {
    if (m_disposed || sequence.count() != 1 || !handler) {
        qWarning() << "GlobalHotKeyManager: Rejected hotkey" << sequence.toString();
        return false;
    }
    const QKeyCombination combination = sequence[0];
    if (m_hotKeys.contains(combination.toCombined())) {
        qWarning() << "GlobalHotKeyManager: Hotkey already registered" << sequence.toString();
        return false;
    }

    HotKey hotKey;
    hotKey.id = m_nextId++;
    hotKey.combination = combination;
    hotKey.handler = handler;
    if (!registerNative(hotKey)) {
        return false;
    }

    if (!m_filtersInstalled && QCoreApplication::instance()) {
#ifdef Q_OS_WIN
        QCoreApplication::instance()->installNativeEventFilter(this);
#else
        QCoreApplication::instance()->installEventFilter(this);
#endif
        m_filtersInstalled = true;
    }

    m_hotKeys.insert(combination.toCombined(), hotKey);
    qDebug() << "GlobalHotKeyManager: Registered" << sequence.toString();
    return true;
}

bool GlobalHotKeyManager::unregisterHotKey(const QKeySequence& sequence) {
    if (sequence.isEmpty()) return false;
    auto it = m_hotKeys.find(sequence[0].toCombined());
    if (it == m_hotKeys.end()) return false;
    unregisterNative(it.value());
    m_hotKeys.erase(it);
    return true;
}

int GlobalHotKeyManager::unregisterAll() {
    const int count = m_hotKeys.size();
    for (const HotKey& hotKey : std::as_const(m_hotKeys)) {
        unregisterNative(hotKey);
    }
    m_hotKeys.clear();
    return count;
}

void GlobalHotKeyManager::dispose() {
    if (m_disposed) return;
    const int released = unregisterAll();
    if (m_filtersInstalled && QCoreApplication::instance()) {
#ifdef Q_OS_WIN
        QCoreApplication::instance()->removeNativeEventFilter(this);
#else
        QCoreApplication::instance()->removeEventFilter(this);
#endif
    }
    m_filtersInstalled = false;
    m_disposed = true;
    qDebug() << "GlobalHotKeyManager: Disposed, released" << released << "hotkeys";
}

void GlobalHotKeyManager::trigger(const HotKey& hotKey) {
    const Handler handler = hotKey.handler;
    emit hotKeyActivated(QKeySequence(hotKey.combination));
    if (handler) handler();
}

bool GlobalHotKeyManager::eventFilter(QObject* watched, QEvent* event) {
    if (event->type() == QEvent::ShortcutOverride || event->type() == QEvent::KeyPress) {
        auto* keyEvent = static_cast<QKeyEvent*>(event);
        if (!keyEvent->isAutoRepeat()) {
            const Qt::KeyboardModifiers modifiers = keyEvent->modifiers() & ~Qt::KeypadModifier;
            const QKeyCombination combination(modifiers, static_cast<Qt::Key>(keyEvent->key()));
            auto it = m_hotKeys.constFind(combination.toCombined());
            if (it != m_hotKeys.constEnd()) {
                if (event->type() == QEvent::ShortcutOverride) {
                    // Claim the key so it arrives as KeyPress instead of a widget shortcut
                    event->accept();
                    return true;
                }
                trigger(it.value());
                return true;
            }
        }
    }
    return QObject::eventFilter(watched, event);
}

bool GlobalHotKeyManager::nativeEventFilter(const QByteArray& eventType, void* message, qintptr* result) {
#ifdef Q_OS_WIN
    if (eventType == "windows_generic_MSG") {
        const MSG* msg = static_cast<const MSG*>(message);
        if (msg->message == WM_HOTKEY) {
            const int id = static_cast<int>(msg->wParam);
            for (const HotKey& hotKey : std::as_const(m_hotKeys)) {
                if (hotKey.id == id) {
                    trigger(hotKey);
                    if (result) *result = 0;
                    return true;
                }
            }
        }
    }
#else
    Q_UNUSED(eventType)
    Q_UNUSED(message)
    Q_UNUSED(result)
#endif
    return false;
}

bool GlobalHotKeyManager::registerNative(const HotKey& hotKey) {
#ifdef Q_OS_WIN
    const UINT vk = nativeKey(hotKey.combination.key());
    if (vk == 0) {
        qWarning() << "GlobalHotKeyManager: No native key for" << QKeySequence(hotKey.combination).toString();
        return false;
    }
    if (!RegisterHotKey(nullptr, hotKey.id, nativeModifiers(hotKey.combination.keyboardModifiers()), vk)) {
        qWarning() << "GlobalHotKeyManager: RegisterHotKey failed for" << QKeySequence(hotKey.combination).toString()
                   << "error" << GetLastError();
        return false;
    }
#else
    Q_UNUSED(hotKey)
#endif
    return true;
}

void GlobalHotKeyManager::unregisterNative(const HotKey& hotKey) {
#ifdef Q_OS_WIN
    UnregisterHotKey(nullptr, hotKey.id);
#else
    Q_UNUSED(hotKey)
#endif
}
