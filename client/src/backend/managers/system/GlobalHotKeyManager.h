#ifndef GLOBALHOTKEYMANAGER_H
#define GLOBALHOTKEYMANAGER_H

#include <QObject>
#include <QAbstractNativeEventFilter>
#include <QHash>
#include <QKeySequence>
#include <functional>

/**
 * @brief Keyboard shortcuts that fire regardless of which window has focus.
 *
 * On Windows the shortcuts are registered system-wide with RegisterHotKey and
 * delivered as WM_HOTKEY through a native event filter. Elsewhere an
 * application-wide event filter catches key presses in any of our windows.
 */
class GlobalHotKeyManager : public QObject, public QAbstractNativeEventFilter {
    Q_OBJECT

public:
    using Handler = std::function<void()>;

    explicit GlobalHotKeyManager(QObject* parent = nullptr);
    ~GlobalHotKeyManager() override;

    // Single-chord sequences only, e.g. "Ctrl+F5"
    bool registerHotKey(const QKeySequence& sequence, const Handler& handler);
    bool unregisterHotKey(const QKeySequence& sequence);
    int unregisterAll();
    // Releases every registration and detaches the filters
    void dispose();

    int registeredCount() const { return m_hotKeys.size(); }
    bool isRegistered(const QKeySequence& sequence) const;
    bool isDisposed() const { return m_disposed; }

    bool nativeEventFilter(const QByteArray& eventType, void* message, qintptr* result) override;

signals:
    void hotKeyActivated(const QKeySequence& sequence);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    struct HotKey {
        int id = 0;
        QKeyCombination combination;
        Handler handler;
    };

    void trigger(const HotKey& hotKey);
    bool registerNative(const HotKey& hotKey);
    void unregisterNative(const HotKey& hotKey);

    QHash<int, HotKey> m_hotKeys; // keyed by QKeyCombination::toCombined()
    int m_nextId = 1;
    bool m_filtersInstalled = false;
    bool m_disposed = false;
};

#endif // GLOBALHOTKEYMANAGER_H
