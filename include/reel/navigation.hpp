#pragma once

#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>

#include <functional>
#include <memory>

namespace reel {

enum class NavigationTrigger {
    Initial,
    PushState,
    ReplaceState,
    PopState,
    HashChange,
};

QString navigationTriggerName(NavigationTrigger trigger);

// History-mutation primitives of the host.
class HistoryApi {
public:
    virtual ~HistoryApi() = default;

    virtual QString currentUrl() const = 0;
    virtual void pushState(const QJsonValue& state, const QString& url) = 0;
    virtual void replaceState(const QJsonValue& state, const QString& url) = 0;
    // Moves through the history stack; false when the target is out of range.
    virtual bool go(int delta) = 0;
    virtual void assignFragment(const QString& fragment) = 0;
};

// In-memory history stack. Relative URLs passed to pushState/replaceState resolve against the
// current entry.
class SimulatedHistory final : public HistoryApi {
public:
    explicit SimulatedHistory(const QString& initialUrl);

    QString currentUrl() const override;
    void pushState(const QJsonValue& state, const QString& url) override;
    void replaceState(const QJsonValue& state, const QString& url) override;
    bool go(int delta) override;
    void assignFragment(const QString& fragment) override;

    [[nodiscard]] int length() const { return entries_.size(); }
    [[nodiscard]] QJsonValue state() const;

private:
    struct Entry {
        QString url;
        QJsonValue state;
    };

    QString resolve(const QString& url) const;

    QList<Entry> entries_;
    int index_ = 0;
};

enum class NavigationSignal {
    PopState,
    HashChange,
};

// Owns the swappable history primitives plus the native navigation signal listeners.
class NavigationHost {
public:
    using Listener = std::function<void()>;

    explicit NavigationHost(std::shared_ptr<HistoryApi> history);

    [[nodiscard]] std::shared_ptr<HistoryApi> history() const { return history_; }
    void setHistory(std::shared_ptr<HistoryApi> history) { history_ = std::move(history); }

    QString currentUrl() const;
    void pushState(const QJsonValue& state, const QString& url);
    void replaceState(const QJsonValue& state, const QString& url);
    bool back();
    bool forward();
    void setFragment(const QString& fragment);

    int addListener(NavigationSignal signal, Listener listener);
    void removeListener(int id);
    void dispatch(NavigationSignal signal);

private:
    struct Registration {
        NavigationSignal signal;
        Listener listener;
    };

    std::shared_ptr<HistoryApi> history_;
    QMap<int, Registration> listeners_;
    int nextListenerId_ = 1;
};

}  // namespace reel
