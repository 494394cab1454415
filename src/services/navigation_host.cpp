#include "reel/navigation.hpp"

#include <QUrl>

namespace reel {

QString navigationTriggerName(NavigationTrigger trigger) {
    switch (trigger) {
    case NavigationTrigger::Initial:
        return "initial";
    case NavigationTrigger::PushState:
        return "pushState";
    case NavigationTrigger::ReplaceState:
        return "replaceState";
    case NavigationTrigger::PopState:
        return "popstate";
    case NavigationTrigger::HashChange:
        return "hashchange";
    }
    return "unknown";
}

SimulatedHistory::SimulatedHistory(const QString& initialUrl) {
    entries_.append({initialUrl, QJsonValue(QJsonValue::Null)});
}

QString SimulatedHistory::resolve(const QString& url) const {
    if (url.isEmpty()) {
        return currentUrl();
    }
    return QUrl(currentUrl()).resolved(QUrl(url)).toString();
}

QString SimulatedHistory::currentUrl() const {
    return entries_.at(index_).url;
}

QJsonValue SimulatedHistory::state() const {
    return entries_.at(index_).state;
}

void SimulatedHistory::pushState(const QJsonValue& state, const QString& url) {
    const QString target = resolve(url);
    while (entries_.size() > index_ + 1) {
        entries_.removeLast();
    }
    entries_.append({target, state});
    index_ = entries_.size() - 1;
}

void SimulatedHistory::replaceState(const QJsonValue& state, const QString& url) {
    entries_[index_] = Entry{resolve(url), state};
}

bool SimulatedHistory::go(int delta) {
    const int target = index_ + delta;
    if (delta == 0 || target < 0 || target >= entries_.size()) {
        return false;
    }
    index_ = target;
    return true;
}

void SimulatedHistory::assignFragment(const QString& fragment) {
    QUrl url(currentUrl());
    url.setFragment(fragment.startsWith('#') ? fragment.mid(1) : fragment);
    pushState(QJsonValue(QJsonValue::Null), url.toString());
}

NavigationHost::NavigationHost(std::shared_ptr<HistoryApi> history)
    : history_(std::move(history)) {}

QString NavigationHost::currentUrl() const {
    return history_ ? history_->currentUrl() : QString();
}

void NavigationHost::pushState(const QJsonValue& state, const QString& url) {
    history_->pushState(state, url);
}

void NavigationHost::replaceState(const QJsonValue& state, const QString& url) {
    history_->replaceState(state, url);
}

bool NavigationHost::back() {
    if (!history_->go(-1)) {
        return false;
    }
    dispatch(NavigationSignal::PopState);
    return true;
}

bool NavigationHost::forward() {
    if (!history_->go(1)) {
        return false;
    }
    dispatch(NavigationSignal::PopState);
    return true;
}

void NavigationHost::setFragment(const QString& fragment) {
    history_->assignFragment(fragment);
    dispatch(NavigationSignal::HashChange);
}

int NavigationHost::addListener(NavigationSignal signal, Listener listener) {
    const int id = nextListenerId_++;
    listeners_.insert(id, Registration{signal, std::move(listener)});
    return id;
}

void NavigationHost::removeListener(int id) {
    listeners_.remove(id);
}

void NavigationHost::dispatch(NavigationSignal signal) {
    const auto snapshot = listeners_;
    for (auto it = snapshot.constBegin(); it != snapshot.constEnd(); ++it) {
        if (it.value().signal == signal && it.value().listener) {
            it.value().listener();
        }
    }
}

}  // namespace reel
