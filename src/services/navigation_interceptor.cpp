#include "reel/navigation_interceptor.hpp"

#include <exception>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"

namespace reel {

namespace {

class RecordingHistory final : public HistoryApi {
public:
    RecordingHistory(std::shared_ptr<HistoryApi> inner, std::function<void(NavigationTrigger)> onChange)
        : inner_(std::move(inner)),
          onChange_(std::move(onChange)) {}

    QString currentUrl() const override { return inner_->currentUrl(); }

    void pushState(const QJsonValue& state, const QString& url) override {
        inner_->pushState(state, url);
        onChange_(NavigationTrigger::PushState);
    }

    void replaceState(const QJsonValue& state, const QString& url) override {
        inner_->replaceState(state, url);
        onChange_(NavigationTrigger::ReplaceState);
    }

    bool go(int delta) override { return inner_->go(delta); }

    void assignFragment(const QString& fragment) override { inner_->assignFragment(fragment); }

private:
    std::shared_ptr<HistoryApi> inner_;
    std::function<void(NavigationTrigger)> onChange_;
};

}  // namespace

NavigationInterceptor::NavigationInterceptor(NavigationHost& host, Handler handler)
    : host_(host),
      handler_(std::move(handler)) {}

NavigationInterceptor::~NavigationInterceptor() {
    if (installed_) {
        uninstall();
    }
}

void NavigationInterceptor::emitMarker(NavigationTrigger trigger) {
    Telemetry::instance().incrementCounter("navigation.markers");
    if (!handler_) {
        return;
    }
    try {
        handler_(host_.currentUrl(), trigger);
    } catch (const std::exception& ex) {
        qCWarning(lcCapture) << "navigation handler failed" << navigationTriggerName(trigger) << ex.what();
    }
}

void NavigationInterceptor::install() {
    if (installed_) {
        qCWarning(lcCapture) << "navigation interceptor already installed";
        Telemetry::instance().recordEvent("interceptor_reinstall", {{"interceptor", "navigation"}});
        return;
    }

    emitMarker(NavigationTrigger::Initial);

    original_ = host_.history();
    host_.setHistory(std::make_shared<RecordingHistory>(original_, [this](NavigationTrigger trigger) {
        emitMarker(trigger);
    }));
    popStateListener_ = host_.addListener(NavigationSignal::PopState, [this]() {
        emitMarker(NavigationTrigger::PopState);
    });
    hashChangeListener_ = host_.addListener(NavigationSignal::HashChange, [this]() {
        emitMarker(NavigationTrigger::HashChange);
    });
    installed_ = true;
}

void NavigationInterceptor::uninstall() {
    if (!installed_) {
        return;
    }
    host_.setHistory(original_);
    host_.removeListener(popStateListener_);
    host_.removeListener(hashChangeListener_);
    original_.reset();
    popStateListener_ = 0;
    hashChangeListener_ = 0;
    installed_ = false;
}

}  // namespace reel
