#include "reel/network_interceptor.hpp"

#include <QDateTime>

#include <exception>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"

namespace reel {

TracingHttpClient::TracingHttpClient(
    std::shared_ptr<HttpClient> inner,
    InterceptorHooks hooks,
    TraceEntryBuilder builder)
    : inner_(std::move(inner)),
      hooks_(std::move(hooks)),
      builder_(builder) {}

bool TracingHttpClient::ignored(const QString& url) const {
    return hooks_.shouldIgnore && hooks_.shouldIgnore(url);
}

void TracingHttpClient::deliver(const TraceEntry& entry) const {
    Telemetry::instance().incrementCounter("capture.entries");
    if (entry.transportFailed()) {
        Telemetry::instance().incrementCounter("capture.transport_failures");
    }
    if (!hooks_.onRequestComplete) {
        return;
    }
    try {
        hooks_.onRequestComplete(entry);
    } catch (const std::exception& ex) {
        Telemetry::instance().incrementCounter("capture.sink_failures");
        qCWarning(lcCapture) << "trace sink failed for request" << entry.correlationId << ex.what();
    }
}

HttpResponse TracingHttpClient::execute(const HttpRequest& request, const TransferObserver& observer) {
    if (ignored(request.url)) {
        Telemetry::instance().incrementCounter("capture.ignored");
        return inner_->execute(request, observer);
    }

    const qint64 startedMs = QDateTime::currentMSecsSinceEpoch();
    if (hooks_.onRequestStart) {
        try {
            hooks_.onRequestStart(request, startedMs);
        } catch (const std::exception& ex) {
            Telemetry::instance().incrementCounter("capture.sink_failures");
            qCWarning(lcCapture) << "request start hook failed" << request.correlationId << ex.what();
        }
    }

    HttpResponse response;
    try {
        response = inner_->execute(request, observer);
    } catch (const std::exception& ex) {
        deliver(builder_.build(
            request,
            HttpResponse::transportFailure(QString::fromUtf8(ex.what())),
            startedMs,
            QDateTime::currentMSecsSinceEpoch()));
        throw;
    }

    deliver(builder_.build(request, response, startedMs, QDateTime::currentMSecsSinceEpoch()));
    return response;
}

NetworkInterceptor::NetworkInterceptor(HttpStack& stack, InterceptorHooks hooks, int maxBodyBytes)
    : stack_(stack),
      hooks_(std::move(hooks)),
      builder_(maxBodyBytes) {}

NetworkInterceptor::~NetworkInterceptor() {
    if (installed_) {
        uninstall();
    }
}

void NetworkInterceptor::install() {
    if (installed_) {
        qCWarning(lcCapture) << "network interceptor already installed, skipping";
        Telemetry::instance().recordEvent("interceptor_reinstall", {{"interceptor", "network"}});
        return;
    }
    original_ = stack_.client();
    decorator_ = std::make_shared<TracingHttpClient>(original_, hooks_, builder_);
    stack_.setClient(decorator_);
    installed_ = true;
    qCInfo(lcCapture) << "network interceptor installed";
}

void NetworkInterceptor::uninstall() {
    if (!installed_) {
        qCWarning(lcCapture) << "network interceptor not installed, skipping uninstall";
        return;
    }
    if (stack_.client() != decorator_) {
        qCWarning(lcCapture) << "http client was replaced while the interceptor was installed; restoring original";
    }
    stack_.setClient(original_);
    original_.reset();
    decorator_.reset();
    installed_ = false;
    qCInfo(lcCapture) << "network interceptor uninstalled";
}

}  // namespace reel
