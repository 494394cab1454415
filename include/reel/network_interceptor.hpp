#pragma once

#include <functional>
#include <memory>

#include "reel/http_stack.hpp"
#include "reel/trace_entry.hpp"

namespace reel {

struct InterceptorHooks {
    std::function<void(const HttpRequest& request, qint64 startedMs)> onRequestStart;
    std::function<void(const TraceEntry& entry)> onRequestComplete;
    std::function<bool(const QString& url)> shouldIgnore;
};

// Decorator that turns every call it forwards into exactly one TraceEntry. The inner response
// (or exception) reaches the caller unchanged.
class TracingHttpClient final : public HttpClient {
public:
    TracingHttpClient(std::shared_ptr<HttpClient> inner, InterceptorHooks hooks, TraceEntryBuilder builder);

    using HttpClient::execute;
    HttpResponse execute(const HttpRequest& request, const TransferObserver& observer) override;

    [[nodiscard]] const std::shared_ptr<HttpClient>& inner() const { return inner_; }

private:
    bool ignored(const QString& url) const;
    void deliver(const TraceEntry& entry) const;

    std::shared_ptr<HttpClient> inner_;
    InterceptorHooks hooks_;
    TraceEntryBuilder builder_;
};

class NetworkInterceptor {
public:
    NetworkInterceptor(HttpStack& stack, InterceptorHooks hooks, int maxBodyBytes = TraceEntryBuilder::kDefaultMaxBodyBytes);
    ~NetworkInterceptor();

    NetworkInterceptor(const NetworkInterceptor&) = delete;
    NetworkInterceptor& operator=(const NetworkInterceptor&) = delete;

    void install();
    void uninstall();
    [[nodiscard]] bool isActive() const { return installed_; }

private:
    HttpStack& stack_;
    InterceptorHooks hooks_;
    TraceEntryBuilder builder_;
    std::shared_ptr<HttpClient> original_;
    std::shared_ptr<TracingHttpClient> decorator_;
    bool installed_ = false;
};

}  // namespace reel
