#pragma once

#include <QAtomicInteger>
#include <QMutex>
#include <QVariant>

#include <memory>

#include "reel/http_client.hpp"

namespace reel {

class HttpStack;

struct FetchInit {
    QString method = "GET";
    HeaderList headers;
    QVariant body;
    int timeoutMs = 0;
};

// Structured bodies (JSON objects/arrays, variant maps/lists) are serialized as compact JSON.
QByteArray encodeBody(const QVariant& body);

// Low-level request object: open, set headers one by one, send.
class RequestHandle {
public:
    void open(const QString& method, const QString& url);
    void setRequestHeader(const QString& name, const QString& value);
    void setTimeout(int timeoutMs);
    bool send(const QVariant& body = {});

    [[nodiscard]] quint64 correlationId() const { return request_.correlationId; }
    [[nodiscard]] int status() const { return response_.status; }
    [[nodiscard]] QString statusText() const { return response_.statusText; }
    [[nodiscard]] QByteArray responseBody() const { return response_.body; }
    [[nodiscard]] QString responseHeader(const QString& name) const { return response_.header(name); }
    [[nodiscard]] const HttpResponse& response() const { return response_; }

private:
    friend class HttpStack;
    explicit RequestHandle(const HttpStack* stack) : stack_(stack) {}

    const HttpStack* stack_;
    HttpRequest request_;
    HttpResponse response_;
    bool opened_ = false;
};

// The host's shared HTTP entry points. The active client is swappable so decorators such as the
// network interceptor can be installed and removed without touching callers.
class HttpStack {
public:
    explicit HttpStack(std::shared_ptr<HttpClient> transport);

    [[nodiscard]] std::shared_ptr<HttpClient> client() const;
    void setClient(std::shared_ptr<HttpClient> client);

    HttpResponse fetch(const QString& url, const FetchInit& init = {}) const;
    RequestHandle createRequest() const;
    HttpResponse send(HttpRequest request, const TransferObserver& observer = {}) const;

    quint64 nextCorrelationId() const;

private:
    mutable QMutex mutex_;
    std::shared_ptr<HttpClient> client_;
    mutable QAtomicInteger<quint64> nextId_{1};
};

}  // namespace reel
