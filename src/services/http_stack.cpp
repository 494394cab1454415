#include "reel/http_stack.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>

#include "reel/logging.hpp"

namespace reel {

QByteArray encodeBody(const QVariant& body) {
    if (!body.isValid() || body.isNull()) {
        return {};
    }
    switch (body.typeId()) {
    case QMetaType::QByteArray:
        return body.toByteArray();
    case QMetaType::QString:
        return body.toString().toUtf8();
    case QMetaType::QJsonObject:
        return QJsonDocument(body.toJsonObject()).toJson(QJsonDocument::Compact);
    case QMetaType::QJsonArray:
        return QJsonDocument(body.toJsonArray()).toJson(QJsonDocument::Compact);
    case QMetaType::QJsonDocument:
        return body.toJsonDocument().toJson(QJsonDocument::Compact);
    case QMetaType::QVariantMap:
        return QJsonDocument(QJsonObject::fromVariantMap(body.toMap())).toJson(QJsonDocument::Compact);
    case QMetaType::QVariantList:
        return QJsonDocument(QJsonArray::fromVariantList(body.toList())).toJson(QJsonDocument::Compact);
    default:
        return body.toString().toUtf8();
    }
}

void RequestHandle::open(const QString& method, const QString& url) {
    request_ = HttpRequest{};
    request_.kind = TransportKind::Request;
    request_.correlationId = stack_->nextCorrelationId();
    request_.method = method.toUpper();
    request_.url = url;
    response_ = HttpResponse{};
    opened_ = true;
}

void RequestHandle::setRequestHeader(const QString& name, const QString& value) {
    if (!opened_) {
        qCWarning(lcCapture) << "setRequestHeader called before open; ignored" << name;
        return;
    }
    request_.headers.append({name, value});
}

void RequestHandle::setTimeout(int timeoutMs) {
    request_.timeoutMs = timeoutMs;
}

bool RequestHandle::send(const QVariant& body) {
    if (!opened_) {
        response_ = HttpResponse::transportFailure("send called before open");
        return false;
    }
    request_.body = encodeBody(body);
    response_ = stack_->send(request_);
    opened_ = false;
    return !response_.transportFailed();
}

HttpStack::HttpStack(std::shared_ptr<HttpClient> transport)
    : client_(std::move(transport)) {}

std::shared_ptr<HttpClient> HttpStack::client() const {
    QMutexLocker lock(&mutex_);
    return client_;
}

void HttpStack::setClient(std::shared_ptr<HttpClient> client) {
    QMutexLocker lock(&mutex_);
    client_ = std::move(client);
}

quint64 HttpStack::nextCorrelationId() const {
    return nextId_.fetchAndAddRelaxed(1);
}

HttpResponse HttpStack::send(HttpRequest request, const TransferObserver& observer) const {
    if (request.correlationId == 0) {
        request.correlationId = nextCorrelationId();
    }
    const std::shared_ptr<HttpClient> active = client();
    if (!active) {
        return HttpResponse::transportFailure("No HTTP client configured");
    }
    return active->execute(request, observer);
}

HttpResponse HttpStack::fetch(const QString& url, const FetchInit& init) const {
    HttpRequest request;
    request.kind = TransportKind::Fetch;
    request.correlationId = nextCorrelationId();
    request.method = init.method.isEmpty() ? QString("GET") : init.method.toUpper();
    request.url = url;
    request.headers = init.headers;
    request.body = encodeBody(init.body);
    request.timeoutMs = init.timeoutMs;
    return send(request);
}

RequestHandle HttpStack::createRequest() const {
    return RequestHandle(this);
}

}  // namespace reel
