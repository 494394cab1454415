#include "reel/network_http_client.hpp"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QHttpMultiPart>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"

namespace reel {

namespace {

QHttpMultiPart* buildMultiPart(const QList<FormPart>& parts) {
    auto* multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);
    for (const FormPart& part : parts) {
        QHttpPart httpPart;
        QString disposition = QString("form-data; name=\"%1\"").arg(part.name);
        if (!part.fileName.isEmpty()) {
            disposition += QString("; filename=\"%1\"").arg(part.fileName);
        }
        httpPart.setHeader(QNetworkRequest::ContentDispositionHeader, disposition);
        if (!part.contentType.isEmpty()) {
            httpPart.setHeader(QNetworkRequest::ContentTypeHeader, part.contentType);
        }
        httpPart.setBody(part.data);
        multiPart->append(httpPart);
    }
    return multiPart;
}

}  // namespace

HttpResponse NetworkHttpClient::execute(const HttpRequest& request, const TransferObserver& observer) {
    if (observer.cancel.isCancelled()) {
        return HttpResponse::transportFailure("Request cancelled before start");
    }

    QNetworkAccessManager manager;
    QNetworkRequest networkRequest{QUrl(request.url)};
    for (const auto& header : request.headers) {
        networkRequest.setRawHeader(header.first.toUtf8(), header.second.toUtf8());
    }
    if (request.timeoutMs > 0) {
        networkRequest.setTransferTimeout(request.timeoutMs);
    }

    const QByteArray verb = request.method.toUpper().toUtf8();
    QNetworkReply* reply = nullptr;
    if (!request.formParts.isEmpty()) {
        QHttpMultiPart* multiPart = buildMultiPart(request.formParts);
        reply = manager.sendCustomRequest(networkRequest, verb, multiPart);
        multiPart->setParent(reply);
    } else if (verb == "GET" && request.body.isEmpty()) {
        reply = manager.get(networkRequest);
    } else if (verb == "HEAD") {
        reply = manager.head(networkRequest);
    } else {
        reply = manager.sendCustomRequest(networkRequest, verb, request.body);
    }

    if (observer.onUploadProgress) {
        QObject::connect(reply, &QNetworkReply::uploadProgress, reply, [&observer](qint64 sent, qint64 total) {
            observer.onUploadProgress(sent, total);
        });
    }
    if (observer.onDownloadProgress) {
        QObject::connect(reply, &QNetworkReply::downloadProgress, reply, [&observer](qint64 received, qint64 total) {
            observer.onDownloadProgress(received, total);
        });
    }

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    bool cancelled = false;
    QTimer cancelPoll;
    cancelPoll.setInterval(cancelPollIntervalMs_);
    QObject::connect(&cancelPoll, &QTimer::timeout, reply, [&]() {
        if (observer.cancel.isCancelled() && reply->isRunning()) {
            cancelled = true;
            reply->abort();
        }
    });
    cancelPoll.start();

    QElapsedTimer elapsed;
    elapsed.start();
    Telemetry::instance().recordRequest();
    if (reply->isRunning()) {
        loop.exec();
    }
    cancelPoll.stop();
    Telemetry::instance().recordDurationMs("http.duration_ms", elapsed.elapsed());

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    HttpResponse response;
    if (cancelled) {
        response = HttpResponse::transportFailure(
            observer.cancel.deadlineExpired() ? "Request deadline exceeded" : "Request cancelled");
    } else if (!statusAttr.isValid()) {
        response = HttpResponse::transportFailure(reply->errorString());
        Telemetry::instance().incrementCounter("http.transport_failures");
        qCWarning(lcTransfer) << "transport failure" << request.method << request.url << reply->errorString();
    } else {
        response.status = statusAttr.toInt();
        response.statusText = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        const auto pairs = reply->rawHeaderPairs();
        for (const auto& pair : pairs) {
            response.headers.append({QString::fromUtf8(pair.first), QString::fromUtf8(pair.second)});
        }
        response.body = reply->readAll();
        if (reply->error() != QNetworkReply::NoError) {
            response.errorString = reply->errorString();
        }
    }

    return response;
}

}  // namespace reel
