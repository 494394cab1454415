#pragma once

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QThread>

#include <algorithm>
#include <functional>
#include <stdexcept>

#include "reel/http_client.hpp"

namespace reel::test {

// Scripted in-memory server. Serves one resource with Range support and records every request.
class FakeHttpClient final : public HttpClient {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&, const TransferObserver&)>;

    void setResource(const QByteArray& data) {
        QMutexLocker lock(&mutex_);
        resource_ = data;
    }

    void setHonorRange(bool honor) {
        QMutexLocker lock(&mutex_);
        honorRange_ = honor;
    }

    void setHeadContentLength(bool send) {
        QMutexLocker lock(&mutex_);
        headContentLength_ = send;
    }

    void setDelayMs(int delayMs) {
        QMutexLocker lock(&mutex_);
        delayMs_ = delayMs;
    }

    // The first `times` requests for the range starting at `start` fail. status 0 is a transport
    // failure, anything else is returned as that HTTP status.
    void failRange(qint64 start, int times, int status = 0) {
        QMutexLocker lock(&mutex_);
        failures_.insert(start, {times, status});
    }

    void setHandler(Handler handler) {
        QMutexLocker lock(&mutex_);
        handler_ = std::move(handler);
    }

    void throwOnNextRequest(const QString& message) {
        QMutexLocker lock(&mutex_);
        throwMessage_ = message;
    }

    using HttpClient::execute;
    HttpResponse execute(const HttpRequest& request, const TransferObserver& observer) override {
        int delayMs = 0;
        Handler handler;
        QString throwMessage;
        {
            QMutexLocker lock(&mutex_);
            requests_.append(request);
            ++inFlight_;
            maxInFlight_ = std::max(maxInFlight_, inFlight_);
            delayMs = delayMs_;
            handler = handler_;
            throwMessage = throwMessage_;
            throwMessage_.clear();
        }
        if (delayMs > 0) {
            QThread::msleep(static_cast<unsigned long>(delayMs));
        }

        const auto done = [this]() {
            QMutexLocker lock(&mutex_);
            --inFlight_;
        };
        if (!throwMessage.isEmpty()) {
            done();
            throw std::runtime_error(throwMessage.toStdString());
        }

        const HttpResponse response = handler ? handler(request, observer) : serve(request, observer);
        done();
        return response;
    }

    [[nodiscard]] QList<HttpRequest> requests() const {
        QMutexLocker lock(&mutex_);
        return requests_;
    }

    [[nodiscard]] int requestCount() const {
        QMutexLocker lock(&mutex_);
        return requests_.size();
    }

    [[nodiscard]] int requestsForRange(qint64 start) const {
        QMutexLocker lock(&mutex_);
        int count = 0;
        for (const HttpRequest& request : requests_) {
            qint64 from = -1;
            qint64 to = -1;
            if (parseRange(headerValue(request.headers, "Range"), &from, &to) && from == start) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] int maxInFlight() const {
        QMutexLocker lock(&mutex_);
        return maxInFlight_;
    }

    static bool parseRange(const QString& header, qint64* from, qint64* to) {
        static const QRegularExpression pattern(QStringLiteral("^bytes=(\\d+)-(\\d+)$"));
        const QRegularExpressionMatch match = pattern.match(header);
        if (!match.hasMatch()) {
            return false;
        }
        *from = match.captured(1).toLongLong();
        *to = match.captured(2).toLongLong();
        return true;
    }

private:
    struct Failure {
        int remaining = 0;
        int status = 0;
    };

    HttpResponse serve(const HttpRequest& request, const TransferObserver& observer) {
        QByteArray resource;
        bool honorRange = true;
        bool headContentLength = true;
        {
            QMutexLocker lock(&mutex_);
            resource = resource_;
            honorRange = honorRange_;
            headContentLength = headContentLength_;
        }

        if (request.method == "HEAD") {
            HttpResponse response;
            response.status = 200;
            response.statusText = "OK";
            if (headContentLength) {
                response.headers.append({"Content-Length", QString::number(resource.size())});
            }
            return response;
        }

        if (request.method == "POST") {
            qint64 total = 0;
            for (const FormPart& part : request.formParts) {
                total += part.data.size();
            }
            if (observer.onUploadProgress) {
                observer.onUploadProgress(total / 2, total);
                observer.onUploadProgress(total, total);
            }
            HttpResponse response;
            response.status = 200;
            response.statusText = "OK";
            response.body = R"({"success":true})";
            return response;
        }

        qint64 from = -1;
        qint64 to = -1;
        const bool ranged = parseRange(headerValue(request.headers, "Range"), &from, &to);
        if (ranged) {
            QMutexLocker lock(&mutex_);
            auto it = failures_.find(from);
            if (it != failures_.end() && it->remaining > 0) {
                --it->remaining;
                if (it->status == 0) {
                    return HttpResponse::transportFailure("connection reset");
                }
                HttpResponse response;
                response.status = it->status;
                response.statusText = "Injected failure";
                return response;
            }
        }

        HttpResponse response;
        if (ranged && honorRange) {
            const qint64 last = std::min<qint64>(to, resource.size() - 1);
            response.status = 206;
            response.statusText = "Partial Content";
            response.body = resource.mid(from, last - from + 1);
            response.headers.append({"Content-Range",
                QString("bytes %1-%2/%3").arg(from).arg(last).arg(resource.size())});
        } else {
            response.status = 200;
            response.statusText = "OK";
            response.body = resource;
        }
        response.headers.append({"Content-Length", QString::number(response.body.size())});

        if (observer.onDownloadProgress) {
            const qint64 total = response.body.size();
            observer.onDownloadProgress(total / 2, total);
            observer.onDownloadProgress(total, total);
        }
        return response;
    }

    mutable QMutex mutex_;
    QByteArray resource_;
    bool honorRange_ = true;
    bool headContentLength_ = true;
    int delayMs_ = 0;
    QHash<qint64, Failure> failures_;
    Handler handler_;
    QString throwMessage_;
    QList<HttpRequest> requests_;
    int inFlight_ = 0;
    int maxInFlight_ = 0;
};

// Deterministic, non-repeating-looking bytes so that misplaced ranges are detectable.
inline QByteArray patternBytes(qint64 size) {
    QByteArray data(static_cast<qsizetype>(size), Qt::Uninitialized);
    quint32 state = 2166136261u;
    for (qint64 i = 0; i < size; ++i) {
        state = (state ^ static_cast<quint32>(i)) * 16777619u;
        data[static_cast<qsizetype>(i)] = static_cast<char>(state >> 24);
    }
    return data;
}

}  // namespace reel::test
