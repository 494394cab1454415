#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>

#include <functional>

#include "reel/cancellation.hpp"

namespace reel {

// The two call styles the host exposes: a low-level request object and a fetch-style call.
enum class TransportKind {
    Request,
    Fetch,
};

QString transportKindName(TransportKind kind);

using HeaderList = QList<QPair<QString, QString>>;

QString headerValue(const HeaderList& headers, const QString& name);

struct FormPart {
    QString name;
    QByteArray data;
    QString fileName;
    QString contentType;
};

struct HttpRequest {
    quint64 correlationId = 0;
    TransportKind kind = TransportKind::Fetch;
    QString method = "GET";
    QString url;
    HeaderList headers;
    QByteArray body;
    QList<FormPart> formParts;
    int timeoutMs = 0;
};

// status == 0 only when the request never produced an HTTP response.
struct HttpResponse {
    int status = 0;
    QString statusText;
    HeaderList headers;
    QByteArray body;
    QString errorString;

    [[nodiscard]] bool transportFailed() const { return status == 0; }
    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
    [[nodiscard]] QString header(const QString& name) const { return headerValue(headers, name); }

    static HttpResponse transportFailure(const QString& message);
};

struct TransferObserver {
    std::function<void(qint64 sent, qint64 total)> onUploadProgress;
    std::function<void(qint64 received, qint64 total)> onDownloadProgress;
    CancellationToken cancel;
};

// Every outbound call of the system goes through an HttpClient. Implementations block until the
// call completes and report transport failures as a status-0 response.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse execute(const HttpRequest& request, const TransferObserver& observer) = 0;

    HttpResponse execute(const HttpRequest& request) { return execute(request, TransferObserver{}); }
};

}  // namespace reel
