#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>

#include <optional>

#include "reel/http_client.hpp"

namespace reel {

// HAR 1.2 shaped record of one HTTP call. headersSize/bodySize stay -1 ("not computed").
struct HarNameValue {
    QString name;
    QString value;

    bool operator==(const HarNameValue& other) const { return name == other.name && value == other.value; }
};

struct HarPostData {
    QString mimeType;
    QString text;
};

struct HarContent {
    qint64 size = 0;
    QString mimeType;
    QString text;
    QString comment;
};

struct HarRequest {
    QString method;
    QString url;
    QString httpVersion;
    QList<HarNameValue> headers;
    QList<HarNameValue> queryString;
    std::optional<HarPostData> postData;
    qint64 headersSize = -1;
    qint64 bodySize = -1;
};

struct HarResponse {
    int status = 0;
    QString statusText;
    QString httpVersion;
    QList<HarNameValue> headers;
    HarContent content;
    QString redirectURL;
    qint64 headersSize = -1;
    qint64 bodySize = -1;
};

struct TraceEntry {
    TransportKind kind = TransportKind::Fetch;
    quint64 correlationId = 0;
    qint64 startedMs = 0;
    qint64 time = 0;
    HarRequest request;
    HarResponse response;

    [[nodiscard]] bool transportFailed() const { return response.status == 0; }

    QJsonObject toJson() const;
    static TraceEntry fromJson(const QJsonObject& object);
};

class TraceEntryBuilder {
public:
    static constexpr int kDefaultMaxBodyBytes = 1024 * 1024;
    static const QString kNotAvailable;

    explicit TraceEntryBuilder(int maxBodyBytes = kDefaultMaxBodyBytes);

    TraceEntry build(
        const HttpRequest& request,
        const HttpResponse& response,
        qint64 startedMs,
        qint64 endedMs) const;

    // Splits the query of a URL into name/value pairs. Components that do not decode cleanly
    // are kept verbatim.
    static QList<HarNameValue> parseQueryString(const QString& url);
    static QString decodeComponent(const QString& raw);

    [[nodiscard]] int maxBodyBytes() const { return maxBodyBytes_; }

private:
    QString capBody(const QByteArray& body, QString* comment) const;

    int maxBodyBytes_;
};

}  // namespace reel
