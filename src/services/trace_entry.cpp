#include "reel/trace_entry.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QStringDecoder>

namespace reel {

const QString TraceEntryBuilder::kNotAvailable = QStringLiteral("NOT_AVAILABLE");

namespace {

QJsonArray toJsonArray(const QList<HarNameValue>& values) {
    QJsonArray out;
    for (const HarNameValue& value : values) {
        out.append(QJsonObject{{"name", value.name}, {"value", value.value}});
    }
    return out;
}

QList<HarNameValue> fromJsonArray(const QJsonArray& values) {
    QList<HarNameValue> out;
    for (const QJsonValue& value : values) {
        const QJsonObject obj = value.toObject();
        out.append({obj.value("name").toString(), obj.value("value").toString()});
    }
    return out;
}

QList<HarNameValue> toHarHeaders(const HeaderList& headers) {
    QList<HarNameValue> out;
    out.reserve(headers.size());
    for (const auto& header : headers) {
        out.append({header.first, header.second});
    }
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

TraceEntryBuilder::TraceEntryBuilder(int maxBodyBytes)
    : maxBodyBytes_(maxBodyBytes > 0 ? maxBodyBytes : kDefaultMaxBodyBytes) {}

QString TraceEntryBuilder::decodeComponent(const QString& raw) {
    QByteArray bytes;
    bytes.reserve(raw.size());
    const QByteArray utf8 = raw.toUtf8();
    for (int i = 0; i < utf8.size(); ++i) {
        const char c = utf8.at(i);
        if (c != '%') {
            bytes.append(c);
            continue;
        }
        if (i + 2 >= utf8.size()) {
            return raw;
        }
        const int hi = hexValue(utf8.at(i + 1));
        const int lo = hexValue(utf8.at(i + 2));
        if (hi < 0 || lo < 0) {
            return raw;
        }
        bytes.append(static_cast<char>((hi << 4) | lo));
        i += 2;
    }

    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    const QString decoded = decoder.decode(bytes);
    if (decoder.hasError()) {
        return raw;
    }
    return decoded;
}

QList<HarNameValue> TraceEntryBuilder::parseQueryString(const QString& url) {
    const int queryStart = url.indexOf('?');
    if (queryStart < 0) {
        return {};
    }
    QString query = url.mid(queryStart + 1);
    const int fragment = query.indexOf('#');
    if (fragment >= 0) {
        query.truncate(fragment);
    }

    QList<HarNameValue> out;
    const QStringList pairs = query.split('&', Qt::SkipEmptyParts);
    for (const QString& pair : pairs) {
        const int eq = pair.indexOf('=');
        const QString name = eq < 0 ? pair : pair.left(eq);
        const QString value = eq < 0 ? QString() : pair.mid(eq + 1);
        out.append({decodeComponent(name), decodeComponent(value)});
    }
    return out;
}

QString TraceEntryBuilder::capBody(const QByteArray& body, QString* comment) const {
    if (body.size() <= maxBodyBytes_) {
        return QString::fromUtf8(body);
    }
    // Never split a UTF-8 sequence: back off over continuation bytes to the lead byte.
    qsizetype cut = maxBodyBytes_;
    while (cut > 0 && (static_cast<unsigned char>(body.at(cut)) & 0xC0) == 0x80) {
        --cut;
    }
    if (comment) {
        *comment = QString("truncated to %1 of %2 bytes").arg(cut).arg(body.size());
    }
    return QString::fromUtf8(body.left(cut));
}

TraceEntry TraceEntryBuilder::build(
    const HttpRequest& request,
    const HttpResponse& response,
    qint64 startedMs,
    qint64 endedMs) const {
    TraceEntry entry;
    entry.kind = request.kind;
    entry.correlationId = request.correlationId;
    entry.startedMs = startedMs;
    entry.time = qMax<qint64>(0, endedMs - startedMs);

    entry.request.method = request.method.toUpper();
    entry.request.url = request.url;
    entry.request.httpVersion = kNotAvailable;
    entry.request.headers = toHarHeaders(request.headers);
    entry.request.queryString = parseQueryString(request.url);
    if (!request.body.isEmpty()) {
        HarPostData postData;
        postData.mimeType = headerValue(request.headers, "Content-Type");
        if (postData.mimeType.isEmpty()) {
            postData.mimeType = "text/plain";
        }
        postData.text = capBody(request.body, nullptr);
        entry.request.postData = postData;
    }

    entry.response.httpVersion = kNotAvailable;
    if (response.transportFailed()) {
        entry.response.status = 0;
        entry.response.statusText = response.errorString.isEmpty() ? response.statusText : response.errorString;
        if (entry.response.statusText.isEmpty()) {
            entry.response.statusText = "Network Error";
        }
        return entry;
    }

    entry.response.status = response.status;
    entry.response.statusText = response.statusText;
    entry.response.headers = toHarHeaders(response.headers);
    entry.response.content.mimeType = response.header("Content-Type");
    bool sizeOk = false;
    const qint64 declared = response.header("Content-Length").toLongLong(&sizeOk);
    entry.response.content.size = sizeOk ? declared : response.body.size();
    entry.response.content.text = capBody(response.body, &entry.response.content.comment);
    return entry;
}

QJsonObject TraceEntry::toJson() const {
    QJsonObject req{
        {"method", request.method},
        {"url", request.url},
        {"httpVersion", request.httpVersion},
        {"cookies", QJsonArray{}},
        {"headers", toJsonArray(request.headers)},
        {"queryString", toJsonArray(request.queryString)},
        {"headersSize", static_cast<double>(request.headersSize)},
        {"bodySize", static_cast<double>(request.bodySize)},
    };
    if (request.postData) {
        req.insert("postData", QJsonObject{
            {"mimeType", request.postData->mimeType},
            {"params", QJsonArray{}},
            {"text", request.postData->text},
        });
    }

    QJsonObject content{
        {"size", static_cast<double>(response.content.size)},
        {"mimeType", response.content.mimeType},
        {"text", response.content.text},
    };
    if (!response.content.comment.isEmpty()) {
        content.insert("comment", response.content.comment);
    }

    const QJsonObject res{
        {"status", response.status},
        {"statusText", response.statusText},
        {"httpVersion", response.httpVersion},
        {"cookies", QJsonArray{}},
        {"headers", toJsonArray(response.headers)},
        {"content", content},
        {"redirectURL", response.redirectURL},
        {"headersSize", static_cast<double>(response.headersSize)},
        {"bodySize", static_cast<double>(response.bodySize)},
    };

    return {
        {"_type", transportKindName(kind)},
        {"_correlationId", QString::number(correlationId)},
        {"startedDateTime", QDateTime::fromMSecsSinceEpoch(startedMs).toUTC().toString(Qt::ISODateWithMs)},
        {"time", static_cast<double>(time)},
        {"request", req},
        {"response", res},
        {"cache", QJsonObject{}},
        {"timings", QJsonObject{{"send", 0}, {"wait", 0}, {"receive", 0}}},
    };
}

TraceEntry TraceEntry::fromJson(const QJsonObject& object) {
    TraceEntry entry;
    entry.kind = object.value("_type").toString() == "xhr" ? TransportKind::Request : TransportKind::Fetch;
    entry.correlationId = object.value("_correlationId").toString().toULongLong();
    entry.startedMs = QDateTime::fromString(object.value("startedDateTime").toString(), Qt::ISODateWithMs)
                          .toMSecsSinceEpoch();
    entry.time = object.value("time").toInteger(0);

    const QJsonObject req = object.value("request").toObject();
    entry.request.method = req.value("method").toString();
    entry.request.url = req.value("url").toString();
    entry.request.httpVersion = req.value("httpVersion").toString();
    entry.request.headers = fromJsonArray(req.value("headers").toArray());
    entry.request.queryString = fromJsonArray(req.value("queryString").toArray());
    entry.request.headersSize = req.value("headersSize").toInteger(-1);
    entry.request.bodySize = req.value("bodySize").toInteger(-1);
    if (req.contains("postData")) {
        const QJsonObject post = req.value("postData").toObject();
        entry.request.postData = HarPostData{post.value("mimeType").toString(), post.value("text").toString()};
    }

    const QJsonObject res = object.value("response").toObject();
    entry.response.status = res.value("status").toInt(0);
    entry.response.statusText = res.value("statusText").toString();
    entry.response.httpVersion = res.value("httpVersion").toString();
    entry.response.headers = fromJsonArray(res.value("headers").toArray());
    const QJsonObject content = res.value("content").toObject();
    entry.response.content.size = content.value("size").toInteger(0);
    entry.response.content.mimeType = content.value("mimeType").toString();
    entry.response.content.text = content.value("text").toString();
    entry.response.content.comment = content.value("comment").toString();
    entry.response.redirectURL = res.value("redirectURL").toString();
    entry.response.headersSize = res.value("headersSize").toInteger(-1);
    entry.response.bodySize = res.value("bodySize").toInteger(-1);
    return entry;
}

}  // namespace reel
