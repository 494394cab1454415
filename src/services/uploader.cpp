#include "reel/uploader.hpp"

#include <QElapsedTimer>
#include <QJsonDocument>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"

namespace reel {

namespace {

QString stringField(const QJsonObject& object, const QString& key) {
    const QJsonValue value = object.value(key);
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return value.toString();
}

UploadResult failed(FailureKind kind, const QString& message, int status = 0) {
    UploadResult result;
    result.failure = kind;
    result.error = message;
    result.status = status;
    return result;
}

}  // namespace

QJsonObject UploadAck::toJson() const {
    QJsonObject out{{"success", success}};
    if (!sessionId.isEmpty()) {
        out.insert("session", QJsonObject{
            {"id", sessionId},
            {"created_at", createdAt},
            {"jira_id", jiraId},
            {"platform", platform},
            {"device_id", deviceId},
        });
    }
    if (!error.isEmpty()) {
        out.insert("error", error);
    }
    return out;
}

QJsonObject UploadResult::toJson() const {
    QJsonObject out{{"success", success()}};
    if (status != 0) {
        out.insert("status", status);
    }
    if (!success()) {
        out.insert("error", error);
        out.insert("failure", failureKindName(failure));
        return out;
    }
    out.insert("archive_bytes", static_cast<double>(archiveBytes));
    out.insert("ack", ack.toJson());
    return out;
}

Uploader::Uploader(HttpClient& client) : client_(client) {}

bool Uploader::parseAck(const QByteArray& body, UploadAck* ack) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }
    const QJsonObject root = doc.object();
    ack->raw = root;
    ack->success = root.value("success").toBool(false);
    ack->error = root.value("error").toString();
    const QJsonObject session = root.value("session").toObject();
    ack->sessionId = stringField(session, "id");
    ack->createdAt = session.value("created_at").toString();
    ack->jiraId = session.value("jira_id").toString();
    ack->platform = session.value("platform").toString();
    ack->deviceId = session.value("device_id").toString();
    return true;
}

UploadResult Uploader::upload(
    const QByteArray& archive,
    const QString& fileName,
    const UploadOptions& options,
    const ProgressFn& progress,
    ProgressBudget budget,
    const CancellationToken& cancel) const {
    const double sizeMb = static_cast<double>(archive.size()) / (1024.0 * 1024.0);
    if (archive.size() > kMaxArchiveBytes) {
        Telemetry::instance().incrementCounter("upload.failures");
        Telemetry::instance().recordEvent("upload_size_limit", {{"bytes", static_cast<double>(archive.size())}});
        return failed(FailureKind::SizeLimit,
            QString("File size exceeds maximum allowed size of 20MB (got %1MB)").arg(sizeMb, 0, 'f', 2));
    }
    if (options.endpoint.isEmpty()) {
        return failed(FailureKind::Config, "No upload endpoint configured");
    }
    if (cancel.isCancelled()) {
        return failed(FailureKind::Cancelled, "Upload aborted");
    }

    HttpRequest request;
    request.kind = TransportKind::Request;
    request.method = "POST";
    request.url = options.endpoint;
    request.headers = options.headers;
    request.timeoutMs = options.timeoutMs > 0 ? options.timeoutMs : kDefaultTimeoutMs;
    request.formParts.append({"file", archive, fileName, "application/zip"});
    if (!options.platform.isEmpty()) {
        request.formParts.append({"platform", options.platform.toUtf8(), {}, {}});
    }
    if (!options.deviceId.isEmpty()) {
        request.formParts.append({"device_id", options.deviceId.toUtf8(), {}, {}});
    }
    if (!options.jiraId.isEmpty()) {
        request.formParts.append({"jira_id", options.jiraId.toUtf8(), {}, {}});
    }

    // Bounds the whole transfer, not just idle periods.
    const CancellationToken transfer = cancel.withDeadline(request.timeoutMs);
    TransferObserver observer;
    observer.cancel = transfer;
    double lastReported = budget.start;
    observer.onUploadProgress = [&](qint64 sent, qint64 total) {
        if (!progress || total <= 0) {
            return;
        }
        const double value = budget.scale(sent, total);
        if (value >= lastReported) {
            lastReported = value;
            progress(value);
        }
    };

    qCInfo(lcTransfer) << "uploading" << fileName << QString::number(sizeMb, 'f', 2) << "MB to" << options.endpoint;
    QElapsedTimer timer;
    timer.start();
    Telemetry::instance().incrementCounter("upload.count");
    const HttpResponse response = client_.execute(request, observer);
    Telemetry::instance().recordDurationMs("upload.duration_ms", timer.elapsed());

    if (response.transportFailed()) {
        Telemetry::instance().incrementCounter("upload.failures");
        if (transfer.isCancelled()) {
            qCWarning(lcTransfer) << "upload stopped:" << response.errorString;
            return failed(FailureKind::Cancelled,
                transfer.deadlineExpired() ? "Upload timeout" : "Upload aborted");
        }
        qCWarning(lcTransfer) << "network error during upload:" << response.errorString;
        return failed(FailureKind::Transport, QString("Network error during upload: %1").arg(response.errorString));
    }

    UploadAck ack;
    const bool parsed = parseAck(response.body, &ack);
    if (!response.ok()) {
        Telemetry::instance().incrementCounter("upload.failures");
        const QString message = parsed && !ack.error.isEmpty()
            ? ack.error
            : QString("Upload failed with status %1: %2").arg(response.status).arg(response.statusText);
        qCWarning(lcTransfer) << message;
        return failed(FailureKind::HttpStatus, message, response.status);
    }
    if (!parsed) {
        ack.success = true;
    } else if (!ack.success) {
        Telemetry::instance().incrementCounter("upload.failures");
        return failed(FailureKind::HttpStatus,
            ack.error.isEmpty() ? QString("Sink rejected the upload") : ack.error,
            response.status);
    }

    if (progress && lastReported < budget.end()) {
        progress(budget.end());
    }

    UploadResult result;
    result.status = response.status;
    result.archiveBytes = archive.size();
    result.ack = ack;
    qCInfo(lcTransfer) << "upload completed, sink session id" << ack.sessionId;
    return result;
}

UploadResult Uploader::packageAndUpload(
    const Packager& packager,
    const QList<SessionData>& sessions,
    const UploadOptions& options,
    const ProgressFn& progress,
    const CancellationToken& cancel) const {
    const PackageResult packaged = packager.package(sessions, progress, ProgressBudget::compressPhase(), cancel);
    if (!packaged.success()) {
        return failed(packaged.failure, packaged.error);
    }
    return upload(packaged.archive, packaged.fileName, options, progress, ProgressBudget::uploadPhase(), cancel);
}

}  // namespace reel
