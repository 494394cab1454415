#include "reel/packager.hpp"

#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

#include <algorithm>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"
#include "reel/zip_archive.hpp"

namespace reel {

const QString Packager::kDataFileName = QStringLiteral("data.json");
const QString Packager::kManifestFileName = QStringLiteral("manifest.json");
const QString Packager::kArchiveFormat = QStringLiteral("reel-archive");

namespace {

PackageResult failed(FailureKind kind, const QString& message) {
    PackageResult result;
    result.failure = kind;
    result.error = message;
    return result;
}

}  // namespace

QString exportFormatName(ExportFormat format) {
    return format == ExportFormat::Json ? QStringLiteral("json") : QStringLiteral("zip");
}

std::optional<ExportFormat> exportFormatFromName(const QString& name) {
    const QString lowered = name.trimmed().toLower();
    if (lowered == "zip") {
        return ExportFormat::Zip;
    }
    if (lowered == "json") {
        return ExportFormat::Json;
    }
    return std::nullopt;
}

QJsonObject PackageResult::toJson() const {
    QJsonObject out{{"success", success()}};
    if (!success()) {
        out.insert("error", error);
        out.insert("failure", failureKindName(failure));
        return out;
    }
    QJsonArray ids;
    for (qint64 id : sessionIds) {
        ids.append(QString::number(id));
    }
    out.insert("file_name", fileName);
    out.insert("format", exportFormatName(format));
    out.insert("session_ids", ids);
    out.insert("event_count", eventCount);
    out.insert("entry_count", entryCount);
    out.insert("truncated_events", truncatedEvents);
    out.insert("document_bytes", static_cast<double>(documentBytes));
    out.insert("archive_bytes", static_cast<double>(archive.size()));
    return out;
}

Packager::Packager(int maxEvents)
    : maxEvents_(maxEvents > 0 ? maxEvents : kDefaultMaxEvents) {}

QString Packager::archiveFileName(qint64 epochMs, ExportFormat format) {
    return QString("record-%1.%2").arg(epochMs).arg(exportFormatName(format));
}

PackageResult Packager::summarize(const QList<SessionData>& sessions) const {
    PackageResult result;
    for (const SessionData& session : sessions) {
        result.sessionIds.append(session.sessionId);
        result.eventCount += std::min(static_cast<int>(session.events.size()), maxEvents_);
        result.entryCount += session.entries.size();
    }
    return result;
}

void Packager::reportTruncation(int truncated) const {
    if (truncated <= 0) {
        return;
    }
    Telemetry::instance().incrementCounter("package.truncated_events", truncated);
    Telemetry::instance().recordEvent("package_truncated", {
        {"truncated_events", truncated},
        {"max_events", maxEvents_},
    });
}

std::optional<QJsonObject> Packager::buildDocument(
    const QList<SessionData>& sessions,
    int* truncatedEvents,
    QString* error) const {
    QJsonObject document;
    int truncated = 0;

    for (const SessionData& session : sessions) {
        const QString key = QString::number(session.sessionId);
        if (document.contains(key)) {
            *error = QString("Session %1 appears more than once").arg(key);
            return std::nullopt;
        }

        QJsonArray events;
        const int skip = std::max(0, static_cast<int>(session.events.size()) - maxEvents_);
        if (skip > 0) {
            truncated += skip;
            qCWarning(lcStore) << "session" << session.sessionId << "has" << session.events.size()
                               << "events, packaging the last" << maxEvents_;
        }
        for (int i = skip; i < session.events.size(); ++i) {
            if (!session.events.at(i).isObject()) {
                *error = QString("Event %1 of session %2 is not a JSON object").arg(i).arg(key);
                return std::nullopt;
            }
            events.append(session.events.at(i));
        }
        for (int i = 0; i < session.entries.size(); ++i) {
            if (!session.entries.at(i).isObject()) {
                *error = QString("Trace entry %1 of session %2 is not a JSON object").arg(i).arg(key);
                return std::nullopt;
            }
        }

        document.insert(key, QJsonObject{
            {"eventData", events},
            {"responseData", session.entries},
        });
    }

    if (truncatedEvents) {
        *truncatedEvents = truncated;
    }
    return document;
}

PackageResult Packager::package(
    const QList<SessionData>& sessions,
    const ProgressFn& progress,
    ProgressBudget budget,
    const CancellationToken& cancel) const {
    QElapsedTimer timer;
    timer.start();

    if (progress) {
        progress(budget.start);
    }

    int truncated = 0;
    QString error;
    const std::optional<QJsonObject> document = buildDocument(sessions, &truncated, &error);
    if (!document) {
        qCWarning(lcStore) << "packaging failed:" << error;
        Telemetry::instance().incrementCounter("package.failures");
        return failed(FailureKind::Serialization, error);
    }

    const QByteArray data = QJsonDocument(*document).toJson(QJsonDocument::Compact);
    if (data.size() > kMaxDocumentBytes) {
        Telemetry::instance().incrementCounter("package.failures");
        return failed(FailureKind::Serialization,
            QString("Serialized session document is %1 bytes, above the %2 byte limit")
                .arg(data.size())
                .arg(kMaxDocumentBytes));
    }

    PackageResult result = summarize(sessions);
    QJsonArray ids;
    for (qint64 id : result.sessionIds) {
        ids.append(QString::number(id));
    }
    const QJsonObject manifest{
        {"format", kArchiveFormat},
        {"version", kArchiveVersion},
        {"sessions", ids},
    };

    if (cancel.isCancelled()) {
        return failed(FailureKind::Cancelled, "Packaging cancelled");
    }

    ZipWriter writer;
    writer.addFile(kDataFileName, data);
    writer.addFile(kManifestFileName, QJsonDocument(manifest).toJson(QJsonDocument::Compact));

    QByteArray archive;
    if (!writer.finish(&archive, &error, [&](qint64 processed, qint64 total) {
            if (progress) {
                progress(budget.scale(processed, total));
            }
        })) {
        Telemetry::instance().incrementCounter("package.failures");
        return failed(FailureKind::Io, QString("Compression failed: %1").arg(error));
    }

    if (cancel.isCancelled()) {
        return failed(FailureKind::Cancelled, "Packaging cancelled");
    }

    reportTruncation(truncated);

    result.archive = archive;
    result.fileName = archiveFileName(QDateTime::currentMSecsSinceEpoch());
    result.truncatedEvents = truncated;
    result.documentBytes = data.size();

    Telemetry::instance().recordDurationMs("package.duration_ms", timer.elapsed());
    Telemetry::instance().setGauge("package.last_archive_bytes", static_cast<double>(archive.size()));
    qCInfo(lcStore) << "packaged" << result.eventCount << "events and" << result.entryCount
                    << "entries into" << archive.size() << "bytes";

    if (progress) {
        progress(budget.end());
    }
    return result;
}

PackageResult Packager::packageJson(const QList<SessionData>& sessions) const {
    int truncated = 0;
    QString error;
    const std::optional<QJsonObject> document = buildDocument(sessions, &truncated, &error);
    if (!document) {
        qCWarning(lcStore) << "packaging failed:" << error;
        Telemetry::instance().incrementCounter("package.failures");
        return failed(FailureKind::Serialization, error);
    }
    reportTruncation(truncated);

    PackageResult result = summarize(sessions);
    result.format = ExportFormat::Json;
    result.archive = QJsonDocument(*document).toJson(QJsonDocument::Indented);
    result.fileName = archiveFileName(QDateTime::currentMSecsSinceEpoch(), ExportFormat::Json);
    result.truncatedEvents = truncated;
    result.documentBytes = result.archive.size();
    qCInfo(lcStore) << "packaged" << result.eventCount << "events and" << result.entryCount
                    << "entries as a" << result.documentBytes << "byte JSON document";
    return result;
}

OperationResult Packager::writeToFile(const PackageResult& result, const QString& path) {
    if (!result.success()) {
        return OperationResult::fail(result.failure, result.error);
    }
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return OperationResult::fail(FailureKind::Io,
            QString("Unable to create directory %1").arg(info.absolutePath()));
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return OperationResult::fail(FailureKind::Io, file.errorString());
    }
    if (file.write(result.archive) != result.archive.size()) {
        const QString message = file.errorString();
        file.cancelWriting();
        return OperationResult::fail(FailureKind::Io, message);
    }
    if (!file.commit()) {
        return OperationResult::fail(FailureKind::Io, file.errorString());
    }

    QJsonObject details = result.toJson();
    details.remove("success");
    details.insert("path", info.absoluteFilePath());
    return OperationResult::ok(details);
}

}  // namespace reel
