#include "reel/archive_importer.hpp"

#include <QDateTime>
#include <QFile>
#include <QJsonDocument>

#include <optional>

#include "reel/logging.hpp"
#include "reel/packager.hpp"
#include "reel/render_event.hpp"
#include "reel/zip_archive.hpp"

namespace reel {

namespace {

ImportResult invalid(const QString& message) {
    ImportResult result;
    result.failure = FailureKind::InvalidArchive;
    result.error = message;
    return result;
}

ImportedSession sessionFrom(qint64 sessionId, const QJsonObject& body) {
    ImportedSession session;
    session.sessionId = sessionId;
    session.events = body.value("eventData").toArray();
    session.entries = body.value("responseData").toArray();
    session.hasFullSnapshot = ArchiveImporter::hasFullSnapshot(session.events);
    return session;
}

}  // namespace

int ImportResult::eventCount() const {
    int total = 0;
    for (const ImportedSession& session : sessions) {
        total += session.events.size();
    }
    return total;
}

int ImportResult::entryCount() const {
    int total = 0;
    for (const ImportedSession& session : sessions) {
        total += session.entries.size();
    }
    return total;
}

QJsonObject ImportResult::toJson() const {
    QJsonObject out{{"success", success()}};
    if (!success()) {
        out.insert("error", error);
        out.insert("failure", failureKindName(failure));
        return out;
    }
    QJsonArray rows;
    for (const ImportedSession& session : sessions) {
        rows.append(QJsonObject{
            {"session_id", QString::number(session.sessionId)},
            {"event_count", session.events.size()},
            {"entry_count", session.entries.size()},
            {"has_full_snapshot", session.hasFullSnapshot},
        });
    }
    out.insert("sessions", rows);
    out.insert("archive_version", archiveVersion);
    out.insert("legacy", legacy);
    out.insert("event_count", eventCount());
    out.insert("entry_count", entryCount());
    return out;
}

bool ArchiveImporter::isLegacyDocument(const QJsonObject& document) {
    return document.value("eventData").isArray();
}

bool ArchiveImporter::hasFullSnapshot(const QJsonArray& events) {
    for (const QJsonValue& value : events) {
        if (RenderEvent(value.toObject()).isFullSnapshot()) {
            return true;
        }
    }
    return false;
}

ImportResult ArchiveImporter::readFile(const QString& path) const {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        ImportResult result;
        result.failure = FailureKind::Io;
        result.error = QString("Unable to open %1: %2").arg(path, file.errorString());
        return result;
    }
    const QByteArray bytes = file.readAll();
    if (bytes.startsWith("PK\x03\x04") || bytes.startsWith("PK\x05\x06")) {
        return readArchive(bytes);
    }
    return readDocument(bytes);
}

ImportResult ArchiveImporter::readArchive(const QByteArray& archive) const {
    ZipReader reader;
    if (!reader.load(archive)) {
        return invalid(QString("Invalid zip file: %1").arg(reader.errorString()));
    }
    const std::optional<QByteArray> data = reader.file(Packager::kDataFileName);
    if (!data) {
        return invalid("Invalid zip file: data.json not found");
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(*data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return invalid(QString("data.json is not a JSON object: %1").arg(parseError.errorString()));
    }

    const std::optional<QByteArray> manifestBytes = reader.file(Packager::kManifestFileName);
    if (!manifestBytes) {
        return normalize(doc.object(), nullptr);
    }
    const QJsonDocument manifestDoc = QJsonDocument::fromJson(*manifestBytes, &parseError);
    if (parseError.error != QJsonParseError::NoError || !manifestDoc.isObject()) {
        return invalid("manifest.json is not a JSON object");
    }
    const QJsonObject manifest = manifestDoc.object();
    return normalize(doc.object(), &manifest);
}

ImportResult ArchiveImporter::readDocument(const QByteArray& json) const {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return invalid(QString("Document is not a JSON object: %1").arg(parseError.errorString()));
    }
    return normalize(doc.object(), nullptr);
}

ImportResult ArchiveImporter::normalize(const QJsonObject& document, const QJsonObject* manifest) const {
    ImportResult result;

    if (manifest) {
        if (manifest->value("format").toString() != Packager::kArchiveFormat) {
            return invalid(QString("Unknown archive format '%1'").arg(manifest->value("format").toString()));
        }
        result.archiveVersion = manifest->value("version").toInt();
        if (result.archiveVersion < 1 || result.archiveVersion > Packager::kArchiveVersion) {
            return invalid(QString("Unsupported archive version %1").arg(result.archiveVersion));
        }
        for (const QJsonValue& idValue : manifest->value("sessions").toArray()) {
            const QString key = idValue.toString();
            bool ok = false;
            const qint64 id = key.toLongLong(&ok);
            if (!ok || !document.value(key).isObject()) {
                return invalid(QString("Manifest lists session '%1' that data.json does not contain").arg(key));
            }
            result.sessions.append(sessionFrom(id, document.value(key).toObject()));
        }
    } else if (isLegacyDocument(document)) {
        const qint64 id = QDateTime::currentMSecsSinceEpoch();
        result.legacy = true;
        result.archiveVersion = 1;
        result.sessions.append(sessionFrom(id, document));
        qCInfo(lcStore) << "legacy flat document normalized to session" << id;
    } else {
        result.archiveVersion = 1;
        for (auto it = document.begin(); it != document.end(); ++it) {
            bool ok = false;
            const qint64 id = it.key().toLongLong(&ok);
            if (!ok || !it.value().isObject()) {
                return invalid(QString("Unexpected top-level key '%1'").arg(it.key()));
            }
            result.sessions.append(sessionFrom(id, it.value().toObject()));
        }
    }

    if (result.sessions.isEmpty()) {
        return invalid("No session data found in the file");
    }
    for (const ImportedSession& session : result.sessions) {
        if (!session.hasFullSnapshot && !session.events.isEmpty()) {
            qCWarning(lcStore) << "session" << session.sessionId << "has no full snapshot event; replay may be incomplete";
        }
    }
    return result;
}

}  // namespace reel
