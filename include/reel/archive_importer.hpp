#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "reel/result.hpp"

namespace reel {

struct ImportedSession {
    qint64 sessionId = 0;
    QJsonArray events;
    QJsonArray entries;
    bool hasFullSnapshot = false;
};

struct ImportResult {
    FailureKind failure = FailureKind::None;
    QString error;
    QList<ImportedSession> sessions;
    int archiveVersion = 0;
    bool legacy = false;

    [[nodiscard]] bool success() const { return failure == FailureKind::None; }
    [[nodiscard]] int eventCount() const;
    [[nodiscard]] int entryCount() const;
    QJsonObject toJson() const;
};

// Reads archives and bare JSON documents back into per-session arrays. Manifest-carrying
// archives are trusted as-is; documents without a manifest fall back to shape detection.
class ArchiveImporter {
public:
    ImportResult readFile(const QString& path) const;
    ImportResult readArchive(const QByteArray& archive) const;
    ImportResult readDocument(const QByteArray& json) const;

    // Flat {eventData:[...], responseData:[...]} documents written before session keying.
    static bool isLegacyDocument(const QJsonObject& document);
    static bool hasFullSnapshot(const QJsonArray& events);

private:
    ImportResult normalize(const QJsonObject& document, const QJsonObject* manifest) const;
};

}  // namespace reel
