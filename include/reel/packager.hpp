#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include <optional>

#include "reel/cancellation.hpp"
#include "reel/progress.hpp"
#include "reel/result.hpp"

namespace reel {

// Read snapshot of one session handed to the packager.
struct SessionData {
    qint64 sessionId = 0;
    QJsonArray events;
    QJsonArray entries;
};

// Zip is the compressed archive with data.json and manifest.json. Json is the bare keyed document,
// pretty-printed and uncompressed.
enum class ExportFormat {
    Zip,
    Json,
};

QString exportFormatName(ExportFormat format);
std::optional<ExportFormat> exportFormatFromName(const QString& name);

struct PackageResult {
    FailureKind failure = FailureKind::None;
    QString error;
    ExportFormat format = ExportFormat::Zip;
    // Bytes written on export: the zip archive, or the JSON document for ExportFormat::Json.
    QByteArray archive;
    QString fileName;
    QList<qint64> sessionIds;
    int eventCount = 0;
    int entryCount = 0;
    int truncatedEvents = 0;
    qint64 documentBytes = 0;

    [[nodiscard]] bool success() const { return failure == FailureKind::None; }
    QJsonObject toJson() const;
};

class Packager {
public:
    static constexpr int kDefaultMaxEvents = 5000;
    static constexpr qint64 kMaxDocumentBytes = 256LL * 1024 * 1024;
    static constexpr int kArchiveVersion = 2;
    static const QString kDataFileName;
    static const QString kManifestFileName;
    static const QString kArchiveFormat;

    explicit Packager(int maxEvents = kDefaultMaxEvents);

    // Builds the {"<id>": {eventData, responseData}} document. Returns nullopt and sets error when
    // a row is not a JSON object or an id repeats.
    std::optional<QJsonObject> buildDocument(
        const QList<SessionData>& sessions,
        int* truncatedEvents,
        QString* error) const;

    PackageResult package(
        const QList<SessionData>& sessions,
        const ProgressFn& progress = {},
        ProgressBudget budget = ProgressBudget::compressPhase(),
        const CancellationToken& cancel = {}) const;

    // Same document as data.json, indented and without compression or manifest.
    PackageResult packageJson(const QList<SessionData>& sessions) const;

    static QString archiveFileName(qint64 epochMs, ExportFormat format = ExportFormat::Zip);
    static OperationResult writeToFile(const PackageResult& result, const QString& path);

    [[nodiscard]] int maxEvents() const { return maxEvents_; }

private:
    PackageResult summarize(const QList<SessionData>& sessions) const;
    void reportTruncation(int truncated) const;

    int maxEvents_;
};

}  // namespace reel
