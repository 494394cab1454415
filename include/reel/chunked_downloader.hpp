#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include <functional>
#include <optional>

#include "reel/cancellation.hpp"
#include "reel/http_client.hpp"
#include "reel/result.hpp"

namespace reel {

enum class ChunkStatus {
    Pending,
    Downloading,
    Completed,
    Error,
};

QString chunkStatusName(ChunkStatus status);

// Inclusive byte range [start, end] of the remote resource.
struct ChunkTask {
    int index = 0;
    qint64 start = 0;
    qint64 end = -1;
    ChunkStatus status = ChunkStatus::Pending;
    qint64 loaded = 0;
    int attempts = 0;

    [[nodiscard]] qint64 length() const { return end - start + 1; }
    [[nodiscard]] QString rangeHeader() const { return QString("bytes=%1-%2").arg(start).arg(end); }
};

// Recomputed from the chunk table on every report, never stored.
struct DownloadProgress {
    qint64 loaded = 0;
    qint64 total = 0;
    double percentage = 0.0;
    double speed = 0.0;
    double remainingSeconds = 0.0;
    QList<ChunkTask> chunks;

    QJsonObject toJson() const;
};

using DownloadProgressFn = std::function<void(const DownloadProgress&)>;

struct DownloadOptions {
    static constexpr qint64 kDefaultChunkSize = 1024 * 1024;
    static constexpr int kDefaultMaxConcurrent = 6;
    static constexpr int kDefaultMaxRetries = 3;
    static constexpr int kDefaultRetryBaseDelayMs = 1000;

    // Negative means unknown; a HEAD probe supplies it.
    qint64 size = -1;
    qint64 chunkSize = kDefaultChunkSize;
    int maxConcurrent = kDefaultMaxConcurrent;
    // Retries after the first attempt of a range.
    int maxRetries = kDefaultMaxRetries;
    int retryBaseDelayMs = kDefaultRetryBaseDelayMs;
    // Resources smaller than this are fetched with one plain GET.
    qint64 directThreshold = kDefaultChunkSize;
    int requestTimeoutMs = 0;
    HeaderList headers;
    CancellationToken cancel;
};

struct DownloadResult {
    FailureKind failure = FailureKind::None;
    QString error;
    QByteArray data;
    qint64 size = 0;
    bool chunked = false;
    int chunkCount = 0;
    int retries = 0;
    qint64 elapsedMs = 0;

    [[nodiscard]] bool success() const { return failure == FailureKind::None; }
    QJsonObject toJson() const;
};

class ChunkedDownloader {
public:
    explicit ChunkedDownloader(HttpClient& client);

    DownloadResult download(
        const QString& url,
        const DownloadOptions& options = {},
        const DownloadProgressFn& progress = {}) const;

    std::optional<qint64> probeSize(const QString& url, const DownloadOptions& options, QString* error) const;

    static QList<ChunkTask> planChunks(qint64 size, qint64 chunkSize);
    // Delay before retry number attempt + 1: base * 2^attempt.
    static qint64 retryDelayMs(int attempt, int baseDelayMs);

private:
    DownloadResult downloadDirect(
        const QString& url,
        qint64 size,
        const DownloadOptions& options,
        const DownloadProgressFn& progress) const;
    DownloadResult downloadChunked(
        const QString& url,
        qint64 size,
        const DownloadOptions& options,
        const DownloadProgressFn& progress) const;

    HttpClient& client_;
};

}  // namespace reel
