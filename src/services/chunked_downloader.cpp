#include "reel/chunked_downloader.hpp"

#include <QDeadlineTimer>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>
#include <QThreadPool>

#include <algorithm>
#include <cstring>
#include <mutex>
#include <optional>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"

namespace reel {

namespace {

constexpr qint64 kSleepSliceMs = 20;

QString formatBytes(qint64 bytes) {
    if (bytes <= 0) {
        return "0 B";
    }
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    return QString("%1 %2").arg(value, 0, 'f', 2).arg(QString::fromLatin1(units[unit]));
}

DownloadResult failed(FailureKind kind, const QString& message) {
    DownloadResult result;
    result.failure = kind;
    result.error = message;
    return result;
}

// Shared aggregates of one chunked download. Everything except the abort flag and the delivery
// bookkeeping is guarded by mutex. The progress callback never runs under mutex.
struct TransferState {
    struct Report {
        DownloadProgress progress;
        quint64 sequence = 0;
    };

    QMutex mutex;
    QList<ChunkTask> tasks;
    QList<QByteArray> buffers;
    qint64 total = 0;
    QElapsedTimer sinceFirstByte;
    qint64 lastReported = -1;
    quint64 reportSequence = 0;
    int retries = 0;
    bool warnedFullBody = false;
    FailureKind failure = FailureKind::None;
    QString error;
    QAtomicInteger<int> aborted{0};
    const DownloadProgressFn* progress = nullptr;

    // Serializes callback invocations; delivered is guarded by it.
    QMutex deliveryMutex;
    quint64 delivered = 0;

    std::optional<Report> takeReportLocked(bool force) {
        if (!progress || !*progress) {
            return std::nullopt;
        }
        Report report;
        DownloadProgress& snapshot = report.progress;
        snapshot.total = total;
        for (const ChunkTask& task : tasks) {
            snapshot.loaded += task.loaded;
        }
        if (!force && snapshot.loaded <= lastReported) {
            return std::nullopt;
        }
        lastReported = std::max(lastReported, snapshot.loaded);
        snapshot.percentage = total > 0 ? (static_cast<double>(snapshot.loaded) * 100.0) / static_cast<double>(total) : 100.0;
        const qint64 elapsedMs = sinceFirstByte.isValid() ? sinceFirstByte.elapsed() : 0;
        snapshot.speed = elapsedMs > 0 ? static_cast<double>(snapshot.loaded) * 1000.0 / static_cast<double>(elapsedMs) : 0.0;
        snapshot.remainingSeconds = snapshot.speed > 0.0
            ? static_cast<double>(total - snapshot.loaded) / snapshot.speed
            : 0.0;
        snapshot.chunks = tasks;
        report.sequence = ++reportSequence;
        return report;
    }

    // Reports older than the last delivered one are dropped so the caller never sees progress go
    // backwards. Intermediate reports are skipped while another callback is running; forced ones
    // (range completions) wait their turn.
    void deliver(const std::optional<Report>& report, bool force) {
        if (!report) {
            return;
        }
        std::unique_lock<QMutex> lock(deliveryMutex, std::defer_lock);
        if (force) {
            lock.lock();
        } else if (!lock.try_lock()) {
            return;
        }
        if (report->sequence <= delivered) {
            return;
        }
        delivered = report->sequence;
        (*progress)(report->progress);
    }

    void updateLoaded(int index, qint64 received) {
        std::optional<Report> report;
        {
            QMutexLocker lock(&mutex);
            if (received > 0 && !sinceFirstByte.isValid()) {
                sinceFirstByte.start();
            }
            ChunkTask& task = tasks[index];
            task.loaded = std::max(task.loaded, std::min(received, task.length()));
            report = takeReportLocked(false);
        }
        deliver(report, false);
    }
};

bool sleepInterruptibly(qint64 delayMs, const CancellationToken& cancel, const QAtomicInteger<int>& aborted) {
    QDeadlineTimer deadline(delayMs);
    while (!deadline.hasExpired()) {
        if (cancel.isCancelled() || aborted.loadAcquire() != 0) {
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(std::min(deadline.remainingTime(), kSleepSliceMs)));
    }
    return true;
}

}  // namespace

QString chunkStatusName(ChunkStatus status) {
    switch (status) {
    case ChunkStatus::Pending:
        return "pending";
    case ChunkStatus::Downloading:
        return "downloading";
    case ChunkStatus::Completed:
        return "completed";
    case ChunkStatus::Error:
        return "error";
    }
    return "unknown";
}

QJsonObject DownloadProgress::toJson() const {
    QJsonArray chunkRows;
    for (const ChunkTask& task : chunks) {
        chunkRows.append(QJsonObject{
            {"index", task.index},
            {"start", static_cast<double>(task.start)},
            {"end", static_cast<double>(task.end)},
            {"loaded", static_cast<double>(task.loaded)},
            {"status", chunkStatusName(task.status)},
        });
    }
    return {
        {"loaded", static_cast<double>(loaded)},
        {"total", static_cast<double>(total)},
        {"percentage", percentage},
        {"speed", speed},
        {"remaining_seconds", remainingSeconds},
        {"chunks", chunkRows},
    };
}

QJsonObject DownloadResult::toJson() const {
    QJsonObject out{{"success", success()}};
    if (!success()) {
        out.insert("error", error);
        out.insert("failure", failureKindName(failure));
        return out;
    }
    out.insert("size", static_cast<double>(size));
    out.insert("chunked", chunked);
    out.insert("chunk_count", chunkCount);
    out.insert("retries", retries);
    out.insert("elapsed_ms", static_cast<double>(elapsedMs));
    return out;
}

ChunkedDownloader::ChunkedDownloader(HttpClient& client) : client_(client) {}

QList<ChunkTask> ChunkedDownloader::planChunks(qint64 size, qint64 chunkSize) {
    QList<ChunkTask> tasks;
    if (size <= 0 || chunkSize <= 0) {
        return tasks;
    }
    for (qint64 start = 0; start < size; start += chunkSize) {
        ChunkTask task;
        task.index = tasks.size();
        task.start = start;
        task.end = std::min(start + chunkSize - 1, size - 1);
        tasks.append(task);
    }
    return tasks;
}

qint64 ChunkedDownloader::retryDelayMs(int attempt, int baseDelayMs) {
    return static_cast<qint64>(baseDelayMs) << std::clamp(attempt, 0, 20);
}

std::optional<qint64> ChunkedDownloader::probeSize(
    const QString& url,
    const DownloadOptions& options,
    QString* error) const {
    HttpRequest request;
    request.method = "HEAD";
    request.url = url;
    request.headers = options.headers;
    request.timeoutMs = options.requestTimeoutMs;

    TransferObserver observer;
    observer.cancel = options.cancel;
    const HttpResponse response = client_.execute(request, observer);
    if (response.transportFailed()) {
        *error = QString("Failed to get file size: %1").arg(response.errorString);
        return std::nullopt;
    }
    if (!response.ok()) {
        *error = QString("Failed to get file size: HTTP %1: %2").arg(response.status).arg(response.statusText);
        return std::nullopt;
    }
    bool ok = false;
    const qint64 size = response.header("Content-Length").trimmed().toLongLong(&ok);
    if (!ok || size < 0) {
        *error = "Failed to get file size: Unable to determine file size (no Content-Length header)";
        return std::nullopt;
    }
    return size;
}

DownloadResult ChunkedDownloader::download(
    const QString& url,
    const DownloadOptions& options,
    const DownloadProgressFn& progress) const {
    QElapsedTimer timer;
    timer.start();
    qCInfo(lcTransfer) << "starting download" << url;

    qint64 size = options.size;
    if (size < 0) {
        QString error;
        const std::optional<qint64> probed = probeSize(url, options, &error);
        if (!probed) {
            qCWarning(lcTransfer) << error;
            return failed(options.cancel.isCancelled() ? FailureKind::Cancelled : FailureKind::Transport, error);
        }
        size = *probed;
    }
    qCInfo(lcTransfer) << "file size" << formatBytes(size);

    DownloadResult result = size < options.directThreshold
        ? downloadDirect(url, size, options, progress)
        : downloadChunked(url, size, options, progress);

    result.elapsedMs = timer.elapsed();
    Telemetry::instance().recordDurationMs("download.duration_ms", result.elapsedMs);
    if (!result.success()) {
        Telemetry::instance().incrementCounter("download.failures");
        qCWarning(lcTransfer) << "download failed:" << result.error;
        return result;
    }
    Telemetry::instance().incrementCounter("download.count");
    qCInfo(lcTransfer) << "download complete" << formatBytes(result.size) << "in" << result.elapsedMs << "ms";
    return result;
}

DownloadResult ChunkedDownloader::downloadDirect(
    const QString& url,
    qint64 size,
    const DownloadOptions& options,
    const DownloadProgressFn& progress) const {
    qCInfo(lcTransfer) << "file below" << formatBytes(options.directThreshold) << "using direct download";

    TransferState state;
    state.total = size;
    state.progress = &progress;
    ChunkTask whole;
    whole.end = size - 1;
    whole.status = ChunkStatus::Downloading;
    state.tasks.append(whole);

    HttpRequest request;
    request.url = url;
    request.headers = options.headers;
    request.timeoutMs = options.requestTimeoutMs;

    TransferObserver observer;
    observer.cancel = options.cancel;
    observer.onDownloadProgress = [&state](qint64 received, qint64) {
        state.updateLoaded(0, received);
    };

    const HttpResponse response = client_.execute(request, observer);
    if (response.transportFailed()) {
        if (options.cancel.isCancelled()) {
            return failed(FailureKind::Cancelled, "Download cancelled");
        }
        return failed(FailureKind::Transport, QString("Direct download failed: %1").arg(response.errorString));
    }
    if (!response.ok()) {
        return failed(FailureKind::HttpStatus,
            QString("Direct download failed: HTTP %1: %2").arg(response.status).arg(response.statusText));
    }
    if (response.body.size() != size) {
        return failed(FailureKind::Transport,
            QString("Direct download returned %1 bytes, expected %2").arg(response.body.size()).arg(size));
    }

    std::optional<TransferState::Report> report;
    {
        QMutexLocker lock(&state.mutex);
        state.tasks[0].loaded = size;
        state.tasks[0].status = ChunkStatus::Completed;
        report = state.takeReportLocked(true);
    }
    state.deliver(report, true);

    DownloadResult result;
    result.data = response.body;
    result.size = size;
    result.chunkCount = 1;
    return result;
}

DownloadResult ChunkedDownloader::downloadChunked(
    const QString& url,
    qint64 size,
    const DownloadOptions& options,
    const DownloadProgressFn& progress) const {
    const qint64 chunkSize = options.chunkSize > 0 ? options.chunkSize : DownloadOptions::kDefaultChunkSize;
    const int maxConcurrent = std::max(1, options.maxConcurrent);
    const int maxRetries = std::max(0, options.maxRetries);

    TransferState state;
    state.total = size;
    state.progress = &progress;
    state.tasks = planChunks(size, chunkSize);
    for (int i = 0; i < state.tasks.size(); ++i) {
        state.buffers.append(QByteArray());
    }
    qCInfo(lcTransfer) << "split into" << state.tasks.size() << "chunks of ~" << formatBytes(chunkSize);

    const auto runRange = [&](int index) {
        const ChunkTask task = state.tasks.at(index);
        QString lastError;

        for (int attempt = 0; attempt <= maxRetries; ++attempt) {
            if (options.cancel.isCancelled() || state.aborted.loadAcquire() != 0) {
                return;
            }
            {
                QMutexLocker lock(&state.mutex);
                state.tasks[index].status = ChunkStatus::Downloading;
                state.tasks[index].attempts = attempt + 1;
            }

            HttpRequest request;
            request.url = url;
            request.headers = options.headers;
            request.headers.append({"Range", task.rangeHeader()});
            request.timeoutMs = options.requestTimeoutMs;

            TransferObserver observer;
            observer.cancel = options.cancel;
            observer.onDownloadProgress = [&state, index](qint64 received, qint64) {
                state.updateLoaded(index, received);
            };

            const HttpResponse response = client_.execute(request, observer);
            QByteArray slice;
            if (response.transportFailed()) {
                lastError = response.errorString.isEmpty() ? QString("Network error") : response.errorString;
            } else if (!response.ok()) {
                lastError = QString("HTTP %1: %2").arg(response.status).arg(response.statusText);
            } else if (response.status == 206) {
                if (response.body.size() == task.length()) {
                    slice = response.body;
                } else {
                    lastError = QString("Expected %1 bytes, got %2").arg(task.length()).arg(response.body.size());
                }
            } else {
                {
                    QMutexLocker lock(&state.mutex);
                    if (!state.warnedFullBody) {
                        state.warnedFullBody = true;
                        qCWarning(lcTransfer) << "expected 206 Partial Content, got" << response.status;
                        Telemetry::instance().recordEvent("download_no_partial_content", {{"status", response.status}});
                    }
                }
                if (response.body.size() == size) {
                    slice = response.body.mid(task.start, task.length());
                } else if (response.body.size() == task.length()) {
                    slice = response.body;
                } else {
                    lastError = QString("Unexpected %1 byte body for range %2").arg(response.body.size()).arg(task.rangeHeader());
                }
            }

            if (lastError.isEmpty()) {
                std::optional<TransferState::Report> report;
                {
                    QMutexLocker lock(&state.mutex);
                    if (!state.sinceFirstByte.isValid()) {
                        state.sinceFirstByte.start();
                    }
                    state.buffers[index] = slice;
                    state.tasks[index].loaded = task.length();
                    state.tasks[index].status = ChunkStatus::Completed;
                    report = state.takeReportLocked(true);
                }
                state.deliver(report, true);
                qCDebug(lcTransfer) << "chunk" << index + 1 << "/" << state.tasks.size() << "completed";
                return;
            }

            if (options.cancel.isCancelled()) {
                return;
            }
            if (attempt < maxRetries) {
                const qint64 delay = retryDelayMs(attempt, options.retryBaseDelayMs);
                {
                    QMutexLocker lock(&state.mutex);
                    ++state.retries;
                }
                Telemetry::instance().incrementCounter("download.retries");
                qCWarning(lcTransfer) << "retry" << attempt + 1 << "/" << maxRetries << "for bytes"
                                      << task.start << "-" << task.end << "after" << delay << "ms:" << lastError;
                if (!sleepInterruptibly(delay, options.cancel, state.aborted)) {
                    return;
                }
                lastError.clear();
            }
        }

        QMutexLocker lock(&state.mutex);
        state.tasks[index].status = ChunkStatus::Error;
        if (state.failure == FailureKind::None) {
            state.failure = FailureKind::Transport;
            state.error = QString("Chunk %1 failed: Failed to download chunk %2-%3 after %4 attempts: %5")
                              .arg(index)
                              .arg(task.start)
                              .arg(task.end)
                              .arg(maxRetries + 1)
                              .arg(lastError);
        }
        state.aborted.storeRelease(1);
        Telemetry::instance().incrementCounter("download.range_failures");
    };

    QThreadPool pool;
    pool.setMaxThreadCount(maxConcurrent);
    for (int i = 0; i < state.tasks.size(); ++i) {
        pool.start([&runRange, i]() { runRange(i); });
    }
    pool.waitForDone();

    if (state.failure != FailureKind::None) {
        return failed(state.failure, state.error);
    }
    if (options.cancel.isCancelled()) {
        return failed(FailureKind::Cancelled, "Download cancelled");
    }

    qCInfo(lcTransfer) << "merging chunks";
    QByteArray merged(static_cast<qsizetype>(size), Qt::Uninitialized);
    for (const ChunkTask& task : state.tasks) {
        const QByteArray& buffer = state.buffers.at(task.index);
        if (buffer.size() != task.length()) {
            return failed(FailureKind::Transport, QString("Chunk %1 is incomplete").arg(task.index));
        }
        std::memcpy(merged.data() + task.start, buffer.constData(), static_cast<size_t>(buffer.size()));
    }

    DownloadResult result;
    result.data = merged;
    result.size = size;
    result.chunked = true;
    result.chunkCount = state.tasks.size();
    result.retries = state.retries;
    return result;
}

}  // namespace reel
