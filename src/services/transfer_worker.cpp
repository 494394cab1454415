#include "reel/transfer_worker.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>

#include "reel/chunked_downloader.hpp"
#include "reel/logging.hpp"
#include "reel/telemetry.hpp"
#include "reel/uploader.hpp"

namespace reel {

TransferWorker::TransferWorker(std::shared_ptr<HttpClient> client, QObject* parent)
    : QObject(parent),
      client_(std::move(client)) {}

void TransferWorker::cancel() {
    QMutexLocker lock(&mutex_);
    cancel_.cancel();
}

bool TransferWorker::begin(const QString& kind) {
    if (busy_) {
        emit transferFinished({
            {"kind", kind},
            {"success", false},
            {"error", "Another transfer is already running."},
        });
        return false;
    }
    busy_ = true;
    return true;
}

void TransferWorker::finish(const QString& kind, QJsonObject result) {
    busy_ = false;
    {
        QMutexLocker lock(&mutex_);
        cancel_ = CancellationToken();
    }
    result.insert("kind", kind);
    Telemetry::instance().incrementCounter("worker.transfers");
    qCInfo(lcTransfer) << kind << "finished, success:" << result.value("success").toBool();
    emit transferFinished(result);
}

void TransferWorker::download(const QString& url, const QString& outputPath, const QJsonObject& options) {
    if (!begin("download")) {
        return;
    }

    DownloadOptions downloadOptions;
    downloadOptions.size = options.value("size").toInteger(-1);
    downloadOptions.chunkSize = options.value("chunk_size").toInteger(DownloadOptions::kDefaultChunkSize);
    downloadOptions.directThreshold = downloadOptions.chunkSize;
    downloadOptions.maxConcurrent = options.value("concurrency").toInt(DownloadOptions::kDefaultMaxConcurrent);
    downloadOptions.maxRetries = options.value("max_retries").toInt(DownloadOptions::kDefaultMaxRetries);
    downloadOptions.retryBaseDelayMs =
        options.value("retry_base_delay_ms").toInt(DownloadOptions::kDefaultRetryBaseDelayMs);
    {
        QMutexLocker lock(&mutex_);
        downloadOptions.cancel = cancel_;
    }

    const ChunkedDownloader downloader(*client_);
    const DownloadResult result = downloader.download(url, downloadOptions, [this](const DownloadProgress& progress) {
        QJsonObject row = progress.toJson();
        row.remove("chunks");
        emit progressChanged(row);
    });

    QJsonObject out = result.toJson();
    if (!result.success()) {
        finish("download", out);
        return;
    }

    const QFileInfo info(outputPath);
    if (!QDir().mkpath(info.absolutePath())) {
        qCWarning(lcTransfer) << "unable to create" << info.absolutePath();
    }
    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly) || file.write(result.data) != result.data.size() || !file.commit()) {
        out.insert("success", false);
        out.insert("error", QString("Failed to write %1: %2").arg(outputPath, file.errorString()));
        out.insert("failure", failureKindName(FailureKind::Io));
        finish("download", out);
        return;
    }
    out.insert("path", info.absoluteFilePath());
    finish("download", out);
}

void TransferWorker::upload(const QString& archivePath, const QJsonObject& options) {
    if (!begin("upload")) {
        return;
    }

    QFile file(archivePath);
    if (!file.open(QIODevice::ReadOnly)) {
        finish("upload", {
            {"success", false},
            {"error", QString("Failed to open %1: %2").arg(archivePath, file.errorString())},
            {"failure", failureKindName(FailureKind::Io)},
        });
        return;
    }
    const QByteArray archive = file.readAll();
    file.close();

    UploadOptions uploadOptions;
    uploadOptions.endpoint = options.value("endpoint").toString();
    uploadOptions.platform = options.value("platform").toString();
    uploadOptions.deviceId = options.value("device_id").toString();
    uploadOptions.jiraId = options.value("jira_id").toString();
    uploadOptions.timeoutMs = options.value("timeout_ms").toInt(Uploader::kDefaultTimeoutMs);
    const QJsonObject headers = options.value("headers").toObject();
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        uploadOptions.headers.append({it.key(), it.value().toString()});
    }

    CancellationToken cancel;
    {
        QMutexLocker lock(&mutex_);
        cancel = cancel_;
    }

    const Uploader uploader(*client_);
    const UploadResult result = uploader.upload(
        archive,
        QFileInfo(archivePath).fileName(),
        uploadOptions,
        [this](double percent) { emit progressChanged({{"percentage", percent}}); },
        ProgressBudget::full(),
        cancel);
    finish("upload", result.toJson());
}

}  // namespace reel
