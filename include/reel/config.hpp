#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "reel/chunked_downloader.hpp"
#include "reel/event_store.hpp"
#include "reel/http_client.hpp"
#include "reel/result.hpp"
#include "reel/trace_entry.hpp"
#include "reel/uploader.hpp"

namespace reel {

struct RecorderConfig {
    static const QString kDefaultFileName;
    static const QString kOnlineEndpoint;

    QString projectName;
    QString env;
    QString appId;
    QString deviceId = "unknown_device";
    QString platform;
    QString jiraId;
    QString uploadEndpoint;
    HeaderList uploadHeaders;
    int recordInterval = RetentionPolicy::kDefaultDays;
    int maxEvents = EventStore::kDefaultMaxEvents;
    QString storeDir;
    int maxBodyBytes = TraceEntryBuilder::kDefaultMaxBodyBytes;
    QStringList ignorePatterns;
    qint64 chunkSize = DownloadOptions::kDefaultChunkSize;
    int maxConcurrent = DownloadOptions::kDefaultMaxConcurrent;
    int maxRetries = DownloadOptions::kDefaultMaxRetries;
    int retryBaseDelayMs = DownloadOptions::kDefaultRetryBaseDelayMs;
    int uploadTimeoutMs = Uploader::kDefaultTimeoutMs;
    int sweepDelayMs = 1000;

    static RecorderConfig fromJson(const QJsonObject& object);
    QJsonObject toJson() const;

    [[nodiscard]] QStringList missingFields() const;
    // <store_dir>/<project_name>, store_dir defaulting to <cwd>/state.
    [[nodiscard]] QString resolvedStoreDir() const;
    [[nodiscard]] RetentionPolicy retention() const { return RetentionPolicy(recordInterval); }
    [[nodiscard]] DownloadOptions downloadOptions() const;
    [[nodiscard]] UploadOptions uploadOptions() const;
};

struct ConfigLoadResult {
    RecorderConfig config;
    OperationResult status;
};

ConfigLoadResult loadConfig(const QString& path);

}  // namespace reel
