#include "reel/config.hpp"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

#include "reel/logging.hpp"

namespace reel {

const QString RecorderConfig::kDefaultFileName = QStringLiteral("reel.json");
const QString RecorderConfig::kOnlineEndpoint = QStringLiteral("https://tubi-web-reel.vercel.app/api/sessions");

RecorderConfig RecorderConfig::fromJson(const QJsonObject& object) {
    RecorderConfig config;
    config.projectName = object.value("project_name").toString().trimmed();
    config.env = object.value("env").toString().trimmed();
    config.appId = object.value("app_id").toString().trimmed();
    config.deviceId = object.value("device_id").toString(config.deviceId);
    config.platform = object.value("platform").toString();
    config.jiraId = object.value("jira_id").toString();
    config.uploadEndpoint = object.value("upload_endpoint").toString();
    if (config.uploadEndpoint.isEmpty() && config.env == "online") {
        config.uploadEndpoint = kOnlineEndpoint;
    }

    const QJsonObject headers = object.value("upload_headers").toObject();
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        config.uploadHeaders.append({it.key(), it.value().toString()});
    }

    config.recordInterval = object.value("record_interval").toInt(config.recordInterval);
    config.maxEvents = object.value("max_events").toInt(config.maxEvents);
    config.storeDir = object.value("store_dir").toString();
    config.maxBodyBytes = object.value("max_body_bytes").toInt(config.maxBodyBytes);
    for (const QJsonValue& pattern : object.value("ignore_patterns").toArray()) {
        if (!pattern.toString().isEmpty()) {
            config.ignorePatterns.append(pattern.toString());
        }
    }

    const QJsonObject download = object.value("download").toObject();
    config.chunkSize = download.value("chunk_size").toInteger(config.chunkSize);
    config.maxConcurrent = download.value("max_concurrent").toInt(config.maxConcurrent);
    config.maxRetries = download.value("max_retries").toInt(config.maxRetries);
    config.retryBaseDelayMs = download.value("retry_base_delay_ms").toInt(config.retryBaseDelayMs);

    config.uploadTimeoutMs = object.value("upload_timeout_ms").toInt(config.uploadTimeoutMs);
    config.sweepDelayMs = object.value("sweep_delay_ms").toInt(config.sweepDelayMs);
    return config;
}

QJsonObject RecorderConfig::toJson() const {
    QJsonObject headers;
    for (const auto& header : uploadHeaders) {
        headers.insert(header.first, header.second);
    }
    return {
        {"project_name", projectName},
        {"env", env},
        {"app_id", appId},
        {"device_id", deviceId},
        {"platform", platform},
        {"jira_id", jiraId},
        {"upload_endpoint", uploadEndpoint},
        {"upload_headers", headers},
        {"record_interval", recordInterval},
        {"max_events", maxEvents},
        {"store_dir", resolvedStoreDir()},
        {"max_body_bytes", maxBodyBytes},
        {"ignore_patterns", QJsonArray::fromStringList(ignorePatterns)},
        {"download", QJsonObject{
            {"chunk_size", static_cast<double>(chunkSize)},
            {"max_concurrent", maxConcurrent},
            {"max_retries", maxRetries},
            {"retry_base_delay_ms", retryBaseDelayMs},
        }},
        {"upload_timeout_ms", uploadTimeoutMs},
        {"sweep_delay_ms", sweepDelayMs},
    };
}

QStringList RecorderConfig::missingFields() const {
    QStringList missing;
    if (projectName.isEmpty()) {
        missing << "project_name";
    }
    if (env.isEmpty()) {
        missing << "env";
    }
    if (appId.isEmpty()) {
        missing << "app_id";
    }
    return missing;
}

QString RecorderConfig::resolvedStoreDir() const {
    const QString base = storeDir.isEmpty() ? QDir(QDir::currentPath()).filePath("state") : storeDir;
    return QDir(base).filePath(projectName);
}

DownloadOptions RecorderConfig::downloadOptions() const {
    DownloadOptions options;
    options.chunkSize = chunkSize;
    options.directThreshold = chunkSize;
    options.maxConcurrent = maxConcurrent;
    options.maxRetries = maxRetries;
    options.retryBaseDelayMs = retryBaseDelayMs;
    return options;
}

UploadOptions RecorderConfig::uploadOptions() const {
    UploadOptions options;
    options.endpoint = uploadEndpoint;
    options.headers = uploadHeaders;
    options.platform = platform;
    options.deviceId = deviceId;
    options.jiraId = jiraId;
    options.timeoutMs = uploadTimeoutMs;
    return options;
}

ConfigLoadResult loadConfig(const QString& path) {
    ConfigLoadResult result;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        result.status = OperationResult::fail(
            FailureKind::Config,
            QString("Failed to open config file: %1").arg(file.errorString()),
            {{"path", path}});
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.status = OperationResult::fail(
            FailureKind::Config,
            "Config file must contain a JSON object.",
            {{"path", path}, {"parse_error", parseError.errorString()}});
        return result;
    }

    result.config = RecorderConfig::fromJson(doc.object());
    const QStringList missing = result.config.missingFields();
    if (!missing.isEmpty()) {
        result.status = OperationResult::fail(
            FailureKind::Config,
            QString("Missing required config fields: %1").arg(missing.join(", ")),
            {{"path", path}});
        return result;
    }

    qCInfo(lcApp) << "config loaded from" << path << "for project" << result.config.projectName;
    result.status = OperationResult::ok({{"path", path}});
    return result;
}

}  // namespace reel
