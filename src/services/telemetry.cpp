#include "reel/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QPair>
#include <QSaveFile>

#include <algorithm>

namespace reel {

namespace {

// "store.appends" -> ("store", "appends"); keys without a dot land under "misc".
QPair<QString, QString> splitKey(const QString& key) {
    const int dot = key.indexOf('.');
    if (dot <= 0) {
        return {QStringLiteral("misc"), key};
    }
    return {key.left(dot), key.mid(dot + 1)};
}

void insertGrouped(QJsonObject* groups, const QString& key, const QJsonValue& value) {
    const auto [group, name] = splitKey(key);
    QJsonObject bucket = groups->value(group).toObject();
    bucket.insert(name, value);
    groups->insert(group, bucket);
}

}  // namespace

Telemetry& Telemetry::instance() {
    static Telemetry telemetry;
    return telemetry;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_[key] += delta;
}

void Telemetry::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_[key] = value;
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    DurationStats& stats = durations_[key];
    stats.minMs = stats.count == 0 ? durationMs : std::min(stats.minMs, durationMs);
    stats.maxMs = std::max(stats.maxMs, durationMs);
    stats.totalMs += durationMs;
    ++stats.count;
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("epoch_ms", static_cast<double>(now));

    QMutexLocker lock(&mutex_);
    events_.enqueue(row);
    while (events_.size() > kMaxEvents) {
        events_.dequeue();
    }
}

void Telemetry::recordRequest() {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QMutexLocker lock(&mutex_);
    requestTimesMs_.enqueue(now);
    pruneRequestsLocked(now);
}

void Telemetry::pruneRequestsLocked(qint64 nowMs) const {
    while (!requestTimesMs_.isEmpty() && requestTimesMs_.head() < nowMs - kRateWindowMs) {
        requestTimesMs_.dequeue();
    }
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key, 0);
}

QJsonObject Telemetry::snapshot() const {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QMutexLocker lock(&mutex_);

    QJsonObject counters;
    for (auto it = counters_.constBegin(); it != counters_.constEnd(); ++it) {
        insertGrouped(&counters, it.key(), static_cast<double>(it.value()));
    }
    QJsonObject gauges;
    for (auto it = gauges_.constBegin(); it != gauges_.constEnd(); ++it) {
        insertGrouped(&gauges, it.key(), it.value());
    }
    QJsonObject durations;
    for (auto it = durations_.constBegin(); it != durations_.constEnd(); ++it) {
        const DurationStats& stats = it.value();
        insertGrouped(&durations, it.key(), QJsonObject{
            {"count", static_cast<double>(stats.count)},
            {"total_ms", static_cast<double>(stats.totalMs)},
            {"min_ms", static_cast<double>(stats.minMs)},
            {"max_ms", static_cast<double>(stats.maxMs)},
            {"avg_ms", stats.count > 0 ? static_cast<double>(stats.totalMs) / static_cast<double>(stats.count) : 0.0},
        });
    }
    QJsonArray events;
    for (const QJsonObject& event : events_) {
        events.append(event);
    }

    pruneRequestsLocked(now);
    return {
        {"counters", counters},
        {"gauges", gauges},
        {"durations", durations},
        {"events", events},
        {"http_requests_last_minute", static_cast<int>(requestTimesMs_.size())},
        {"captured_utc", QDateTime::fromMSecsSinceEpoch(now).toUTC().toString(Qt::ISODateWithMs)},
    };
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        return {
            {"success", false},
            {"error", QString("Unable to create %1").arg(info.absolutePath())},
            {"path", filePath},
        };
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return {
            {"success", false},
            {"error", file.errorString()},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(snapshot()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return {
            {"success", false},
            {"error", file.errorString()},
            {"path", filePath},
        };
    }
    return {
        {"success", true},
        {"path", info.absoluteFilePath()},
    };
}

void Telemetry::reset() {
    QMutexLocker lock(&mutex_);
    counters_.clear();
    gauges_.clear();
    durations_.clear();
    events_.clear();
    requestTimesMs_.clear();
}

}  // namespace reel
