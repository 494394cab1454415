#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <QQueue>
#include <QString>

namespace reel {

// Process-wide metrics. Keys are "<subsystem>.<name>"; snapshots group them by subsystem.
class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});
    // Outbound HTTP request marker for the per-minute rate.
    void recordRequest();

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;
    void reset();

private:
    Telemetry() = default;

    struct DurationStats {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 minMs = 0;
        qint64 maxMs = 0;
    };

    static constexpr int kMaxEvents = 1000;
    static constexpr qint64 kRateWindowMs = 60 * 1000;

    void pruneRequestsLocked(qint64 nowMs) const;

    mutable QMutex mutex_;
    QMap<QString, qint64> counters_;
    QMap<QString, double> gauges_;
    QMap<QString, DurationStats> durations_;
    QQueue<QJsonObject> events_;
    mutable QQueue<qint64> requestTimesMs_;
};

}  // namespace reel
