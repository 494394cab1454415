#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>

#include <limits>

#include "reel/render_event.hpp"
#include "reel/trace_entry.hpp"

namespace reel {

enum class StoreTable {
    RenderEvent,
    ResponseData,
};

QString storeTableName(StoreTable table);

// Signed day count: negative keeps everything, zero keeps only a short grace window, N keeps
// N days. Cutoffs are computed from the session trace time, never from the wall clock alone.
class RetentionPolicy {
public:
    static constexpr qint64 kGraceWindowMs = 10 * 1000;
    static constexpr qint64 kDayMs = 24LL * 60 * 60 * 1000;
    static constexpr int kDefaultDays = 2;

    explicit RetentionPolicy(int days = kDefaultDays) : days_(days) {}

    [[nodiscard]] int days() const { return days_; }
    [[nodiscard]] bool keepsForever() const { return days_ < 0; }

    [[nodiscard]] qint64 cutoffFor(qint64 traceTime) const {
        if (days_ < 0) {
            return std::numeric_limits<qint64>::min();
        }
        if (days_ == 0) {
            return traceTime - kGraceWindowMs;
        }
        return traceTime - static_cast<qint64>(days_) * kDayMs;
    }

private:
    int days_;
};

struct SweepReport {
    qint64 cutoff = 0;
    int deletedSessions = 0;
    int deletedEvents = 0;
    int deletedEntries = 0;
    int totalEvents = 0;
    int totalEntries = 0;

    QJsonObject toJson() const;
};

// Session-partitioned local persistence. Each (table, session) pair is one append-only JSON-lines
// file; rewrites go through QSaveFile so a partition is replaced atomically.
class EventStore {
public:
    static constexpr int kDefaultMaxEvents = 5000;

    explicit EventStore(QString rootDir, int maxEventsPerSession = kDefaultMaxEvents);

    bool open();
    [[nodiscard]] QString errorString() const;
    [[nodiscard]] QString rootDir() const { return root_; }
    [[nodiscard]] int maxEventsPerSession() const { return maxEvents_; }

    bool appendEvent(qint64 sessionId, const RenderEvent& event);
    bool appendEntry(qint64 sessionId, const TraceEntry& entry);
    bool append(StoreTable table, qint64 sessionId, const QJsonObject& row);

    QJsonArray read(StoreTable table, qint64 sessionId) const;
    QMap<qint64, QJsonArray> readAll(StoreTable table) const;
    QList<qint64> sessionIds(StoreTable table) const;
    QList<qint64> sessionIds() const;
    int count(StoreTable table) const;
    int count(StoreTable table, qint64 sessionId) const;

    bool deleteSession(qint64 sessionId);
    bool clearTable(StoreTable table);
    SweepReport sweep(qint64 traceTime, const RetentionPolicy& policy);

private:
    QString tableDir(StoreTable table) const;
    QString partitionPath(StoreTable table, qint64 sessionId) const;
    QList<qint64> sessionIdsLocked(StoreTable table) const;
    QJsonArray readLocked(StoreTable table, qint64 sessionId) const;
    bool appendLocked(StoreTable table, qint64 sessionId, const QJsonObject& row);
    bool writePartitionLocked(StoreTable table, qint64 sessionId, const QJsonArray& rows);
    bool removePartitionLocked(StoreTable table, qint64 sessionId);
    int eventCountLocked(qint64 sessionId);
    int evictOldestLocked(qint64 sessionId);

    mutable QMutex mutex_;
    QString root_;
    int maxEvents_;
    QHash<qint64, int> eventCounters_;
    QString error_;
};

}  // namespace reel
