#include "reel/event_store.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"

namespace reel {

namespace {

const QString kPartitionSuffix = QStringLiteral(".jsonl");

const QList<StoreTable>& allTables() {
    static const QList<StoreTable> tables{StoreTable::RenderEvent, StoreTable::ResponseData};
    return tables;
}

qint64 rowTimestamp(const QJsonObject& row) {
    if (row.contains("timestamp")) {
        return row.value("timestamp").toInteger(0);
    }
    const QJsonValue started = row.value("startedDateTime");
    if (started.isString()) {
        return QDateTime::fromString(started.toString(), Qt::ISODateWithMs).toMSecsSinceEpoch();
    }
    return 0;
}

}  // namespace

QString storeTableName(StoreTable table) {
    switch (table) {
    case StoreTable::RenderEvent:
        return "renderEvent";
    case StoreTable::ResponseData:
        return "responseData";
    }
    return "unknown";
}

QJsonObject SweepReport::toJson() const {
    return {
        {"cutoff", static_cast<double>(cutoff)},
        {"deleted_sessions", deletedSessions},
        {"deleted_events", deletedEvents},
        {"deleted_entries", deletedEntries},
        {"total_events", totalEvents},
        {"total_entries", totalEntries},
    };
}

EventStore::EventStore(QString rootDir, int maxEventsPerSession)
    : root_(std::move(rootDir)),
      maxEvents_(maxEventsPerSession > 0 ? maxEventsPerSession : kDefaultMaxEvents) {}

bool EventStore::open() {
    QMutexLocker lock(&mutex_);
    for (StoreTable table : allTables()) {
        if (!QDir().mkpath(tableDir(table))) {
            error_ = QString("Unable to create store directory %1").arg(tableDir(table));
            qCCritical(lcStore) << error_;
            return false;
        }
    }
    error_.clear();
    qCInfo(lcStore) << "event store opened at" << root_;
    return true;
}

QString EventStore::errorString() const {
    QMutexLocker lock(&mutex_);
    return error_;
}

QString EventStore::tableDir(StoreTable table) const {
    return QDir(root_).filePath(storeTableName(table));
}

QString EventStore::partitionPath(StoreTable table, qint64 sessionId) const {
    return QDir(tableDir(table)).filePath(QString::number(sessionId) + kPartitionSuffix);
}

bool EventStore::appendEvent(qint64 sessionId, const RenderEvent& event) {
    return append(StoreTable::RenderEvent, sessionId, event.toJson());
}

bool EventStore::appendEntry(qint64 sessionId, const TraceEntry& entry) {
    return append(StoreTable::ResponseData, sessionId, entry.toJson());
}

bool EventStore::append(StoreTable table, qint64 sessionId, const QJsonObject& row) {
    QMutexLocker lock(&mutex_);

    if (table == StoreTable::RenderEvent) {
        eventCountLocked(sessionId);
    }
    if (!appendLocked(table, sessionId, row)) {
        Telemetry::instance().incrementCounter("store.append_failures");
        qCWarning(lcStore) << "append failed for" << storeTableName(table) << sessionId << error_;
        return false;
    }
    Telemetry::instance().incrementCounter("store.appends");

    if (table == StoreTable::RenderEvent) {
        int& counter = eventCounters_[sessionId];
        ++counter;
        if (counter > maxEvents_) {
            evictOldestLocked(sessionId);
        }
    }
    return true;
}

bool EventStore::appendLocked(StoreTable table, qint64 sessionId, const QJsonObject& row) {
    QFile file(partitionPath(table, sessionId));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        error_ = file.errorString();
        return false;
    }
    QByteArray line = QJsonDocument(row).toJson(QJsonDocument::Compact);
    line.append('\n');
    if (file.write(line) != line.size() || !file.flush()) {
        error_ = file.errorString();
        return false;
    }
    return true;
}

int EventStore::eventCountLocked(qint64 sessionId) {
    auto it = eventCounters_.find(sessionId);
    if (it == eventCounters_.end()) {
        it = eventCounters_.insert(sessionId, readLocked(StoreTable::RenderEvent, sessionId).size());
    }
    return it.value();
}

int EventStore::evictOldestLocked(qint64 sessionId) {
    const QJsonArray rows = readLocked(StoreTable::RenderEvent, sessionId);
    if (rows.size() <= maxEvents_) {
        eventCounters_[sessionId] = rows.size();
        return 0;
    }

    std::vector<std::pair<qint64, int>> order;
    order.reserve(static_cast<size_t>(rows.size()));
    for (int i = 0; i < rows.size(); ++i) {
        order.emplace_back(rowTimestamp(rows.at(i).toObject()), i);
    }
    std::stable_sort(order.begin(), order.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });

    const int evict = rows.size() - maxEvents_;
    std::vector<bool> dropped(static_cast<size_t>(rows.size()), false);
    for (int i = 0; i < evict; ++i) {
        dropped[static_cast<size_t>(order[static_cast<size_t>(i)].second)] = true;
    }

    QJsonArray kept;
    for (int i = 0; i < rows.size(); ++i) {
        if (!dropped[static_cast<size_t>(i)]) {
            kept.append(rows.at(i));
        }
    }

    if (!writePartitionLocked(StoreTable::RenderEvent, sessionId, kept)) {
        qCWarning(lcStore) << "event cap eviction failed for session" << sessionId << error_;
        eventCounters_[sessionId] = rows.size();
        return 0;
    }

    eventCounters_[sessionId] = kept.size();
    Telemetry::instance().incrementCounter("store.evicted_events", evict);
    Telemetry::instance().recordEvent("event_cap_eviction", {
        {"session_id", static_cast<double>(sessionId)},
        {"evicted", evict},
        {"kept", kept.size()},
    });
    qCInfo(lcStore) << "cleaned up" << evict << "old events, keeping last" << maxEvents_;
    return evict;
}

bool EventStore::writePartitionLocked(StoreTable table, qint64 sessionId, const QJsonArray& rows) {
    if (rows.isEmpty()) {
        return removePartitionLocked(table, sessionId);
    }
    QSaveFile file(partitionPath(table, sessionId));
    if (!file.open(QIODevice::WriteOnly)) {
        error_ = file.errorString();
        return false;
    }
    for (const QJsonValue& row : rows) {
        QByteArray line = QJsonDocument(row.toObject()).toJson(QJsonDocument::Compact);
        line.append('\n');
        if (file.write(line) != line.size()) {
            error_ = file.errorString();
            file.cancelWriting();
            return false;
        }
    }
    if (!file.commit()) {
        error_ = file.errorString();
        return false;
    }
    return true;
}

bool EventStore::removePartitionLocked(StoreTable table, qint64 sessionId) {
    QFile file(partitionPath(table, sessionId));
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        error_ = file.errorString();
        return false;
    }
    return true;
}

QJsonArray EventStore::read(StoreTable table, qint64 sessionId) const {
    QMutexLocker lock(&mutex_);
    return readLocked(table, sessionId);
}

QJsonArray EventStore::readLocked(StoreTable table, qint64 sessionId) const {
    QJsonArray rows;
    QFile file(partitionPath(table, sessionId));
    if (!file.exists()) {
        return rows;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStore) << "unable to read partition" << file.fileName() << file.errorString();
        return rows;
    }

    int skipped = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            ++skipped;
            continue;
        }
        rows.append(doc.object());
    }
    if (skipped > 0) {
        qCWarning(lcStore) << "skipped" << skipped << "unreadable rows in" << file.fileName();
    }
    return rows;
}

QMap<qint64, QJsonArray> EventStore::readAll(StoreTable table) const {
    QMutexLocker lock(&mutex_);
    QMap<qint64, QJsonArray> out;
    for (qint64 id : sessionIdsLocked(table)) {
        out.insert(id, readLocked(table, id));
    }
    return out;
}

QList<qint64> EventStore::sessionIdsLocked(StoreTable table) const {
    QList<qint64> ids;
    const QDir dir(tableDir(table));
    const QStringList files = dir.entryList({"*" + kPartitionSuffix}, QDir::Files);
    for (const QString& name : files) {
        bool ok = false;
        const qint64 id = QFileInfo(name).completeBaseName().toLongLong(&ok);
        if (ok) {
            ids.append(id);
        }
    }
    std::sort(ids.begin(), ids.end(), std::greater<qint64>());
    return ids;
}

QList<qint64> EventStore::sessionIds(StoreTable table) const {
    QMutexLocker lock(&mutex_);
    return sessionIdsLocked(table);
}

QList<qint64> EventStore::sessionIds() const {
    QMutexLocker lock(&mutex_);
    QList<qint64> ids = sessionIdsLocked(StoreTable::RenderEvent);
    for (qint64 id : sessionIdsLocked(StoreTable::ResponseData)) {
        if (!ids.contains(id)) {
            ids.append(id);
        }
    }
    std::sort(ids.begin(), ids.end(), std::greater<qint64>());
    return ids;
}

int EventStore::count(StoreTable table) const {
    QMutexLocker lock(&mutex_);
    int total = 0;
    for (qint64 id : sessionIdsLocked(table)) {
        total += readLocked(table, id).size();
    }
    return total;
}

int EventStore::count(StoreTable table, qint64 sessionId) const {
    QMutexLocker lock(&mutex_);
    return readLocked(table, sessionId).size();
}

bool EventStore::deleteSession(qint64 sessionId) {
    QMutexLocker lock(&mutex_);
    bool ok = true;
    for (StoreTable table : allTables()) {
        if (!removePartitionLocked(table, sessionId)) {
            qCWarning(lcStore) << "unable to delete" << storeTableName(table) << "for session" << sessionId << error_;
            ok = false;
        }
    }
    eventCounters_.remove(sessionId);
    return ok;
}

bool EventStore::clearTable(StoreTable table) {
    QMutexLocker lock(&mutex_);
    bool ok = true;
    for (qint64 id : sessionIdsLocked(table)) {
        ok = removePartitionLocked(table, id) && ok;
    }
    if (table == StoreTable::RenderEvent) {
        eventCounters_.clear();
    }
    if (!ok) {
        qCWarning(lcStore) << "clear of" << storeTableName(table) << "incomplete:" << error_;
    }
    return ok;
}

SweepReport EventStore::sweep(qint64 traceTime, const RetentionPolicy& policy) {
    QMutexLocker lock(&mutex_);
    SweepReport report;
    report.cutoff = policy.cutoffFor(traceTime);

    if (!policy.keepsForever()) {
        QList<qint64> expired;
        for (StoreTable table : allTables()) {
            for (qint64 id : sessionIdsLocked(table)) {
                if (id < report.cutoff && !expired.contains(id)) {
                    expired.append(id);
                }
            }
        }

        for (qint64 id : expired) {
            const int events = readLocked(StoreTable::RenderEvent, id).size();
            const int entries = readLocked(StoreTable::ResponseData, id).size();
            const bool removedEvents = removePartitionLocked(StoreTable::RenderEvent, id);
            const bool removedEntries = removePartitionLocked(StoreTable::ResponseData, id);
            if (!removedEvents || !removedEntries) {
                qCWarning(lcStore) << "retention sweep could not remove session" << id << error_;
                continue;
            }
            eventCounters_.remove(id);
            ++report.deletedSessions;
            report.deletedEvents += events;
            report.deletedEntries += entries;
        }
    }

    for (qint64 id : sessionIdsLocked(StoreTable::RenderEvent)) {
        report.totalEvents += readLocked(StoreTable::RenderEvent, id).size();
    }
    for (qint64 id : sessionIdsLocked(StoreTable::ResponseData)) {
        report.totalEntries += readLocked(StoreTable::ResponseData, id).size();
    }

    Telemetry::instance().incrementCounter("store.sweep_deleted_sessions", report.deletedSessions);
    Telemetry::instance().recordEvent("retention_sweep", report.toJson());
    qCInfo(lcStore) << "retention sweep removed" << report.deletedSessions << "sessions;"
                    << report.totalEvents << "events and" << report.totalEntries << "entries remain";
    return report;
}

}  // namespace reel
