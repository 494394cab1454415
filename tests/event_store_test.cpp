#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>

#include "reel/event_store.hpp"
#include "reel/telemetry.hpp"

namespace reel {
namespace {

QJsonObject eventRow(qint64 timestamp, const QString& marker = QString()) {
    return RenderEvent(3, QJsonObject{{"marker", marker}}, timestamp).toJson();
}

class EventStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.isValid());
        store_ = std::make_unique<EventStore>(dir_.path(), 5);
        ASSERT_TRUE(store_->open());
    }

    QTemporaryDir dir_;
    std::unique_ptr<EventStore> store_;
};

TEST_F(EventStoreTest, OpenCreatesOneDirectoryPerTable) {
    EXPECT_TRUE(QDir(dir_.filePath("renderEvent")).exists());
    EXPECT_TRUE(QDir(dir_.filePath("responseData")).exists());
}

TEST_F(EventStoreTest, AppendedRowsReadBackInInsertionOrder) {
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 100, eventRow(30, "c")));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 100, eventRow(10, "a")));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 100, eventRow(20, "b")));

    const QJsonArray rows = store_->read(StoreTable::RenderEvent, 100);
    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows.at(0).toObject().value("data").toObject().value("marker").toString(), "c");
    EXPECT_EQ(rows.at(1).toObject().value("data").toObject().value("marker").toString(), "a");
    EXPECT_EQ(rows.at(2).toObject().value("data").toObject().value("marker").toString(), "b");
}

TEST_F(EventStoreTest, SessionsArePartitionedAndListedNewestFirst) {
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 100, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 300, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::ResponseData, 200, QJsonObject{{"startedDateTime", "2024-01-01T00:00:00.000Z"}}));

    EXPECT_EQ(store_->sessionIds(StoreTable::RenderEvent), (QList<qint64>{300, 100}));
    EXPECT_EQ(store_->sessionIds(), (QList<qint64>{300, 200, 100}));
    EXPECT_EQ(store_->count(StoreTable::RenderEvent), 2);
    EXPECT_EQ(store_->count(StoreTable::ResponseData, 200), 1);
    EXPECT_EQ(store_->count(StoreTable::ResponseData, 100), 0);
    EXPECT_EQ(store_->readAll(StoreTable::RenderEvent).keys(), (QList<qint64>{100, 300}));
}

TEST_F(EventStoreTest, CapEvictsTheOldestEventsByTimestamp) {
    // Out-of-order timestamps: eviction follows the timestamp, not the insertion order.
    const QList<qint64> stamps{50, 10, 70, 20, 60, 30, 80};
    const qint64 evictedBefore = Telemetry::instance().counter("store.evicted_events");
    for (qint64 stamp : stamps) {
        ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 1, eventRow(stamp)));
    }

    const QJsonArray rows = store_->read(StoreTable::RenderEvent, 1);
    ASSERT_EQ(rows.size(), 5);
    QList<qint64> kept;
    for (const QJsonValue& row : rows) {
        kept.append(row.toObject().value("timestamp").toInteger());
    }
    EXPECT_EQ(kept, (QList<qint64>{50, 70, 60, 30, 80}));
    EXPECT_EQ(Telemetry::instance().counter("store.evicted_events") - evictedBefore, 2);
}

TEST_F(EventStoreTest, CapIsPerSessionAndIgnoresTraceEntries) {
    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 1, eventRow(i)));
        ASSERT_TRUE(store_->append(StoreTable::ResponseData, 1, QJsonObject{{"n", i}}));
    }
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 2, eventRow(1)));

    EXPECT_EQ(store_->count(StoreTable::RenderEvent, 1), 5);
    EXPECT_EQ(store_->count(StoreTable::ResponseData, 1), 8);
    EXPECT_EQ(store_->count(StoreTable::RenderEvent, 2), 1);
}

TEST_F(EventStoreTest, CounterIsRebuiltFromDiskAfterReopen) {
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 9, eventRow(i)));
    }

    EventStore reopened(dir_.path(), 5);
    ASSERT_TRUE(reopened.open());
    ASSERT_TRUE(reopened.append(StoreTable::RenderEvent, 9, eventRow(4)));
    ASSERT_TRUE(reopened.append(StoreTable::RenderEvent, 9, eventRow(5)));

    const QJsonArray rows = reopened.read(StoreTable::RenderEvent, 9);
    ASSERT_EQ(rows.size(), 5);
    EXPECT_EQ(rows.first().toObject().value("timestamp").toInteger(), 1);
}

TEST_F(EventStoreTest, UnreadableLinesAreSkipped) {
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 5, eventRow(1)));
    QFile file(dir_.filePath("renderEvent/5.jsonl"));
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Append));
    file.write("{not json\n");
    file.close();
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 5, eventRow(2)));

    EXPECT_EQ(store_->read(StoreTable::RenderEvent, 5).size(), 2);
}

TEST_F(EventStoreTest, DeleteSessionRemovesBothTables) {
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 7, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::ResponseData, 7, QJsonObject{{"n", 1}}));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 8, eventRow(1)));

    EXPECT_TRUE(store_->deleteSession(7));
    EXPECT_EQ(store_->sessionIds(), (QList<qint64>{8}));
    EXPECT_TRUE(store_->deleteSession(12345));
}

TEST_F(EventStoreTest, ClearTableLeavesTheOtherTable) {
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 7, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::ResponseData, 7, QJsonObject{{"n", 1}}));

    EXPECT_TRUE(store_->clearTable(StoreTable::RenderEvent));
    EXPECT_EQ(store_->count(StoreTable::RenderEvent), 0);
    EXPECT_EQ(store_->count(StoreTable::ResponseData), 1);
}

TEST(RetentionPolicyTest, CutoffFollowsTheDayCount) {
    const qint64 trace = 10LL * RetentionPolicy::kDayMs;
    EXPECT_TRUE(RetentionPolicy(-1).keepsForever());
    EXPECT_EQ(RetentionPolicy(-1).cutoffFor(trace), std::numeric_limits<qint64>::min());
    EXPECT_EQ(RetentionPolicy(0).cutoffFor(trace), trace - 10000);
    EXPECT_EQ(RetentionPolicy(2).cutoffFor(trace), trace - 2 * RetentionPolicy::kDayMs);
    EXPECT_EQ(RetentionPolicy().days(), 2);
}

TEST_F(EventStoreTest, SweepDeletesSessionsOlderThanTheCutoff) {
    const qint64 trace = 30LL * RetentionPolicy::kDayMs;
    const qint64 stale = trace - 3 * RetentionPolicy::kDayMs;
    const qint64 recent = trace - RetentionPolicy::kDayMs;
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, stale, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::ResponseData, stale, QJsonObject{{"n", 1}}));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, recent, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, trace, eventRow(1)));

    const SweepReport report = store_->sweep(trace, RetentionPolicy(2));
    EXPECT_EQ(report.deletedSessions, 1);
    EXPECT_EQ(report.deletedEvents, 1);
    EXPECT_EQ(report.deletedEntries, 1);
    EXPECT_EQ(report.totalEvents, 2);
    EXPECT_EQ(report.totalEntries, 0);
    EXPECT_EQ(store_->sessionIds(), (QList<qint64>{trace, recent}));
}

TEST_F(EventStoreTest, ZeroDayRetentionKeepsOnlyTheGraceWindow) {
    const qint64 trace = 1'700'000'000'000;
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, trace - 60'000, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, trace - 5'000, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, trace, eventRow(1)));

    const SweepReport report = store_->sweep(trace, RetentionPolicy(0));
    EXPECT_EQ(report.deletedSessions, 1);
    EXPECT_EQ(store_->sessionIds(), (QList<qint64>{trace, trace - 5'000}));
}

TEST_F(EventStoreTest, NegativeRetentionKeepsEverything) {
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 1, eventRow(1)));
    ASSERT_TRUE(store_->append(StoreTable::RenderEvent, 2, eventRow(1)));

    const SweepReport report = store_->sweep(1'700'000'000'000, RetentionPolicy(-1));
    EXPECT_EQ(report.deletedSessions, 0);
    EXPECT_EQ(report.totalEvents, 2);
}

}  // namespace
}  // namespace reel
