#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "reel/telemetry.hpp"

namespace reel {
namespace {

class TelemetryTest : public ::testing::Test {
protected:
    void SetUp() override { Telemetry::instance().reset(); }
    void TearDown() override { Telemetry::instance().reset(); }
};

TEST_F(TelemetryTest, SnapshotGroupsMetricsBySubsystem) {
    Telemetry& telemetry = Telemetry::instance();
    telemetry.incrementCounter("store.appends");
    telemetry.incrementCounter("store.appends", 4);
    telemetry.incrementCounter("orphan");
    telemetry.setGauge("package.last_archive_bytes", 2048.0);
    telemetry.recordDurationMs("upload.duration_ms", 30);
    telemetry.recordDurationMs("upload.duration_ms", 10);

    EXPECT_EQ(telemetry.counter("store.appends"), 5);
    EXPECT_EQ(telemetry.counter("never.touched"), 0);

    const QJsonObject snapshot = telemetry.snapshot();
    EXPECT_EQ(snapshot.value("counters").toObject().value("store").toObject().value("appends").toInt(), 5);
    EXPECT_EQ(snapshot.value("counters").toObject().value("misc").toObject().value("orphan").toInt(), 1);
    EXPECT_EQ(snapshot.value("gauges").toObject().value("package").toObject().value("last_archive_bytes").toDouble(), 2048.0);

    const QJsonObject upload = snapshot.value("durations").toObject().value("upload").toObject().value("duration_ms").toObject();
    EXPECT_EQ(upload.value("count").toInt(), 2);
    EXPECT_EQ(upload.value("min_ms").toInt(), 10);
    EXPECT_EQ(upload.value("max_ms").toInt(), 30);
    EXPECT_DOUBLE_EQ(upload.value("avg_ms").toDouble(), 20.0);
}

TEST_F(TelemetryTest, EventLogIsBounded) {
    for (int i = 0; i < 1100; ++i) {
        Telemetry::instance().recordEvent("tick", {{"i", i}});
    }
    const QJsonArray events = Telemetry::instance().snapshot().value("events").toArray();
    ASSERT_EQ(events.size(), 1000);
    EXPECT_EQ(events.first().toObject().value("i").toInt(), 100);
    EXPECT_EQ(events.last().toObject().value("type").toString(), "tick");
}

TEST_F(TelemetryTest, RequestRateCountsTheLastMinute) {
    Telemetry::instance().recordRequest();
    Telemetry::instance().recordRequest();
    EXPECT_EQ(Telemetry::instance().snapshot().value("http_requests_last_minute").toInt(), 2);
}

TEST_F(TelemetryTest, ExportWritesTheSnapshot) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Telemetry::instance().incrementCounter("download.count");

    const QString path = dir.filePath("logs/telemetry_last_exit.json");
    const QJsonObject result = Telemetry::instance().exportToFile(path);
    ASSERT_TRUE(result.value("success").toBool()) << result.value("error").toString().toStdString();

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QJsonObject written = QJsonDocument::fromJson(file.readAll()).object();
    EXPECT_EQ(written.value("counters").toObject().value("download").toObject().value("count").toInt(), 1);
}

}  // namespace
}  // namespace reel
