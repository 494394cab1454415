#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "reel/packager.hpp"
#include "reel/zip_archive.hpp"

namespace reel {
namespace {

QJsonArray events(int count, qint64 firstTimestamp = 1000) {
    QJsonArray out;
    for (int i = 0; i < count; ++i) {
        out.append(QJsonObject{
            {"type", 3},
            {"data", QJsonObject{{"source", 1}, {"i", i}}},
            {"timestamp", static_cast<double>(firstTimestamp + i)},
        });
    }
    return out;
}

QJsonArray entries(int count) {
    QJsonArray out;
    for (int i = 0; i < count; ++i) {
        out.append(QJsonObject{
            {"startedDateTime", "2024-03-01T10:00:00.000Z"},
            {"request", QJsonObject{{"method", "GET"}, {"url", QString("https://api.test/%1").arg(i)}}},
            {"response", QJsonObject{{"status", 200}}},
        });
    }
    return out;
}

QJsonObject unzipJson(const QByteArray& archive, const QString& name) {
    ZipReader reader;
    EXPECT_TRUE(reader.load(archive)) << reader.errorString().toStdString();
    const std::optional<QByteArray> bytes = reader.file(name);
    EXPECT_TRUE(bytes.has_value());
    return bytes ? QJsonDocument::fromJson(*bytes).object() : QJsonObject{};
}

TEST(PackagerTest, DataDocumentRoundTripsThroughTheArchive) {
    const SessionData session{1700000000000, events(3), entries(2)};
    const PackageResult result = Packager().package({session});
    ASSERT_TRUE(result.success()) << result.error.toStdString();

    const QJsonObject document = unzipJson(result.archive, Packager::kDataFileName);
    ASSERT_EQ(document.keys(), QStringList{"1700000000000"});
    const QJsonObject body = document.value("1700000000000").toObject();
    EXPECT_EQ(body.value("eventData").toArray(), session.events);
    EXPECT_EQ(body.value("responseData").toArray(), session.entries);

    EXPECT_EQ(result.sessionIds, (QList<qint64>{1700000000000}));
    EXPECT_EQ(result.eventCount, 3);
    EXPECT_EQ(result.entryCount, 2);
    EXPECT_EQ(result.truncatedEvents, 0);
    EXPECT_TRUE(result.fileName.startsWith("record-"));
    EXPECT_TRUE(result.fileName.endsWith(".zip"));
}

TEST(PackagerTest, ManifestListsSessionsAsStrings) {
    const PackageResult result = Packager().package({{11, events(1), {}}, {22, {}, entries(1)}});
    ASSERT_TRUE(result.success());

    const QJsonObject manifest = unzipJson(result.archive, Packager::kManifestFileName);
    EXPECT_EQ(manifest.value("format").toString(), Packager::kArchiveFormat);
    EXPECT_EQ(manifest.value("version").toInt(), Packager::kArchiveVersion);
    EXPECT_EQ(manifest.value("sessions").toArray(), (QJsonArray{"11", "22"}));
}

TEST(PackagerTest, SameSessionsProduceTheSameArchiveBytes) {
    const QList<SessionData> sessions{{5, events(40), entries(4)}};
    EXPECT_EQ(Packager().package(sessions).archive, Packager().package(sessions).archive);
}

TEST(PackagerTest, OnlyTheLastEventsUnderTheCapArePackaged) {
    const PackageResult result = Packager(10).package({{1, events(25), {}}});
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.truncatedEvents, 15);
    EXPECT_EQ(result.eventCount, 10);

    const QJsonArray packaged = unzipJson(result.archive, Packager::kDataFileName)
                                    .value("1").toObject().value("eventData").toArray();
    ASSERT_EQ(packaged.size(), 10);
    EXPECT_EQ(packaged.first().toObject().value("timestamp").toInteger(), 1015);
    EXPECT_EQ(packaged.last().toObject().value("timestamp").toInteger(), 1024);
}

TEST(PackagerTest, NonObjectRowIsASerializationFailure) {
    QJsonArray broken = events(2);
    broken.append(42);
    const PackageResult result = Packager().package({{1, broken, {}}});
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.failure, FailureKind::Serialization);
    EXPECT_TRUE(result.archive.isEmpty());

    const QJsonObject json = result.toJson();
    EXPECT_FALSE(json.value("success").toBool());
    EXPECT_EQ(json.value("failure").toString(), failureKindName(FailureKind::Serialization));
}

TEST(PackagerTest, DuplicateSessionIsRejected) {
    const PackageResult result = Packager().package({{1, events(1), {}}, {1, events(1), {}}});
    EXPECT_EQ(result.failure, FailureKind::Serialization);
}

TEST(PackagerTest, ProgressStaysInsideTheCompressionPhase) {
    QList<double> seen;
    const PackageResult result = Packager().package({{1, events(4000), entries(50)}},
        [&](double percent) { seen.append(percent); });
    ASSERT_TRUE(result.success());

    ASSERT_GE(seen.size(), 2);
    EXPECT_DOUBLE_EQ(seen.first(), 0.0);
    EXPECT_DOUBLE_EQ(seen.last(), 50.0);
    for (int i = 0; i < seen.size(); ++i) {
        EXPECT_GE(seen.at(i), 0.0);
        EXPECT_LE(seen.at(i), 50.0);
        if (i > 0) {
            EXPECT_GE(seen.at(i), seen.at(i - 1));
        }
    }
}

TEST(PackagerTest, CancelledBeforeCompressionStops) {
    CancellationToken cancel;
    cancel.cancel();
    const PackageResult result = Packager().package({{1, events(1), {}}}, {}, ProgressBudget::compressPhase(), cancel);
    EXPECT_EQ(result.failure, FailureKind::Cancelled);
}

TEST(PackagerTest, WriteToFileCreatesParentDirectories) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const PackageResult result = Packager().package({{3, events(2), {}}});
    ASSERT_TRUE(result.success());

    const QString path = dir.filePath("nested/out/session.zip");
    const OperationResult written = Packager::writeToFile(result, path);
    ASSERT_TRUE(written.success()) << written.error.toStdString();
    EXPECT_EQ(written.details.value("event_count").toInt(), 2);

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), result.archive);
}

TEST(PackagerTest, JsonExportIsTheIndentedDataDocument) {
    const QList<SessionData> sessions{{1700000000000, events(3), entries(2)}};
    const Packager packager;
    const PackageResult zipped = packager.package(sessions);
    const PackageResult json = packager.packageJson(sessions);
    ASSERT_TRUE(json.success()) << json.error.toStdString();

    EXPECT_EQ(json.format, ExportFormat::Json);
    EXPECT_TRUE(json.fileName.startsWith("record-"));
    EXPECT_TRUE(json.fileName.endsWith(".json"));
    EXPECT_TRUE(json.archive.contains('\n'));
    EXPECT_EQ(QJsonDocument::fromJson(json.archive).object(), unzipJson(zipped.archive, Packager::kDataFileName));
    EXPECT_EQ(json.eventCount, 3);
    EXPECT_EQ(json.entryCount, 2);
    EXPECT_EQ(json.toJson().value("format").toString(), "json");
}

TEST(PackagerTest, JsonExportRejectsBadRowsLikeTheArchive) {
    const QList<SessionData> sessions{{1, QJsonArray{QJsonValue(42)}, QJsonArray{}}};
    EXPECT_EQ(Packager().packageJson(sessions).failure, FailureKind::Serialization);
}

TEST(PackagerTest, ExportFormatNamesParse) {
    EXPECT_EQ(exportFormatFromName("zip"), ExportFormat::Zip);
    EXPECT_EQ(exportFormatFromName(" JSON "), ExportFormat::Json);
    EXPECT_FALSE(exportFormatFromName("tar").has_value());
    EXPECT_EQ(Packager::archiveFileName(5, ExportFormat::Json), "record-5.json");
    EXPECT_EQ(Packager::archiveFileName(5), "record-5.zip");
}

TEST(PackagerTest, WriteToFileForwardsAFailedPackage) {
    PackageResult failed;
    failed.failure = FailureKind::Serialization;
    failed.error = "bad row";
    const OperationResult written = Packager::writeToFile(failed, "/nonexistent/out.zip");
    EXPECT_EQ(written.failure, FailureKind::Serialization);
    EXPECT_EQ(written.error, "bad row");
}

}  // namespace
}  // namespace reel
