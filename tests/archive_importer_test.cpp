#include <gtest/gtest.h>

#include <QDateTime>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "reel/archive_importer.hpp"
#include "reel/packager.hpp"
#include "reel/zip_archive.hpp"

namespace reel {
namespace {

QJsonObject event(int type, qint64 timestamp) {
    return {{"type", type}, {"data", QJsonObject{}}, {"timestamp", static_cast<double>(timestamp)}};
}

QByteArray zipOf(const QList<ZipEntry>& files) {
    ZipWriter writer;
    for (const ZipEntry& file : files) {
        writer.addFile(file.name, file.data);
    }
    QByteArray archive;
    QString error;
    EXPECT_TRUE(writer.finish(&archive, &error));
    return archive;
}

QByteArray compact(const QJsonObject& object) {
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

TEST(ArchiveImporterTest, LegacyFlatDocumentBecomesOneSession) {
    const QJsonObject legacy{
        {"eventData", QJsonArray{event(4, 1), event(2, 2), event(3, 3)}},
        {"responseData", QJsonArray{QJsonObject{{"request", QJsonObject{{"url", "https://a.test"}}}}}},
    };
    const qint64 before = QDateTime::currentMSecsSinceEpoch();
    const ImportResult result = ArchiveImporter().readArchive(zipOf({{"data.json", compact(legacy)}}));
    ASSERT_TRUE(result.success()) << result.error.toStdString();

    EXPECT_TRUE(result.legacy);
    ASSERT_EQ(result.sessions.size(), 1);
    const ImportedSession& session = result.sessions.first();
    EXPECT_GE(session.sessionId, before);
    EXPECT_EQ(session.events.size(), 3);
    EXPECT_EQ(session.entries.size(), 1);
    EXPECT_TRUE(session.hasFullSnapshot);
    EXPECT_EQ(result.eventCount(), 3);
    EXPECT_EQ(result.entryCount(), 1);
}

TEST(ArchiveImporterTest, PackagedArchiveIsReadBackThroughItsManifest) {
    const QList<SessionData> sessions{
        {100, QJsonArray{event(2, 1), event(3, 2)}, QJsonArray{}},
        {200, QJsonArray{event(3, 5)}, QJsonArray{QJsonObject{{"n", 1}}}},
    };
    const PackageResult packaged = Packager().package(sessions);
    ASSERT_TRUE(packaged.success());

    const ImportResult result = ArchiveImporter().readArchive(packaged.archive);
    ASSERT_TRUE(result.success()) << result.error.toStdString();
    EXPECT_FALSE(result.legacy);
    EXPECT_EQ(result.archiveVersion, Packager::kArchiveVersion);
    ASSERT_EQ(result.sessions.size(), 2);
    EXPECT_EQ(result.sessions.at(0).sessionId, 100);
    EXPECT_EQ(result.sessions.at(0).events, sessions.at(0).events);
    EXPECT_TRUE(result.sessions.at(0).hasFullSnapshot);
    EXPECT_EQ(result.sessions.at(1).sessionId, 200);
    EXPECT_FALSE(result.sessions.at(1).hasFullSnapshot);
    EXPECT_EQ(result.sessions.at(1).entries.size(), 1);
}

TEST(ArchiveImporterTest, SessionKeyedDocumentWithoutManifest) {
    const QJsonObject document{
        {"1700000000000", QJsonObject{{"eventData", QJsonArray{event(2, 1)}}, {"responseData", QJsonArray{}}}},
    };
    const ImportResult result = ArchiveImporter().readDocument(compact(document));
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.archiveVersion, 1);
    ASSERT_EQ(result.sessions.size(), 1);
    EXPECT_EQ(result.sessions.first().sessionId, 1700000000000);
}

TEST(ArchiveImporterTest, NonNumericKeyIsRejected) {
    const QJsonObject document{{"session-a", QJsonObject{{"eventData", QJsonArray{}}}}};
    const ImportResult result = ArchiveImporter().readDocument(compact(document));
    EXPECT_EQ(result.failure, FailureKind::InvalidArchive);
    EXPECT_TRUE(result.error.contains("session-a"));
}

TEST(ArchiveImporterTest, ManifestSessionMissingFromDataIsRejected) {
    const QJsonObject manifest{{"format", Packager::kArchiveFormat}, {"version", 2}, {"sessions", QJsonArray{"5"}}};
    const QByteArray archive = zipOf({
        {"data.json", compact(QJsonObject{{"6", QJsonObject{}}})},
        {"manifest.json", compact(manifest)},
    });
    const ImportResult result = ArchiveImporter().readArchive(archive);
    EXPECT_EQ(result.failure, FailureKind::InvalidArchive);
}

TEST(ArchiveImporterTest, NewerArchiveVersionIsRejected) {
    const QJsonObject manifest{{"format", Packager::kArchiveFormat}, {"version", 99}, {"sessions", QJsonArray{"5"}}};
    const QByteArray archive = zipOf({
        {"data.json", compact(QJsonObject{{"5", QJsonObject{}}})},
        {"manifest.json", compact(manifest)},
    });
    EXPECT_EQ(ArchiveImporter().readArchive(archive).failure, FailureKind::InvalidArchive);
}

TEST(ArchiveImporterTest, ArchiveWithoutDataFileIsRejected) {
    const ImportResult result = ArchiveImporter().readArchive(zipOf({{"other.json", "{}"}}));
    EXPECT_EQ(result.failure, FailureKind::InvalidArchive);
    EXPECT_EQ(result.error, "Invalid zip file: data.json not found");
}

TEST(ArchiveImporterTest, EmptyDocumentHasNoSessions) {
    const ImportResult result = ArchiveImporter().readDocument("{}");
    EXPECT_EQ(result.failure, FailureKind::InvalidArchive);
    EXPECT_FALSE(result.toJson().value("success").toBool());
}

TEST(ArchiveImporterTest, ReadFileSniffsZipAndJson) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QJsonObject legacy{{"eventData", QJsonArray{event(2, 1)}}, {"responseData", QJsonArray{}}};

    QFile json(dir.filePath("legacy.json"));
    ASSERT_TRUE(json.open(QIODevice::WriteOnly));
    json.write(compact(legacy));
    json.close();

    QFile zip(dir.filePath("legacy.zip"));
    ASSERT_TRUE(zip.open(QIODevice::WriteOnly));
    zip.write(zipOf({{"data.json", compact(legacy)}}));
    zip.close();

    EXPECT_TRUE(ArchiveImporter().readFile(json.fileName()).success());
    EXPECT_TRUE(ArchiveImporter().readFile(zip.fileName()).success());
    EXPECT_EQ(ArchiveImporter().readFile(dir.filePath("absent.zip")).failure, FailureKind::Io);
}

TEST(ArchiveImporterTest, LegacyDetectionLooksAtTopLevelEventData) {
    EXPECT_TRUE(ArchiveImporter::isLegacyDocument(QJsonObject{{"eventData", QJsonArray{}}}));
    EXPECT_FALSE(ArchiveImporter::isLegacyDocument(QJsonObject{{"123", QJsonObject{}}}));
    EXPECT_FALSE(ArchiveImporter::hasFullSnapshot(QJsonArray{event(3, 1), event(4, 2)}));
}

}  // namespace
}  // namespace reel
