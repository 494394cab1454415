#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include <atomic>
#include <memory>

#include "fake_http_client.hpp"
#include "reel/transfer_worker.hpp"

namespace reel {
namespace {

using test::FakeHttpClient;
using test::patternBytes;

class TransferWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.isValid());
        client_ = std::make_shared<FakeHttpClient>();
        worker_ = std::make_unique<TransferWorker>(client_);
        QObject::connect(worker_.get(), &TransferWorker::progressChanged, [this](const QJsonObject&) {
            ++progressReports_;
        });
        QObject::connect(worker_.get(), &TransferWorker::transferFinished, [this](const QJsonObject& result) {
            results_.append(result);
        });
    }

    QTemporaryDir dir_;
    std::shared_ptr<FakeHttpClient> client_;
    std::unique_ptr<TransferWorker> worker_;
    std::atomic<int> progressReports_{0};
    QList<QJsonObject> results_;
};

TEST_F(TransferWorkerTest, DownloadWritesTheMergedFile) {
    const QByteArray resource = patternBytes(10 * 1024);
    client_->setResource(resource);
    const QString path = dir_.filePath("out/recording.bin");

    worker_->download("https://files.test/r.bin", path, QJsonObject{
        {"chunk_size", 2048},
        {"concurrency", 2},
        {"retry_base_delay_ms", 1},
    });

    ASSERT_EQ(results_.size(), 1);
    EXPECT_TRUE(results_.first().value("success").toBool()) << results_.first().value("error").toString().toStdString();
    EXPECT_EQ(results_.first().value("kind").toString(), "download");
    EXPECT_EQ(results_.first().value("chunk_count").toInt(), 5);
    EXPECT_GT(progressReports_.load(), 0);

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), resource);
}

TEST_F(TransferWorkerTest, FailedDownloadLeavesNoFile) {
    client_->setResource(patternBytes(4096));
    client_->setHeadContentLength(false);
    const QString path = dir_.filePath("never.bin");

    worker_->download("https://files.test/r.bin", path, QJsonObject{});

    ASSERT_EQ(results_.size(), 1);
    EXPECT_FALSE(results_.first().value("success").toBool());
    EXPECT_FALSE(QFile::exists(path));
}

TEST_F(TransferWorkerTest, UploadSendsTheArchiveFile) {
    const QString path = dir_.filePath("record-5.zip");
    QFile archive(path);
    ASSERT_TRUE(archive.open(QIODevice::WriteOnly));
    archive.write("PK\x03\x04 archive body");
    archive.close();

    worker_->upload(path, QJsonObject{
        {"endpoint", "https://sink.test/upload"},
        {"platform", "web"},
        {"headers", QJsonObject{{"X-Token", "abc"}}},
    });

    ASSERT_EQ(results_.size(), 1);
    EXPECT_TRUE(results_.first().value("success").toBool());
    EXPECT_EQ(results_.first().value("kind").toString(), "upload");
    const HttpRequest request = client_->requests().first();
    EXPECT_EQ(request.formParts.first().fileName, "record-5.zip");
    EXPECT_EQ(headerValue(request.headers, "X-Token"), "abc");
}

TEST_F(TransferWorkerTest, UploadOfAMissingArchiveFails) {
    worker_->upload(dir_.filePath("absent.zip"), QJsonObject{{"endpoint", "https://sink.test/upload"}});

    ASSERT_EQ(results_.size(), 1);
    EXPECT_EQ(results_.first().value("failure").toString(), failureKindName(FailureKind::Io));
    EXPECT_EQ(client_->requestCount(), 0);
}

TEST_F(TransferWorkerTest, CancelIssuedBeforeTheSlotRunsIsKept) {
    const QString path = dir_.filePath("queued.zip");
    QFile archive(path);
    ASSERT_TRUE(archive.open(QIODevice::WriteOnly));
    archive.write("PK");
    archive.close();

    worker_->cancel();
    worker_->upload(path, QJsonObject{{"endpoint", "https://sink.test/upload"}});
    ASSERT_EQ(results_.size(), 1);
    EXPECT_EQ(results_.first().value("error").toString(), "Upload aborted");
    EXPECT_EQ(client_->requestCount(), 0);

    worker_->upload(path, QJsonObject{{"endpoint", "https://sink.test/upload"}});
    ASSERT_EQ(results_.size(), 2);
    EXPECT_TRUE(results_.last().value("success").toBool());
    EXPECT_EQ(client_->requestCount(), 1);
}

TEST_F(TransferWorkerTest, CancelDuringUploadAbortsIt) {
    const QString path = dir_.filePath("a.zip");
    QFile archive(path);
    ASSERT_TRUE(archive.open(QIODevice::WriteOnly));
    archive.write("PK");
    archive.close();

    client_->setHandler([this](const HttpRequest&, const TransferObserver& observer) {
        worker_->cancel();
        return observer.cancel.isCancelled() ? HttpResponse::transportFailure("Operation canceled")
                                             : HttpResponse::transportFailure("unexpected");
    });
    worker_->upload(path, QJsonObject{{"endpoint", "https://sink.test/upload"}});

    ASSERT_EQ(results_.size(), 1);
    EXPECT_EQ(results_.first().value("error").toString(), "Upload aborted");
}

}  // namespace
}  // namespace reel
