#pragma once

#include <QJsonObject>
#include <QMutex>
#include <QObject>
#include <QString>

#include <memory>

#include "reel/cancellation.hpp"
#include "reel/http_client.hpp"

namespace reel {

// Background worker that runs chunked downloads and archive uploads off the caller's thread.
class TransferWorker final : public QObject {
    Q_OBJECT

public:
    explicit TransferWorker(std::shared_ptr<HttpClient> client, QObject* parent = nullptr);

    // Thread-safe; aborts the running transfer at its next suspension point. A cancel issued while
    // idle applies to the next transfer. The token is renewed when a transfer finishes.
    void cancel();

public slots:
    void download(const QString& url, const QString& outputPath, const QJsonObject& options);
    void upload(const QString& archivePath, const QJsonObject& options);

signals:
    void progressChanged(const QJsonObject& progress);
    void transferFinished(const QJsonObject& result);

private:
    bool begin(const QString& kind);
    void finish(const QString& kind, QJsonObject result);

    std::shared_ptr<HttpClient> client_;
    QMutex mutex_;
    CancellationToken cancel_;
    bool busy_ = false;
};

}  // namespace reel
