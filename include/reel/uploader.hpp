#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "reel/cancellation.hpp"
#include "reel/http_client.hpp"
#include "reel/packager.hpp"
#include "reel/progress.hpp"
#include "reel/result.hpp"

namespace reel {

struct UploadOptions {
    QString endpoint;
    HeaderList headers;
    QString platform;
    QString deviceId;
    QString jiraId;
    int timeoutMs = 5 * 60 * 1000;
};

// Structured acknowledgment returned by the sink. sessionId is kept as text.
struct UploadAck {
    bool success = false;
    QString sessionId;
    QString createdAt;
    QString jiraId;
    QString platform;
    QString deviceId;
    QString error;
    QJsonObject raw;

    QJsonObject toJson() const;
};

struct UploadResult {
    FailureKind failure = FailureKind::None;
    QString error;
    int status = 0;
    qint64 archiveBytes = 0;
    UploadAck ack;

    [[nodiscard]] bool success() const { return failure == FailureKind::None; }
    QJsonObject toJson() const;
};

class Uploader {
public:
    static constexpr qint64 kMaxArchiveBytes = 20LL * 1024 * 1024;
    static constexpr int kDefaultTimeoutMs = 5 * 60 * 1000;

    explicit Uploader(HttpClient& client);

    UploadResult upload(
        const QByteArray& archive,
        const QString& fileName,
        const UploadOptions& options,
        const ProgressFn& progress = {},
        ProgressBudget budget = ProgressBudget::uploadPhase(),
        const CancellationToken& cancel = {}) const;

    // Compresses into the first half of the progress scale, transfers in the second half.
    UploadResult packageAndUpload(
        const Packager& packager,
        const QList<SessionData>& sessions,
        const UploadOptions& options,
        const ProgressFn& progress = {},
        const CancellationToken& cancel = {}) const;

    // Returns false when body is not a JSON object.
    static bool parseAck(const QByteArray& body, UploadAck* ack);

private:
    HttpClient& client_;
};

}  // namespace reel
