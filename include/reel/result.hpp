#pragma once

#include <QJsonObject>
#include <QString>

namespace reel {

enum class FailureKind {
    None,
    Transport,
    HttpStatus,
    SizeLimit,
    Serialization,
    Cancelled,
    Io,
    InvalidArchive,
    Config,
};

QString failureKindName(FailureKind kind);

// Outcome of an export/import/store-level operation. Detail fields are merged into toJson().
struct OperationResult {
    FailureKind failure = FailureKind::None;
    QString error;
    QJsonObject details;

    [[nodiscard]] bool success() const { return failure == FailureKind::None; }

    static OperationResult ok(const QJsonObject& details = {});
    static OperationResult fail(FailureKind kind, const QString& message, const QJsonObject& details = {});

    QJsonObject toJson() const;
};

}  // namespace reel
