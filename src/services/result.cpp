#include "reel/result.hpp"

namespace reel {

QString failureKindName(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:
        return "none";
    case FailureKind::Transport:
        return "transport";
    case FailureKind::HttpStatus:
        return "http_status";
    case FailureKind::SizeLimit:
        return "size_limit";
    case FailureKind::Serialization:
        return "serialization";
    case FailureKind::Cancelled:
        return "cancelled";
    case FailureKind::Io:
        return "io";
    case FailureKind::InvalidArchive:
        return "invalid_archive";
    case FailureKind::Config:
        return "config";
    }
    return "unknown";
}

OperationResult OperationResult::ok(const QJsonObject& details) {
    OperationResult result;
    result.details = details;
    return result;
}

OperationResult OperationResult::fail(FailureKind kind, const QString& message, const QJsonObject& details) {
    OperationResult result;
    result.failure = kind;
    result.error = message;
    result.details = details;
    return result;
}

QJsonObject OperationResult::toJson() const {
    QJsonObject out = details;
    out.insert("success", success());
    if (!success()) {
        out.insert("error", error);
        out.insert("failure", failureKindName(failure));
    }
    return out;
}

}  // namespace reel
