#include "reel/http_client.hpp"

namespace reel {

QString transportKindName(TransportKind kind) {
    return kind == TransportKind::Request ? "xhr" : "fetch";
}

QString headerValue(const HeaderList& headers, const QString& name) {
    for (const auto& header : headers) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            return header.second;
        }
    }
    return {};
}

HttpResponse HttpResponse::transportFailure(const QString& message) {
    HttpResponse response;
    response.status = 0;
    response.statusText = message;
    response.errorString = message;
    return response;
}

}  // namespace reel
