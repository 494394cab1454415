#pragma once

#include "reel/http_client.hpp"

namespace reel {

// QNetworkAccessManager-backed client. Each call runs a local event loop in the calling thread,
// so it may be used from worker threads.
class NetworkHttpClient final : public HttpClient {
public:
    NetworkHttpClient() = default;

    using HttpClient::execute;
    HttpResponse execute(const HttpRequest& request, const TransferObserver& observer) override;

private:
    int cancelPollIntervalMs_ = 50;
};

}  // namespace reel
