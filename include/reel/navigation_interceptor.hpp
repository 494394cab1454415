#pragma once

#include <functional>
#include <memory>

#include "reel/navigation.hpp"

namespace reel {

// Emits one marker for the current location on install, then one per transition. The wrapped
// primitive always runs before the handler sees the new URL.
class NavigationInterceptor {
public:
    using Handler = std::function<void(const QString& url, NavigationTrigger trigger)>;

    NavigationInterceptor(NavigationHost& host, Handler handler);
    ~NavigationInterceptor();

    NavigationInterceptor(const NavigationInterceptor&) = delete;
    NavigationInterceptor& operator=(const NavigationInterceptor&) = delete;

    void install();
    void uninstall();
    [[nodiscard]] bool isActive() const { return installed_; }

private:
    void emitMarker(NavigationTrigger trigger);

    NavigationHost& host_;
    Handler handler_;
    std::shared_ptr<HistoryApi> original_;
    int popStateListener_ = 0;
    int hashChangeListener_ = 0;
    bool installed_ = false;
};

}  // namespace reel
