#pragma once

#include <QAtomicInteger>
#include <QDeadlineTimer>

#include <memory>

namespace reel {

// Shared cancel flag with an optional deadline. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    static CancellationToken withTimeout(qint64 timeoutMs) {
        CancellationToken token;
        token.state_->deadline.setRemainingTime(timeoutMs);
        return token;
    }

    // Child token that trips when this one does or when its own deadline passes. Cancelling the
    // child leaves this token untouched.
    [[nodiscard]] CancellationToken withDeadline(qint64 timeoutMs) const {
        CancellationToken token = withTimeout(timeoutMs);
        token.state_->parent = state_;
        return token;
    }

    void cancel() const { state_->cancelled.storeRelease(1); }

    [[nodiscard]] bool isCancelled() const {
        for (const State* state = state_.get(); state != nullptr; state = state->parent.get()) {
            if (state->cancelled.loadAcquire() != 0 || state->deadline.hasExpired()) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] bool deadlineExpired() const {
        for (const State* state = state_.get(); state != nullptr; state = state->parent.get()) {
            if (state->deadline.hasExpired()) {
                return true;
            }
        }
        return false;
    }

private:
    struct State {
        QAtomicInteger<int> cancelled{0};
        QDeadlineTimer deadline{QDeadlineTimer::Forever};
        std::shared_ptr<const State> parent;
    };

    std::shared_ptr<State> state_;
};

}  // namespace reel
