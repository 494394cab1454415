#pragma once

#include <QtGlobal>

#include <algorithm>
#include <functional>

namespace reel {

// Overall progress in percent, 0..100.
using ProgressFn = std::function<void(double percent)>;

// Slice [start, start + span] of an overall 0..100 progress scale given to one phase.
struct ProgressBudget {
    double start = 0.0;
    double span = 100.0;

    static ProgressBudget full() { return {0.0, 100.0}; }
    static ProgressBudget compressPhase() { return {0.0, 50.0}; }
    static ProgressBudget uploadPhase() { return {50.0, 50.0}; }

    [[nodiscard]] double end() const { return start + span; }

    [[nodiscard]] double scale(qint64 done, qint64 total) const {
        if (total <= 0) {
            return end();
        }
        const double fraction = std::clamp(static_cast<double>(done) / static_cast<double>(total), 0.0, 1.0);
        return start + span * fraction;
    }
};

}  // namespace reel
