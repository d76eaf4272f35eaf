#pragma once
#include <atomic>

namespace hfactor {

// Shared cancellation flag: false -> true once, never cleared.
class StopSignal {
public:
    // Returns true only for the call that made the transition.
    bool request() noexcept {
        return !flag_.exchange(true, std::memory_order_acq_rel);
    }

    bool requested() const noexcept {
        return flag_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> flag_{false};
};

} // namespace hfactor
