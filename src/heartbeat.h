#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace hfactor {

struct Heartbeat {
    std::uint64_t beats = 0;		// number of beat() calls
    std::uint64_t progress = 0;		// iterations / prime powers done, never decreases
    std::chrono::steady_clock::time_point last{};
};

// Per-worker liveness counters. Each entry is written only by its owner; the
// coordinator and monitor read snapshots. Not a correctness signal.
class HeartbeatRegistry {
public:
    using Snapshot = std::map<std::string, Heartbeat>;

    // Creates the entry with last = now and zero progress.
    void enroll(const std::string& worker);

    // progress below the stored value is ignored (counter stays monotone).
    void beat(const std::string& worker, std::uint64_t progress);

    Snapshot snapshot() const;

private:
    mutable std::mutex mx_;
    Snapshot beats_;
};

} // namespace hfactor
