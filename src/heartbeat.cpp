#include "heartbeat.h"

namespace hfactor {

void HeartbeatRegistry::enroll(const std::string& worker) {
    std::scoped_lock lk(mx_);
    Heartbeat& hb = beats_[worker];
    hb.last = std::chrono::steady_clock::now();
}

void HeartbeatRegistry::beat(const std::string& worker, std::uint64_t progress) {
    const auto now = std::chrono::steady_clock::now();
    std::scoped_lock lk(mx_);
    Heartbeat& hb = beats_[worker];
    ++hb.beats;
    if (progress > hb.progress) hb.progress = progress;
    hb.last = now;
}

HeartbeatRegistry::Snapshot HeartbeatRegistry::snapshot() const {
    std::scoped_lock lk(mx_);
    return beats_;
}

} // namespace hfactor
