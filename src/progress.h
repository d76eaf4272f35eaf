#pragma once
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "heartbeat.h"
#include "worker.h"

namespace hfactor {

struct MonitorConfig {
    const HeartbeatRegistry*	registry;			// beats written by the workers
    double						interval_sec;		// sampling period, e.g. 1.0
    double						stall_after_sec;	// idle longer than this => stalled
    bool						verbose;			// print a [heartbeat] line per sample
};

// Samples the heartbeat registry on its own thread while a race runs.
// Observability only: a stalled worker is reported, never restarted.
// Throws std::invalid_argument for a missing registry or a non-positive period or
// stall threshold, before the sampler thread exists.
class HeartbeatMonitor {
public:
    HeartbeatMonitor(const MonitorConfig& cfg, const std::vector<std::shared_ptr<Worker>>& workers);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    // Samples `w` from now on, replacing any earlier worker with the same name.
    void watch(std::shared_ptr<Worker> w);

    // Wakes the sampler and joins it. Safe to call more than once.
    void stop();

    // Running workers that went quiet for longer than stall_after_sec at any sample.
    std::vector<std::string> stalled() const;
    unsigned samples() const;

private:
    void loop();
    void sample(double elapsed);

    const MonitorConfig cfg_;
    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<Worker>> workers_;
    bool stopping_ = false;
    unsigned samples_ = 0;
    std::set<std::string> stalled_;
    std::map<std::string, std::uint64_t> prev_;		// sampler thread only
    std::thread thread_;
};

} // namespace hfactor
