#include "progress.h"

#include <algorithm>
#include <chrono>
#include <cstdio>

#include "deadline.h"

namespace hfactor {

HeartbeatMonitor::HeartbeatMonitor(const MonitorConfig& cfg, const std::vector<std::shared_ptr<Worker>>& workers)
    : cfg_(cfg) {
    if (!cfg_.registry) throw std::invalid_argument("heartbeat monitor needs a registry");
    if (!(cfg_.interval_sec > 0.0)) throw std::invalid_argument("monitor interval must be positive");
    if (!(cfg_.stall_after_sec > 0.0)) throw std::invalid_argument("stall_after_sec must be positive");
    for (const auto& w : workers) {
        if (w) workers_[w->name()] = w;
    }
    thread_ = std::thread([this]() { loop(); });
}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

void HeartbeatMonitor::watch(std::shared_ptr<Worker> w) {
    std::scoped_lock lk(mx_);
    const std::string name = w->name();
    workers_[name] = std::move(w);
}

void HeartbeatMonitor::stop() {
    {
        std::scoped_lock lk(mx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

std::vector<std::string> HeartbeatMonitor::stalled() const {
    std::scoped_lock lk(mx_);
    return std::vector<std::string>(stalled_.begin(), stalled_.end());
}

unsigned HeartbeatMonitor::samples() const {
    std::scoped_lock lk(mx_);
    return samples_;
}

void HeartbeatMonitor::loop() {
    using clock = std::chrono::steady_clock;
    const clock::duration period = std::max<clock::duration>(
            bounded_span(std::chrono::duration<double>(cfg_.interval_sec)), std::chrono::milliseconds(1));
    const auto t0 = clock::now();
    auto next = t0 + period;

    std::unique_lock<std::mutex> lk(mx_);
    for (;;) {
        if (cv_.wait_until(lk, next, [this] { return stopping_; })) break;
        lk.unlock();
        sample(std::chrono::duration<double>(clock::now() - t0).count());
        lk.lock();
        next += period;
    }
}

void HeartbeatMonitor::sample(double elapsed) {
    const auto now = std::chrono::steady_clock::now();
    const HeartbeatRegistry::Snapshot snap = cfg_.registry->snapshot();
    const double period = cfg_.interval_sec;
    std::map<std::string, std::shared_ptr<Worker>> watched;
    {
        std::scoped_lock lk(mx_);
        watched = workers_;
    }

    std::vector<std::string> quiet;
    for (const auto& [name, worker] : watched) {
        const Worker& w = *worker;
        auto it = snap.find(name);
        if (it == snap.end()) continue;
        const Heartbeat& hb = it->second;

        const double idle = std::chrono::duration<double>(now - hb.last).count();
        const bool running = !w.finished();
        if (running && idle > cfg_.stall_after_sec) quiet.push_back(w.name());

        if (cfg_.verbose) {
            const std::uint64_t before = prev_[name];
            const std::uint64_t d = (hb.progress >= before ? hb.progress - before : 0);
            std::fprintf(stderr,
                         "[heartbeat] t=%.1fs %s progress=%llu rate=%.3g/s idle=%.2fs%s\n",
                         elapsed,
                         w.name().c_str(),
                         static_cast<unsigned long long>(hb.progress),
                         static_cast<double>(d) / period,
                         idle,
                         running ? "" : " (done)"
            );
        }
        prev_[name] = hb.progress;
    }

    std::scoped_lock lk(mx_);
    ++samples_;
    for (auto& name : quiet) {
        if (stalled_.insert(name).second && cfg_.verbose) {
            std::fprintf(stderr, "[heartbeat] %s looks stalled (no beat for %.1fs)\n",
                         name.c_str(), cfg_.stall_after_sec);
        }
    }
}

} // namespace hfactor
