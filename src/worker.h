#pragma once
#include <gmpxx.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "heartbeat.h"
#include "result_slot.h"
#include "stop_signal.h"

namespace hfactor {

// State shared by every worker of one race. Owned jointly (shared_ptr) by the
// coordinator and the workers, so a straggler can outlive factorize().
struct RaceContext {
    explicit RaceContext(const mpz_class& n, bool verbose_logs = false)
        : N(n), slot(n), verbose(verbose_logs) {}

    const mpz_class N;
    StopSignal stop;
    ResultSlot slot;
    HeartbeatRegistry heartbeats;
    const bool verbose;

    // Commits divisor d for `writer` and raises the stop signal if the write was
    // accepted. Returns false for invalid d or when the slot is already taken.
    bool publish(const mpz_class& d, const std::string& writer);
};

// A factoring algorithm running on its own thread.
//
// start() returns immediately; join() blocks until the search loop exits (factor
// found, budget exhausted, or stop observed). Instances must be owned by a
// shared_ptr before start() is called.
class Worker : public std::enable_shared_from_this<Worker> {
public:
    Worker(std::shared_ptr<RaceContext> ctx, std::string name);
    virtual ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start();
    void join();
    // Waits at most `limit`; joins and returns true if the worker finished.
    bool join_for(std::chrono::duration<double> limit);
    // Gives up on a worker that ignored the stop signal.
    void detach();

    bool finished() const;
    bool succeeded() const { return succeeded_.load(std::memory_order_acquire); }
    const std::string& name() const { return name_; }
    std::uint64_t progress() const { return progress_.load(std::memory_order_relaxed); }

    virtual const char* kind() const = 0;

protected:
    // Returns any candidate divisor, or nullopt when the search ends without one.
    virtual std::optional<mpz_class> search() = 0;

    // Records progress in the heartbeat registry, then polls the stop signal.
    // Returns false when the worker should stop.
    bool checkpoint(std::uint64_t progress);

    const RaceContext& context() const { return *ctx_; }
    void log(const std::string& msg) const;

private:
    void run();

    std::shared_ptr<RaceContext> ctx_;
    const std::string name_;
    std::thread thread_;
    std::promise<void> done_;
    std::future<void> done_future_;
    std::atomic<std::uint64_t> progress_{0};
    std::atomic<bool> succeeded_{false};
};

} // namespace hfactor
