#include "worker.h"

#include <sstream>
#include <system_error>

#include "log.h"

namespace hfactor {

bool RaceContext::publish(const mpz_class& d, const std::string& writer) {
    if (!slot.try_commit(d, writer)) return false;
    stop.request();
    return true;
}

Worker::Worker(std::shared_ptr<RaceContext> ctx, std::string name)
    : ctx_(std::move(ctx)), name_(std::move(name)), done_future_(done_.get_future()) {}

Worker::~Worker() {
    if (!thread_.joinable()) return;
    // Last reference dropped by the worker thread itself.
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

void Worker::start() {
    ctx_->heartbeats.enroll(name_);
    ctx_->slot.add_searcher();
    try {
        thread_ = std::thread([self = shared_from_this()]() { self->run(); });
    } catch (const std::system_error&) {
        ctx_->slot.release_searcher();
        throw;
    }
}

void Worker::run() {
    try {
        std::optional<mpz_class> d = search();
        if (d && ctx_->publish(*d, name_)) {
            succeeded_.store(true, std::memory_order_release);
            if (ctx_->verbose) {
                std::ostringstream os;
                os << "factor " << *d << " committed after " << progress() << " steps";
                log(os.str());
            }
        } else if (d && ctx_->verbose) {
            log("found a factor but the slot was already taken");
        }
    } catch (const std::exception& e) {
        log(std::string("stopped without result: ") + e.what());
    }
    // finished() must already hold when the coordinator wakes on the release.
    done_.set_value();
    ctx_->slot.release_searcher();
}

void Worker::join() {
    if (thread_.joinable()) thread_.join();
}

bool Worker::join_for(std::chrono::duration<double> limit) {
    if (!thread_.joinable()) return finished();
    if (done_future_.wait_for(limit) != std::future_status::ready) return false;
    thread_.join();
    return true;
}

void Worker::detach() {
    if (thread_.joinable()) thread_.detach();
}

bool Worker::finished() const {
    return done_future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool Worker::checkpoint(std::uint64_t progress) {
    progress_.store(progress, std::memory_order_relaxed);
    ctx_->heartbeats.beat(name_, progress);
    return !ctx_->stop.requested();
}

void Worker::log(const std::string& msg) const {
    log_line(name_, msg);
}

} // namespace hfactor
