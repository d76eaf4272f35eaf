#include "result_slot.h"

namespace hfactor {

FactorPair ordered_pair(const mpz_class& N, const mpz_class& d) {
    mpz_class other = N / d;
    if (d <= other) return FactorPair{d, other};
    return FactorPair{other, d};
}

bool ResultSlot::try_commit(const mpz_class& d, const std::string& writer) {
    if (d <= 1 || d >= N_) return false;
    if (mpz_divisible_p(N_.get_mpz_t(), d.get_mpz_t()) == 0) return false;

    FactorPair pair = ordered_pair(N_, d);
    {
        std::scoped_lock lk(mx_);
        if (value_) return false;
        value_ = std::move(pair);
        winner_ = writer;
    }
    cv_.notify_all();
    return true;
}

std::optional<FactorPair> ResultSlot::get() const {
    std::scoped_lock lk(mx_);
    return value_;
}

bool ResultSlot::filled() const {
    std::scoped_lock lk(mx_);
    return value_.has_value();
}

std::string ResultSlot::winner() const {
    std::scoped_lock lk(mx_);
    return winner_;
}

void ResultSlot::add_searcher() {
    std::scoped_lock lk(mx_);
    ++searchers_;
}

void ResultSlot::release_searcher() {
    {
        std::scoped_lock lk(mx_);
        if (searchers_ > 0) --searchers_;
    }
    cv_.notify_all();
}

unsigned ResultSlot::pending_searchers() const {
    std::scoped_lock lk(mx_);
    return searchers_;
}

bool ResultSlot::wait_until(std::chrono::steady_clock::time_point deadline, unsigned below) const {
    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait_until(lk, deadline, [this, below] { return value_.has_value() || searchers_ < below; });
    return value_.has_value();
}

} // namespace hfactor
