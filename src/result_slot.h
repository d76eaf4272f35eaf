#pragma once
#include <gmpxx.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace hfactor {

struct FactorPair {
    mpz_class p;
    mpz_class q;
};

inline bool operator==(const FactorPair& a, const FactorPair& b) {
    return a.p == b.p && a.q == b.q;
}

// (min(d, N/d), max(d, N/d)); d must divide N.
FactorPair ordered_pair(const mpz_class& N, const mpz_class& d);

// Single-assignment cell for the winning factor pair.
//
// Once filled it always holds p*q == N with 1 < p <= q < N; later commits are
// rejected. The slot also counts searchers that have not exited yet, so the
// coordinator wakes as soon as one of them leaves without a result.
class ResultSlot {
public:
    explicit ResultSlot(mpz_class N) : N_(std::move(N)) {}

    ResultSlot(const ResultSlot&) = delete;
    ResultSlot& operator=(const ResultSlot&) = delete;

    // Stores the pair built from divisor d if the slot is still empty and d is a
    // nontrivial divisor of N. Returns true only for the accepted write.
    bool try_commit(const mpz_class& d, const std::string& writer);

    std::optional<FactorPair> get() const;
    bool filled() const;
    std::string winner() const;

    void add_searcher();
    void release_searcher();
    unsigned pending_searchers() const;

    // Blocks until the slot is filled, fewer than `below` searchers remain, or the
    // deadline passes. Returns filled().
    bool wait_until(std::chrono::steady_clock::time_point deadline, unsigned below) const;

private:
    const mpz_class N_;
    mutable std::mutex mx_;
    mutable std::condition_variable cv_;
    std::optional<FactorPair> value_;
    std::string winner_;
    unsigned searchers_ = 0;
};

} // namespace hfactor
