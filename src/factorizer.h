#pragma once
#include <gmpxx.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "deadline.h"
#include "heartbeat.h"
#include "result_slot.h"

namespace hfactor {

struct FactorizationRequest {
    mpz_class n;
    unsigned long trial_limit = 1000;
    unsigned worker_count = 4;							// rho instances (plus one p-1)
    std::chrono::duration<double> timeout{10.0};

    unsigned long p1_base_bound = 1000;
    unsigned long p1_max_bound = 100000;
    std::uint64_t rho_max_iterations = 0;				// 0 = until stopped
    std::uint64_t seed = 0;								// 0 = std::random_device
    std::chrono::duration<double> grace_period{0.1};	// one wind-down window shared by all workers
    double monitor_interval_sec = 1.0;					// 0 disables the monitor
    double stall_after_sec = 2.0;
    bool verbose = false;
};

enum class Outcome {
    Trivial,		// N == 1
    TrialDivision,	// pre-filter found a divisor, no threads spawned
    ProvenPrime,	// trial division covered [2, isqrt(N)]
    RaceWon,		// a worker committed a factor
    ProbablyPrime	// deadline passed without a factor
};

const char* to_string(Outcome o);

struct FactorizeReport {
    FactorPair pair;
    Outcome outcome = Outcome::Trivial;
    bool found = false;					// pair is nontrivial
    bool timed_out = false;				// deadline passed before the race resolved
    std::string winner;					// worker that committed the pair
    std::uint64_t winner_progress = 0;
    unsigned workers_spawned = 0;		// restarts included
    unsigned rho_restarts = 0;			// rho walks replaced after closing without a factor
    unsigned stragglers = 0;			// detached after the grace period
    std::vector<std::string> stalled_workers;
    HeartbeatRegistry::Snapshot heartbeats;
    double elapsed_sec = 0.0;
};

// Throws std::invalid_argument for N < 1, trial_limit < 1, worker_count < 1,
// a non-positive timeout, inconsistent p-1 bounds or a negative grace period.
// Timers longer than kLongestWait are capped, not rejected. Monitor settings are
// checked by HeartbeatMonitor when the race starts.
void validate(const FactorizationRequest& req);

// Splits N into (p, q), p <= q, p*q == N. (1, 1) for N == 1 and (1, N) when N is
// prime or no factor was found before the timeout.
FactorizeReport factorize(const FactorizationRequest& req);

FactorPair factorize(const mpz_class& n, unsigned long trial_limit, unsigned worker_count,
                     std::chrono::duration<double> timeout);

} // namespace hfactor
