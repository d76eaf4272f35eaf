#include "factorizer.h"

#include <algorithm>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>

#include "log.h"
#include "numeric.h"
#include "pollard_p1.h"
#include "pollard_rho.h"
#include "progress.h"
#include "worker.h"

namespace hfactor {

const char* to_string(Outcome o) {
    switch (o) {
        case Outcome::Trivial:			return "trivial";
        case Outcome::TrialDivision:	return "trial-division";
        case Outcome::ProvenPrime:		return "proven-prime";
        case Outcome::RaceWon:			return "race-won";
        case Outcome::ProbablyPrime:	return "probably-prime";
    }
    return "unknown";
}

void validate(const FactorizationRequest& req) {
    if (req.n < 1) throw std::invalid_argument("N must be a positive integer");
    if (req.trial_limit < 1) throw std::invalid_argument("trial_limit must be >= 1");
    if (req.worker_count < 1) throw std::invalid_argument("worker_count must be >= 1");
    if (!(req.timeout.count() > 0.0)) throw std::invalid_argument("timeout must be positive");
    if (req.p1_base_bound < 2) throw std::invalid_argument("p1_base_bound must be >= 2");
    if (req.p1_max_bound < req.p1_base_bound)
        throw std::invalid_argument("p1_max_bound must be >= p1_base_bound");
    if (req.grace_period.count() < 0.0) throw std::invalid_argument("grace_period must be >= 0");
    if (req.monitor_interval_sec < 0.0) throw std::invalid_argument("monitor_interval_sec must be >= 0");
}

static std::uint64_t fresh_seed() {
    std::random_device rd;
    std::uint64_t s = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    return s ? s : 1;
}

static std::string describe(const FactorPair& pr) {
    std::ostringstream os;
    os << "p=" << pr.p << " q=" << pr.q;
    return os.str();
}

FactorizeReport factorize(const FactorizationRequest& req) {
    validate(req);

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    const mpz_class& N = req.n;
    FactorizeReport rep;

    auto conclude = [&](FactorPair pair, Outcome outcome) {
        rep.pair = std::move(pair);
        rep.outcome = outcome;
        rep.found = (rep.pair.p > 1);
        rep.elapsed_sec = std::chrono::duration<double>(clock::now() - t0).count();
        if (req.verbose) {
            std::ostringstream os;
            os << "outcome=" << to_string(outcome) << " " << describe(rep.pair)
               << " time_sec=" << rep.elapsed_sec;
            log_line("race", os.str());
        }
        return rep;
    };

    if (N == 1) return conclude(FactorPair{1, 1}, Outcome::Trivial);

    // -------- pre-filter: sequential, no threads --------
    const mpz_class root = isqrt(N);
    const bool root_fits = root.fits_ulong_p() != 0;
    const unsigned long scan = root_fits ? std::min(req.trial_limit, root.get_ui()) : req.trial_limit;
    if (std::optional<mpz_class> d = trial_division(N, scan)) {
        return conclude(ordered_pair(N, *d), Outcome::TrialDivision);
    }
    if (root_fits && req.trial_limit >= root.get_ui()) {
        return conclude(FactorPair{1, N}, Outcome::ProvenPrime);
    }

    // -------- race --------
    auto ctx = std::make_shared<RaceContext>(N, req.verbose);
    const std::uint64_t seed = req.seed ? req.seed : fresh_seed();
    std::uint64_t next_seed = seed;

    auto make_rho = [&](unsigned lane) {
        RhoParams rp = RhoParams::from_seed(N, next_seed++);
        rp.max_iterations = req.rho_max_iterations;
        return std::make_shared<PollardRhoWorker>(ctx, std::move(rp), "rho#" + std::to_string(lane));
    };

    // [0] is p-1 (reset once it gives up), [i] is rho lane i.
    std::vector<std::shared_ptr<Worker>> active;
    active.reserve(req.worker_count + 1u);
    {
        P1Params p1;
        p1.base_bound = req.p1_base_bound;
        p1.max_bound = req.p1_max_bound;
        active.push_back(std::make_shared<PollardP1Worker>(ctx, p1));
    }
    for (unsigned i = 1; i <= req.worker_count; ++i) active.push_back(make_rho(i));

    if (req.verbose) {
        std::ostringstream os;
        os << "N=" << N << " (" << mpz_sizeinbase(N.get_mpz_t(), 10) << " digits) trial_limit="
           << req.trial_limit << " workers=1+" << req.worker_count << " timeout=" << req.timeout.count()
           << "s seed=" << seed;
        log_line("race", os.str());
    }

    std::unique_ptr<HeartbeatMonitor> monitor;

    // Stops and joins everything started so far; used before an error leaves.
    auto abandon = [&]() {
        ctx->stop.request();
        if (monitor) monitor->stop();
        for (auto& w : active) {
            if (w) w->join();
        }
    };

    const auto race_start = clock::now();
    try {
        for (auto& w : active) {
            w->start();
            ++rep.workers_spawned;
        }
        if (req.monitor_interval_sec > 0.0) {
            MonitorConfig mc{&ctx->heartbeats, req.monitor_interval_sec, req.stall_after_sec, req.verbose};
            monitor = std::make_unique<HeartbeatMonitor>(mc, active);
        }
    } catch (const std::exception&) {
        abandon();
        throw;
    }

    // -------- arbitration --------
    // Only the deadline or a committed factor ends the race. A rho walk that closes
    // its cycle is replaced by a fresh one on the next seed.
    const auto deadline = race_start + bounded_span(req.timeout);
    for (;;) {
        const auto live = static_cast<unsigned>(
                std::count_if(active.begin(), active.end(), [](const auto& w) { return w != nullptr; }));
        if (ctx->slot.wait_until(deadline, live)) break;
        if (clock::now() >= deadline) {
            rep.timed_out = true;
            break;
        }
        try {
            for (std::size_t i = 0; i < active.size(); ++i) {
                if (!active[i] || !active[i]->finished()) continue;
                if (ctx->slot.filled()) break;
                active[i]->join();
                if (i == 0) {
                    active[i].reset();
                    continue;
                }
                active[i] = make_rho(static_cast<unsigned>(i));
                active[i]->start();
                ++rep.workers_spawned;
                ++rep.rho_restarts;
                if (monitor) monitor->watch(active[i]);
                if (req.verbose) log_line("race", active[i]->name() + " restarted on a new seed");
            }
        } catch (const std::exception&) {
            abandon();
            throw;
        }
    }

    // -------- wind-down --------
    ctx->stop.request();
    const auto grace_end = clock::now() + bounded_span(req.grace_period);
    for (auto& w : active) {
        if (!w) continue;
        auto left = std::max(clock::duration::zero(), grace_end - clock::now());
        if (w->join_for(left)) continue;
        w->detach();
        ++rep.stragglers;
        log_line("race", w->name() + " ignored the stop signal; detached");
    }

    if (monitor) {
        monitor->stop();
        rep.stalled_workers = monitor->stalled();
    }
    rep.heartbeats = ctx->heartbeats.snapshot();

    // -------- conclude --------
    if (std::optional<FactorPair> pr = ctx->slot.get()) {
        rep.winner = ctx->slot.winner();
        rep.timed_out = false;
        for (auto& w : active) {
            if (w && w->succeeded()) rep.winner_progress = w->progress();
        }
        if (req.verbose) log_line("race", "winner " + rep.winner);
        return conclude(std::move(*pr), Outcome::RaceWon);
    }
    if (req.verbose) {
        log_line("race", "timeout without a factor");
    }
    return conclude(FactorPair{1, N}, Outcome::ProbablyPrime);
}

FactorPair factorize(const mpz_class& n, unsigned long trial_limit, unsigned worker_count,
                     std::chrono::duration<double> timeout) {
    FactorizationRequest req;
    req.n = n;
    req.trial_limit = trial_limit;
    req.worker_count = worker_count;
    req.timeout = timeout;
    return factorize(req).pair;
}

} // namespace hfactor
