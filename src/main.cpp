#include <gmpxx.h>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "ReportArgs.h"
#include "ReportFile.h"
#include "factorizer.h"

using namespace hfactor;

static void usage() {
    std::cerr << "usage: hybrid_factor N [--trial-limit L] [--workers W] [--seconds S] "
                 "[--p1-base B] [--p1-max B] [--rho-max-iters K] [--seed S] [--grace-ms M] "
                 "[--monitor-sec S] [--stall-sec S] [--verbose] [--report]\n";
}

int main(int argc, char** argv) {
    if (argc < 2 || argv[1][0] == '-') {
        usage();
        return 2;
    }

    FactorizationRequest req;
    if (req.n.set_str(argv[1], 10) != 0) {
        std::cerr << "N: invalid decimal\n";
        return 2;
    }

    try {
        req.trial_limit = static_cast<unsigned long>(cli_ull(argc, argv, "trial-limit", req.trial_limit));
        req.worker_count = static_cast<unsigned>(cli_ull(argc, argv, "workers", req.worker_count));
        req.timeout = std::chrono::duration<double>(cli_double(argc, argv, "seconds", req.timeout.count()));
        req.p1_base_bound = static_cast<unsigned long>(cli_ull(argc, argv, "p1-base", req.p1_base_bound));
        req.p1_max_bound = static_cast<unsigned long>(cli_ull(argc, argv, "p1-max", req.p1_max_bound));
        req.rho_max_iterations = cli_ull(argc, argv, "rho-max-iters", req.rho_max_iterations);
        req.seed = cli_ull(argc, argv, "seed", req.seed);
        req.grace_period = std::chrono::duration<double>(
                cli_double(argc, argv, "grace-ms", req.grace_period.count() * 1000.0) / 1000.0);
        req.monitor_interval_sec = cli_double(argc, argv, "monitor-sec", req.monitor_interval_sec);
        req.stall_after_sec = cli_double(argc, argv, "stall-sec", req.stall_after_sec);
        req.verbose = has_cli_flag(argc, argv, "verbose");
        validate(req);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        usage();
        return 2;
    }

    FactorizeReport rep;
    try {
        rep = factorize(req);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    switch (rep.outcome) {
        case Outcome::TrialDivision:
        case Outcome::RaceWon:
            std::cout << "FOUND\n";
            break;
        case Outcome::ProvenPrime:
            std::cout << "PRIME\n";
            break;
        case Outcome::ProbablyPrime:
            std::cout << (rep.timed_out ? "PROBABLY PRIME (time limit)\n" : "PROBABLY PRIME\n");
            break;
        case Outcome::Trivial:
            std::cout << "UNIT\n";
            break;
    }
    std::cout << "p=" << rep.pair.p << "\n";
    std::cout << "q=" << rep.pair.q << "\n";
    std::cout << "outcome=" << to_string(rep.outcome) << "\n";
    if (!rep.winner.empty()) {
        std::cout << "winner=" << rep.winner << "\n";
        std::cout << "winner_progress=" << rep.winner_progress << "\n";
    }
    std::cout << "workers=" << rep.workers_spawned << "\n";
    if (rep.rho_restarts) std::cout << "rho_restarts=" << rep.rho_restarts << "\n";
    if (rep.stragglers) std::cout << "stragglers=" << rep.stragglers << "\n";
    for (const auto& name : rep.stalled_workers) std::cout << "stalled=" << name << "\n";
    std::cout << "time_sec=" << rep.elapsed_sec << "\n";

    if (has_cli_flag(argc, argv, "report")) {
        const ReportFile report;
        if (report.append(join_argv_for_log(argc, argv), req, rep)) {
            std::cerr << "[report] appended to " << report.path() << "\n";
        } else {
            std::cerr << "[report] could not write " << report.path() << "\n";
        }
    }

    return rep.found ? 0 : 1;
}
