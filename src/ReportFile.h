#pragma once
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

#include "factorizer.h"

namespace hfactor {

// Append-only log of hybrid_factor runs, one block per `--report` run.
class ReportFile {
public:
    // HYBRID_FACTOR_REPORT_FILE when set, else factor_reports.txt in the working directory.
    static std::string default_path() {
        const char* env = std::getenv("HYBRID_FACTOR_REPORT_FILE");
        return (env && *env) ? std::string(env) : std::string("factor_reports.txt");
    }

    explicit ReportFile(std::string path = default_path()) : path_(std::move(path)) {}

    const std::string& path() const { return path_; }

    // Block for one run: UTC stamp, the command line, the request and what came of it.
    static std::string format(const std::string& cmdline, const FactorizationRequest& req,
                              const FactorizeReport& rep) {
        const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        gmtime_r(&t, &tm);

        std::ostringstream os;
        os << "=== " << std::put_time(&tm, "%Y-%m-%d %H:%M:%SZ") << " ===\n"
           << "cmd: " << cmdline << "\n"
           << "N=" << req.n << " trial_limit=" << req.trial_limit << " workers=1+" << req.worker_count
           << " timeout=" << req.timeout.count() << "s\n"
           << "outcome=" << to_string(rep.outcome) << (rep.timed_out ? " (time limit)" : "") << "\n"
           << "p=" << rep.pair.p << "\n"
           << "q=" << rep.pair.q << "\n";
        if (!rep.winner.empty()) os << "winner=" << rep.winner << " progress=" << rep.winner_progress << "\n";
        os << "spawned=" << rep.workers_spawned << " rho_restarts=" << rep.rho_restarts
           << " stragglers=" << rep.stragglers << "\n";
        for (const auto& name : rep.stalled_workers) os << "stalled=" << name << "\n";
        os << "time_sec=" << rep.elapsed_sec << "\n";
        return os.str();
    }

    // Returns false when the file cannot be opened or written.
    bool append(const std::string& cmdline, const FactorizationRequest& req, const FactorizeReport& rep) const {
        std::ofstream out(path_, std::ios::out | std::ios::app);
        if (!out) return false;
        out << format(cmdline, req, rep);
        out.flush();
        return static_cast<bool>(out);
    }

private:
    std::string path_;
};

} // namespace hfactor
