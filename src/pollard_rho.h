#pragma once
#include "worker.h"

namespace hfactor {

struct RhoParams {
    mpz_class x0 = 2;					// starting value
    mpz_class c = 1;					// f(x) = x^2 + c mod N
    std::uint64_t max_iterations = 0;	// 0 = run until stopped or the cycle closes
    unsigned batch = 64;				// Floyd steps between gcd checks

    // Distinct seeds give statistically independent (x0, c) walks.
    // c is drawn from [1, N-3] so neither x^2 nor x^2 - 2 is used.
    static RhoParams from_seed(const mpz_class& N, std::uint64_t seed);
};

// Pollard's rho with Floyd cycle detection.
class PollardRhoWorker : public Worker {
public:
    PollardRhoWorker(std::shared_ptr<RaceContext> ctx, RhoParams params, std::string name = "rho");

    const char* kind() const override { return "rho"; }
    const RhoParams& params() const { return params_; }

protected:
    std::optional<mpz_class> search() override;

private:
    RhoParams params_;
};

} // namespace hfactor
