#pragma once
#include "worker.h"

namespace hfactor {

struct P1Params {
    unsigned long base_bound = 1000;		// first smoothness bound B
    unsigned long max_bound = 100000;		// bound grows x10 per stage up to this
    unsigned batch = 32;					// prime powers between gcd checks
};

// Pollard's p-1: finds p | N when p - 1 is B-smooth.
class PollardP1Worker : public Worker {
public:
    PollardP1Worker(std::shared_ptr<RaceContext> ctx, P1Params params, std::string name = "p-1");

    const char* kind() const override { return "p-1"; }
    const P1Params& params() const { return params_; }

protected:
    std::optional<mpz_class> search() override;

private:
    P1Params params_;
};

} // namespace hfactor
