#include "pollard_rho.h"

#include "numeric.h"

namespace hfactor {

RhoParams RhoParams::from_seed(const mpz_class& N, std::uint64_t seed) {
    RhoParams rp;
    if (N <= 4) return rp;
    gmp_randclass rng(gmp_randinit_mt);
    rng.seed(static_cast<unsigned long>(seed));
    mpz_class r = rng.get_z_range(mpz_class(N - 3));
    rp.c = r + 1;
    rp.x0 = rng.get_z_range(N);
    return rp;
}

PollardRhoWorker::PollardRhoWorker(std::shared_ptr<RaceContext> ctx, RhoParams params, std::string name)
    : Worker(std::move(ctx), std::move(name)), params_(std::move(params)) {
    if (params_.batch == 0) params_.batch = 1;
}

std::optional<mpz_class> PollardRhoWorker::search() {
    const mpz_class& N = context().N;
    if (N < 4) return std::nullopt;
    if (mpz_even_p(N.get_mpz_t())) return mpz_class(2);	// x^2 + c never splits 4

    const mpz_class c = params_.c;
    const std::uint64_t budget = params_.max_iterations;

    // v = v^2 + c mod N
    auto step = [&](mpz_class& v) {
        mpz_mul(v.get_mpz_t(), v.get_mpz_t(), v.get_mpz_t());
        mpz_add(v.get_mpz_t(), v.get_mpz_t(), c.get_mpz_t());
        mpz_mod(v.get_mpz_t(), v.get_mpz_t(), N.get_mpz_t());
    };

    mpz_class x;
    mpz_mod(x.get_mpz_t(), params_.x0.get_mpz_t(), N.get_mpz_t());
    mpz_class y = x;
    mpz_class x_saved, y_saved, diff, q, g;
    std::uint64_t it = 0;

    while (budget == 0 || it < budget) {
        x_saved = x;
        y_saved = y;
        q = 1;
        unsigned steps = 0;
        for (; steps < params_.batch && (budget == 0 || it < budget); ++steps, ++it) {
            step(x);
            step(y);
            step(y);
            mpz_sub(diff.get_mpz_t(), x.get_mpz_t(), y.get_mpz_t());
            mpz_abs(diff.get_mpz_t(), diff.get_mpz_t());
            mpz_mul(q.get_mpz_t(), q.get_mpz_t(), diff.get_mpz_t());
            mpz_mod(q.get_mpz_t(), q.get_mpz_t(), N.get_mpz_t());
        }

        g = gcd(q, N);
        if (g > 1 && g < N) return g;
        if (g == N) {
            // Product collapsed to 0 mod N: walk the batch again step by step.
            x = x_saved;
            y = y_saved;
            for (unsigned s = 0; s < steps; ++s) {
                step(x);
                step(y);
                step(y);
                mpz_sub(diff.get_mpz_t(), x.get_mpz_t(), y.get_mpz_t());
                mpz_abs(diff.get_mpz_t(), diff.get_mpz_t());
                g = gcd(diff, N);
                if (g > 1 && g < N) return g;
                if (g == N) break;
            }
            if (context().verbose) log("cycle closed without a factor (c=" + c.get_str() + ")");
            return std::nullopt;
        }

        if (!checkpoint(it)) return std::nullopt;
    }

    if (context().verbose) log("iteration budget exhausted");
    return std::nullopt;
}

} // namespace hfactor
