#include "pollard_p1.h"

#include <algorithm>
#include <vector>

#include "numeric.h"

namespace hfactor {

namespace {
enum class Verdict { Continue, Found, Exhausted };
}

PollardP1Worker::PollardP1Worker(std::shared_ptr<RaceContext> ctx, P1Params params, std::string name)
    : Worker(std::move(ctx), std::move(name)), params_(params) {
    if (params_.batch == 0) params_.batch = 1;
}

std::optional<mpz_class> PollardP1Worker::search() {
    const mpz_class& N = context().N;
    if (N < 4) return std::nullopt;

    const unsigned long top = std::max(params_.base_bound, params_.max_bound);
    const std::vector<unsigned long> primes = primes_up_to(top);
    std::vector<unsigned long> applied(primes.size(), 1ul);	// q^k already folded into a

    mpz_class a = 2;
    mpz_class saved = a;				// a at the last clean gcd
    std::vector<unsigned long> pending;	// exponents applied since `saved`
    mpz_class g;
    std::uint64_t done = 0;

    // g = gcd(a - 1, N). On g == N the batch overshot both factors: replay it one
    // exponent at a time from `saved`.
    auto settle = [&]() -> Verdict {
        g = gcd(mpz_class(a - 1), N);
        if (g > 1 && g < N) return Verdict::Found;
        if (g == N) {
            mpz_class b = saved;
            for (unsigned long e : pending) {
                mpz_powm_ui(b.get_mpz_t(), b.get_mpz_t(), e, N.get_mpz_t());
                g = gcd(mpz_class(b - 1), N);
                if (g > 1 && g < N) return Verdict::Found;
                if (g == N) break;
            }
            return Verdict::Exhausted;	// a == 1 mod N from here on
        }
        saved = a;
        pending.clear();
        return Verdict::Continue;
    };

    unsigned long B = std::min(params_.base_bound, top);
    for (;;) {
        for (std::size_t i = 0; i < primes.size() && primes[i] <= B; ++i) {
            const unsigned long pw = max_prime_power(primes[i], B);
            const unsigned long extra = pw / applied[i];
            if (extra <= 1) continue;
            applied[i] = pw;
            mpz_powm_ui(a.get_mpz_t(), a.get_mpz_t(), extra, N.get_mpz_t());
            pending.push_back(extra);
            ++done;

            if (pending.size() >= params_.batch) {
                Verdict v = settle();
                if (v == Verdict::Found) return g;
                if (v == Verdict::Exhausted) return std::nullopt;
                if (!checkpoint(done)) return std::nullopt;
            }
        }

        Verdict v = settle();
        if (v == Verdict::Found) return g;
        if (v == Verdict::Exhausted) {
            if (context().verbose) log("a^E == 1 mod N at B=" + std::to_string(B) + ", giving up");
            return std::nullopt;
        }
        if (!checkpoint(done)) return std::nullopt;

        if (B >= top) break;
        B = (B > top / 10) ? top : B * 10;
        if (context().verbose) log("escalating bound to B=" + std::to_string(B));
    }

    if (context().verbose) log("bound exhausted without a factor");
    return std::nullopt;
}

} // namespace hfactor
