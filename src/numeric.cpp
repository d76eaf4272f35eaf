#include "numeric.h"

namespace hfactor {

mpz_class gcd(const mpz_class& a, const mpz_class& b) {
    mpz_class g;
    mpz_gcd(g.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
    return g;
}

std::optional<mpz_class> trial_division(const mpz_class& n, unsigned long limit) {
    for (unsigned long d = 2; d <= limit; ++d) {
        if (mpz_divisible_ui_p(n.get_mpz_t(), d) != 0) return mpz_class(d);
        if (d == limit) break;	// limit == ULONG_MAX would wrap
    }
    return std::nullopt;
}

mpz_class isqrt(const mpz_class& n) {
    mpz_class r;
    if (sgn(n) <= 0) return r;
    mpz_sqrt(r.get_mpz_t(), n.get_mpz_t());
    return r;
}

std::vector<unsigned long> primes_up_to(unsigned long P) {
    std::vector<unsigned long> ps;
    if (P < 2) return ps;
    std::vector<bool> sieve(static_cast<std::size_t>(P) + 1u, true);
    sieve[0] = sieve[1] = false;
    for (unsigned long i = 2; i <= P / i; ++i) if (sieve[static_cast<std::size_t>(i)])
            for (unsigned long j = i * i; j <= P; j += i) {
                sieve[static_cast<std::size_t>(j)] = false;
                if (j > P - i) break;
            }
    for (unsigned long p = 2; p <= P; ++p) if (sieve[static_cast<std::size_t>(p)]) ps.push_back(p);
    return ps;
}

unsigned long max_prime_power(unsigned long q, unsigned long B) {
    unsigned long pw = q;
    while (pw <= B / q) pw *= q;
    return pw;
}

} // namespace hfactor
