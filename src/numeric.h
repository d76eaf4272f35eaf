#pragma once
#include <gmpxx.h>
#include <optional>
#include <vector>

namespace hfactor {

// gcd(0, k) == k; result is never negative.
mpz_class gcd(const mpz_class& a, const mpz_class& b);

// First d in [2, limit] with n mod d == 0, ascending. Deterministic, O(limit).
std::optional<mpz_class> trial_division(const mpz_class& n, unsigned long limit);

// floor(sqrt(n)) for n >= 0.
mpz_class isqrt(const mpz_class& n);

// All primes <= P (sieve of Eratosthenes), ascending.
std::vector<unsigned long> primes_up_to(unsigned long P);

// Largest q^k <= B for prime q <= B.
unsigned long max_prime_power(unsigned long q, unsigned long B);

} // namespace hfactor
