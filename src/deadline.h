#pragma once
#include <chrono>

namespace hfactor {

using SteadyClock = std::chrono::steady_clock;

// Longest span any timer in a race is armed for. Larger requests, infinity
// included, are capped here so the conversion to clock ticks cannot overflow.
constexpr std::chrono::hours kLongestWait{24 * 365 * 100};

// `span` in clock ticks, capped at kLongestWait. Negative and NaN spans give zero.
inline SteadyClock::duration bounded_span(std::chrono::duration<double> span) {
    if (!(span.count() > 0.0)) return SteadyClock::duration::zero();
    if (span >= kLongestWait) return std::chrono::duration_cast<SteadyClock::duration>(kLongestWait);
    return std::chrono::duration_cast<SteadyClock::duration>(span);
}

} // namespace hfactor
