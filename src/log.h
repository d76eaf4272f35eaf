#pragma once
#include <cstdio>
#include <string>

namespace hfactor {

// One fprintf per line so concurrent workers don't interleave mid-line.
inline void log_line(const std::string& tag, const std::string& msg) {
    std::fprintf(stderr, "[%s] %s\n", tag.c_str(), msg.c_str());
}

} // namespace hfactor
