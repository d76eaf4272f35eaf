#pragma once
#include <cstring>
#include <stdexcept>
#include <string>

namespace hfactor {

// Join argv into a single, reproducible command line for logging.
inline std::string join_argv_for_log(int argc, char** argv) {
    std::string s;
    s.reserve(256);
    for (int i = 0; i < argc; ++i) {
        if (i) s.push_back(' ');
        const char* a = argv[i];
        bool need_quotes = (*a == '\0');
        for (const char* p = a; *p; ++p) {
            if (*p == ' ' || *p == '\t' || *p == '"') { need_quotes = true; break; }
        }
        if (!need_quotes) {
            s += a;
        } else {
            s.push_back('"');
            for (const char* p = a; *p; ++p) {
                if (*p == '"') s += "\\\"";
                else s.push_back(*p);
            }
            s.push_back('"');
        }
    }
    return s;
}

// Parse a CLI option value with --key=value or --key value.
inline const char* find_cli_value(int argc, char** argv, const char* key) {
    const size_t klen = std::strlen(key);
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strncmp(a, "--", 2) != 0) continue;
        a += 2;
        if (std::strncmp(a, key, klen) == 0) {
            a += klen;
            if (*a == '=') return a + 1;
            if (*a == '\0' && i + 1 < argc) return argv[i + 1];
        }
    }
    return nullptr;
}

// True if the bare switch --key is present.
inline bool has_cli_flag(int argc, char** argv, const char* key) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strncmp(a, "--", 2) == 0 && std::strcmp(a + 2, key) == 0) return true;
    }
    return false;
}

// Numeric option or `fallback` when absent. Throws std::invalid_argument naming
// the option when the value does not parse.
inline unsigned long long cli_ull(int argc, char** argv, const char* key, unsigned long long fallback) {
    const char* v = find_cli_value(argc, argv, key);
    if (!v) return fallback;
    try {
        size_t used = 0;
        if (*v == '-') throw std::invalid_argument(v);
        unsigned long long r = std::stoull(v, &used);
        if (v[used] != '\0') throw std::invalid_argument(v);
        return r;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("--") + key + ": invalid value '" + v + "'");
    }
}

inline double cli_double(int argc, char** argv, const char* key, double fallback) {
    const char* v = find_cli_value(argc, argv, key);
    if (!v) return fallback;
    try {
        size_t used = 0;
        double r = std::stod(v, &used);
        if (v[used] != '\0') throw std::invalid_argument(v);
        return r;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("--") + key + ": invalid value '" + v + "'");
    }
}

} // namespace hfactor
