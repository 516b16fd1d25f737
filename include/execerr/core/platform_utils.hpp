#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace execerr::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Verbosity level from an environment variable.
// Unset, empty or "0" -> 0. Leading decimal digits give the level;
// any other non-empty value counts as 1.
inline int env_level(const char* name) noexcept {
    const auto v = safe_getenv(name);
    if (!v || v->empty()) return 0;
    int level = 0;
    bool digits = false;
    for (char c : *v) {
        if (c < '0' || c > '9') break;
        digits = true;
        if (level < 1000) level = level * 10 + (c - '0');
    }
    return digits ? level : 1;
}

} // namespace execerr::core
