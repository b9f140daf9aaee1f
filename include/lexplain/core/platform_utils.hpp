#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <cstdlib>

namespace lexplain::core {

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

/** \brief Like safe_getenv, but an empty value counts as unset. */
inline std::optional<std::string> getenv_nonempty(const char* name) noexcept {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    return v;
}

/** \brief Parse "1"/"0"/"true"/"false" (case-insensitive). nullopt otherwise. */
inline std::optional<bool> parse_bool_ci(std::string_view s) noexcept {
    auto eq_ci = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char c = a[i];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != b[i]) return false;
        }
        return true;
    };
    if (s == "1" || eq_ci(s, "true")) return true;
    if (s == "0" || eq_ci(s, "false")) return false;
    return std::nullopt;
}

/** \brief True when LEXPLAIN_DEBUG is set to anything but a leading '0'. */
inline bool debug_enabled() noexcept {
    auto v = safe_getenv("LEXPLAIN_DEBUG");
    return v && !v->empty() && ((*v)[0] != '0');
}

} // namespace lexplain::core
