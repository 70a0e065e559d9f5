#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace replica::core {

/// Value of `name`, or nullopt when unset. Reads through _dupenv_s on Windows.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    std::size_t len = 0;
    if (_dupenv_s(&raw, &len, name) != 0 || raw == nullptr) {
        std::free(raw);
        return std::nullopt;
    }
    std::string value(raw, len > 0 ? len - 1 : 0);
    std::free(raw);
    return value;
#else
    if (const char* v = std::getenv(name)) return std::string(v);
    return std::nullopt;
#endif
}

// Unset and empty variables are both treated as "not configured".
inline std::optional<std::string> getenv_nonempty(const char* key) noexcept {
    auto v = safe_getenv(key);
    if (v && !v->empty()) return v;
    return std::nullopt;
}

// Accepts 1/0 and true/false (case-insensitive); anything else is nullopt.
inline std::optional<bool> parse_bool_ci(std::string_view s) noexcept {
    auto eq_ci = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (ca != b[i]) return false;
        }
        return true;
    };
    if (s == "1" || eq_ci(s, "true")) return true;
    if (s == "0" || eq_ci(s, "false")) return false;
    return std::nullopt;
}

} // namespace replica::core
