#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace routedoc {

// Loosely typed value carried by route metadata and vendor extensions.
using value = std::variant<std::string, int64_t, double, bool, std::vector<std::string>>;

using extension_map = std::map<std::string, value>;

// Result of typing a free-text default. monostate means "no value".
using typed_value = std::variant<std::monostate, int64_t, bool, std::string>;

inline std::optional<int64_t> parse_int64(std::string_view sv) noexcept {
    if (sv.size() > 1 && sv.front() == '+' && sv[1] != '-') {
        sv.remove_prefix(1);
    }
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out, 10);
    if (ec != std::errc() || ptr != sv.data() + sv.size()) {
        return std::nullopt;
    }
    return out;
}

inline std::optional<bool> parse_bool(std::string_view sv) noexcept {
    if (sv == "1" || sv == "t" || sv == "T" || sv == "true" || sv == "TRUE" || sv == "True") {
        return true;
    }
    if (sv == "0" || sv == "f" || sv == "F" || sv == "false" || sv == "FALSE" || sv == "False") {
        return false;
    }
    return std::nullopt;
}

// Picks integer, then boolean, then plain string for an ambiguous default value.
typed_value string_auto_type(std::string_view ambiguous);

} // namespace routedoc
