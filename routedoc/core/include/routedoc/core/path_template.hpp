#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace routedoc {

// path parameter name -> inline pattern
using pattern_map = std::map<std::string, std::string, std::less<>>;

struct sanitized_path {
    std::string path;
    pattern_map patterns;
};

// Removes inline regular expressions from templated segments:
// "/api/v1/{name:[a-z]+}/" becomes "/api/v1/{name}" with name -> "[a-z]+".
// Empty segments are dropped.
sanitized_path sanitize_path(std::string_view raw_path);

// Pattern extracted for name, empty when none.
std::string_view pattern_for(const pattern_map& patterns, std::string_view name) noexcept;

// Keeps only the text content of an HTML snippet:
// "<b>&lt;Hi!&gt;</b> <br>" becomes "&lt;Hi!&gt; ".
std::string strip_tags(std::string_view html);

} // namespace routedoc
