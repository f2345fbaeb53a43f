#pragma once

#include <cstdint>
#include <string_view>

namespace routedoc::http {

enum class method : uint8_t { get, post, put, del, patch, head, options, unknown };

std::string_view method_to_string(method m);

// Standard reason phrase, empty for codes without one.
std::string_view status_text(int status);

} // namespace routedoc::http
