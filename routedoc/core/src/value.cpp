#include "routedoc/core/value.hpp"

namespace routedoc {

typed_value string_auto_type(std::string_view ambiguous) {
    if (ambiguous.empty()) {
        return std::monostate{};
    }
    if (auto parsed = parse_int64(ambiguous)) {
        return *parsed;
    }
    if (auto parsed = parse_bool(ambiguous)) {
        return *parsed;
    }
    return std::string(ambiguous);
}

} // namespace routedoc
