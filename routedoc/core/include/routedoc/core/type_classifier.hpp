#pragma once

#include "config.hpp"
#include "openapi_ast.hpp"
#include "result.hpp"
#include "type_registry.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace routedoc {

enum class type_class : uint8_t { primitive, array, reference };

struct classified_type {
    type_class kind{type_class::reference};
    std::string name; // canonical name, empty for arrays
    std::unique_ptr<classified_type> element;
};

[[nodiscard]] bool is_primitive_type(std::string_view model_name) noexcept;

// Document type for a primitive name; unknown names are returned unchanged.
[[nodiscard]] std::string_view json_schema_type(std::string_view model_name) noexcept;

// Follows pointer descriptors down to the pointee.
result<type_handle> dereference(type_handle type);

// Canonical name of a type through the configured naming.
result<std::string> model_key(type_handle type, const build_config& cfg);

// Classifies a type as primitive, array (with classified element) or reference.
result<classified_type> classify_type(type_handle type, const build_config& cfg);

// Items schema for a classified element: primitives map to their document
// type, composites become references, arrays nest.
openapi::schema items_schema(const classified_type& element, const build_config& cfg);

} // namespace routedoc
