#include "routedoc/core/openapi_ast.hpp"

namespace routedoc::openapi {

std::string_view param_location_to_string(param_location in) noexcept {
    switch (in) {
    case param_location::path:
        return "path";
    case param_location::query:
        return "query";
    case param_location::header:
        return "header";
    case param_location::body:
        return "body";
    case param_location::form_data:
        return "formData";
    }
    return "query";
}

std::string_view serialization_style_to_string(serialization_style style) noexcept {
    switch (style) {
    case serialization_style::none:
        return "";
    case serialization_style::simple:
        return "simple";
    case serialization_style::space_delimited:
        return "spaceDelimited";
    case serialization_style::pipe_delimited:
        return "pipeDelimited";
    case serialization_style::form:
        return "form";
    }
    return "";
}

} // namespace routedoc::openapi
