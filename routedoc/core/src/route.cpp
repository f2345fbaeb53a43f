#include "routedoc/core/route.hpp"

namespace routedoc {

namespace {

parameter_data make_parameter(std::string_view name,
                              std::string_view description,
                              parameter_kind kind,
                              bool required) {
    parameter_data p;
    p.name = std::string(name);
    p.description = std::string(description);
    p.kind = kind;
    p.data_type = "string";
    p.required = required;
    return p;
}

} // namespace

std::string_view collection_format_to_string(collection_format format) noexcept {
    switch (format) {
    case collection_format::none:
        return "";
    case collection_format::csv:
        return "csv";
    case collection_format::ssv:
        return "ssv";
    case collection_format::tsv:
        return "tsv";
    case collection_format::pipes:
        return "pipes";
    case collection_format::multi:
        return "multi";
    }
    return "";
}

parameter_data path_parameter(std::string_view name, std::string_view description) {
    return make_parameter(name, description, parameter_kind::path, true);
}

parameter_data query_parameter(std::string_view name, std::string_view description) {
    return make_parameter(name, description, parameter_kind::query, false);
}

parameter_data body_parameter(std::string_view name, std::string_view description) {
    return make_parameter(name, description, parameter_kind::body, true);
}

parameter_data header_parameter(std::string_view name, std::string_view description) {
    return make_parameter(name, description, parameter_kind::header, false);
}

parameter_data form_parameter(std::string_view name, std::string_view description) {
    return make_parameter(name, description, parameter_kind::form, false);
}

route& route::returns(int code, std::string_view message, type_handle model) {
    response_error err;
    err.code = code;
    err.message = std::string(message);
    err.model = model;
    response_errors[code] = std::move(err);
    return *this;
}

route& web_service::add_route(http::method m, std::string_view path) {
    route& r = routes_.emplace_back();
    r.method = m;
    r.path.reserve(root_path_.size() + path.size() + 1);
    r.path = root_path_;
    if (!path.empty() && path.front() != '/' && (r.path.empty() || r.path.back() != '/')) {
        r.path.push_back('/');
    }
    r.path.append(path);
    return r;
}

} // namespace routedoc
