#include "routedoc/core/type_classifier.hpp"

#include <array>
#include <utility>

namespace routedoc {

namespace {

struct primitive_mapping {
    std::string_view name;
    std::string_view schema_type;
};

constexpr std::array<primitive_mapping, 18> PRIMITIVES{{
    {"int", "integer"},       {"int8", "integer"},     {"int16", "integer"},
    {"int32", "integer"},     {"int64", "integer"},    {"uint", "integer"},
    {"uint8", "integer"},     {"uint16", "integer"},   {"uint32", "integer"},
    {"uint64", "integer"},    {"float32", "number"},   {"float64", "number"},
    {"bool", "boolean"},      {"string", "string"},    {"byte", "integer"},
    {"rune", "integer"},      {"timestamp", "string"}, {"duration", "integer"},
}};

const primitive_mapping* find_primitive(std::string_view model_name) noexcept {
    for (const auto& p : PRIMITIVES) {
        if (p.name == model_name) {
            return &p;
        }
    }
    return nullptr;
}

} // namespace

naming_policy default_naming_policy() {
    return [](const type_descriptor& type) -> result<std::string> {
        if (type.name().empty()) {
            return std::unexpected(make_error_code(error_code::unresolved_type_name));
        }
        return std::string(type.name());
    };
}

bool is_primitive_type(std::string_view model_name) noexcept {
    return find_primitive(model_name) != nullptr;
}

std::string_view json_schema_type(std::string_view model_name) noexcept {
    if (const auto* p = find_primitive(model_name)) {
        return p->schema_type;
    }
    return model_name;
}

result<type_handle> dereference(type_handle type) {
    while (type && type->is_pointer()) {
        type = type->element();
    }
    if (!type) {
        return std::unexpected(make_error_code(error_code::invalid_type_reference));
    }
    return type;
}

result<std::string> model_key(type_handle type, const build_config& cfg) {
    if (!type) {
        return std::unexpected(make_error_code(error_code::invalid_type_reference));
    }
    if (cfg.model_type_name_handler) {
        if (auto name = cfg.model_type_name_handler(*type)) {
            if (name->empty()) {
                return std::unexpected(make_error_code(error_code::unresolved_type_name));
            }
            return std::move(*name);
        }
    }
    if (!cfg.naming) {
        return std::unexpected(make_error_code(error_code::unresolved_type_name));
    }
    auto key = cfg.naming(*type);
    if (key && key->empty()) {
        return std::unexpected(make_error_code(error_code::unresolved_type_name));
    }
    return key;
}

result<classified_type> classify_type(type_handle type, const build_config& cfg) {
    auto resolved = dereference(type);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    type_handle st = *resolved;

    classified_type out;
    if (st->is_array()) {
        if (!st->element()) {
            return std::unexpected(make_error_code(error_code::invalid_type_reference));
        }
        auto element = classify_type(st->element(), cfg);
        if (!element) {
            return std::unexpected(element.error());
        }
        out.kind = type_class::array;
        out.element = std::make_unique<classified_type>(std::move(*element));
        return out;
    }

    auto key = model_key(st, cfg);
    if (!key) {
        return std::unexpected(key.error());
    }
    out.kind = is_primitive_type(*key) ? type_class::primitive : type_class::reference;
    out.name = std::move(*key);
    return out;
}

openapi::schema items_schema(const classified_type& element, const build_config& cfg) {
    switch (element.kind) {
    case type_class::primitive:
        return openapi::schema::primitive(std::string(json_schema_type(element.name)));
    case type_class::array:
        return openapi::schema::array_of(items_schema(*element.element, cfg));
    case type_class::reference:
        break;
    }
    return openapi::schema::reference(cfg.definition_root + element.name);
}

} // namespace routedoc
