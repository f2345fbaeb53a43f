#include "routedoc/core/path_builder.hpp"
#include "routedoc/core/type_classifier.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace routedoc {

namespace {

uint64_t to_unsigned(const std::optional<int64_t>& v) noexcept {
    if (!v || *v < 0) {
        return 0;
    }
    return static_cast<uint64_t>(*v);
}

std::optional<uint64_t> to_optional_unsigned(const std::optional<int64_t>& v) noexcept {
    if (!v || *v < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*v);
}

void apply_collection_style(openapi::parameter& p, collection_format format) {
    switch (format) {
    case collection_format::csv:
        p.style = openapi::serialization_style::simple;
        break;
    case collection_format::ssv:
        p.style = openapi::serialization_style::space_delimited;
        break;
    case collection_format::tsv:
        // no tab-delimited style exists, space is the closest match
        p.style = openapi::serialization_style::space_delimited;
        break;
    case collection_format::pipes:
        p.style = openapi::serialization_style::pipe_delimited;
        break;
    case collection_format::multi:
        p.style = openapi::serialization_style::form;
        p.explode = true;
        break;
    case collection_format::none:
        break;
    }
}

std::vector<std::string> sorted_enum_values(
    const std::unordered_map<std::string, std::string>& allowable) {
    std::vector<const std::string*> keys;
    keys.reserve(allowable.size());
    for (const auto& [key, display] : allowable) {
        keys.push_back(&key);
    }
    std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) {
        return *a < *b;
    });

    std::vector<std::string> values;
    values.reserve(keys.size());
    for (const auto* key : keys) {
        values.push_back(allowable.at(*key));
    }
    return values;
}

// A body parameter whose declared type names the route's read sample is
// described by the sample's structure instead of a plain type string.
result<bool> matches_read_sample(const route& r,
                                 const parameter_data& param,
                                 const build_config& cfg) {
    if (param.kind != parameter_kind::body || r.read_sample == nullptr) {
        return false;
    }
    auto sample_name = model_key(r.read_sample, cfg);
    if (!sample_name) {
        return std::unexpected(sample_name.error());
    }
    return param.data_type == *sample_name;
}

result<openapi::schema> read_sample_schema(type_handle sample, const build_config& cfg) {
    auto classified = classify_type(sample, cfg);
    if (!classified) {
        return std::unexpected(classified.error());
    }
    if (classified->kind == type_class::array) {
        return openapi::schema::array_of(items_schema(*classified->element, cfg));
    }
    return openapi::schema::reference(cfg.definition_root + classified->name);
}

} // namespace

openapi::param_location as_param_location(parameter_kind kind) noexcept {
    switch (kind) {
    case parameter_kind::path:
        return openapi::param_location::path;
    case parameter_kind::query:
        return openapi::param_location::query;
    case parameter_kind::body:
        return openapi::param_location::body;
    case parameter_kind::header:
        return openapi::param_location::header;
    case parameter_kind::form:
        return openapi::param_location::form_data;
    }
    return openapi::param_location::query;
}

result<openapi::parameter> build_parameter(const route& r,
                                           const parameter_data& param,
                                           std::string_view pattern,
                                           const build_config& cfg) {
    openapi::parameter p;
    p.in = as_param_location(param.kind);

    if (param.allow_multiple) {
        // validations of a multi-value parameter apply to its items
        auto item = openapi::schema::primitive(param.data_type);
        item.pattern = param.pattern;
        item.min_length = to_unsigned(param.min_length);
        item.max_length = to_optional_unsigned(param.max_length);

        p.type_schema = openapi::schema::array_of(std::move(item));
        p.type_schema.min_items = to_unsigned(param.min_items);
        p.type_schema.max_items = to_optional_unsigned(param.max_items);
        p.type_schema.unique_items = param.unique_items;
        apply_collection_style(p, param.collection);
    } else {
        p.type_schema = openapi::schema::primitive(param.data_type);
        p.type_schema.min_length = to_unsigned(param.min_length);
        p.type_schema.max_length = to_optional_unsigned(param.max_length);
        p.type_schema.minimum = param.minimum;
        p.type_schema.maximum = param.maximum;
    }

    if (!param.allowable_values.empty()) {
        p.type_schema.enum_values = sorted_enum_values(param.allowable_values);
    }

    p.description = param.description;
    p.name = param.name;
    p.required = param.required;
    p.allow_empty_value = param.allow_empty_value;

    if (param.kind == parameter_kind::path) {
        p.type_schema.pattern = std::string(pattern);
    } else if (!param.allow_multiple) {
        p.type_schema.pattern = param.pattern;
    }

    auto sample_match = matches_read_sample(r, param, cfg);
    if (!sample_match) {
        return std::unexpected(sample_match.error());
    }

    if (*sample_match) {
        auto structural = read_sample_schema(r.read_sample, cfg);
        if (!structural) {
            return std::unexpected(structural.error());
        }
        p.type_schema = std::move(*structural);
    } else {
        if (param.allow_multiple) {
            p.type = std::string(openapi::ARRAY_TYPE);
            p.items = std::make_unique<openapi::items>();
            p.items->type = param.data_type;
            p.collection_format = std::string(collection_format_to_string(param.collection));
        } else {
            p.type = param.data_type;
        }
        p.default_value = string_auto_type(param.default_value);
        p.format = param.data_format;
    }

    extract_vendor_extensions(p.extensions, param.extensions, cfg.extension_prefix);
    return p;
}

} // namespace routedoc
