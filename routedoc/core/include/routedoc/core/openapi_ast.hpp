#pragma once

#include "http.hpp"
#include "value.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace routedoc::openapi {

inline constexpr std::string_view ARRAY_TYPE = "array";

// A schema is exactly one of: primitive type, array of schema, named reference.
enum class schema_kind : uint8_t { unset, primitive, array, reference };

enum class param_location : uint8_t { path, query, header, body, form_data };

enum class serialization_style : uint8_t {
    none,
    simple,
    space_delimited,
    pipe_delimited,
    form,
};

struct schema {
    schema_kind kind{schema_kind::unset};
    std::string type; // primitive type name, "array" for arrays
    std::string ref;
    std::unique_ptr<schema> items; // for arrays

    std::string pattern;
    uint64_t min_length = 0;
    std::optional<uint64_t> max_length;
    std::optional<double> minimum;
    std::optional<double> maximum;
    uint64_t min_items = 0;
    std::optional<uint64_t> max_items;
    bool unique_items = false;
    std::vector<std::string> enum_values;

    extension_map extensions;

    static schema primitive(std::string type_name) {
        schema s;
        s.kind = schema_kind::primitive;
        s.type = std::move(type_name);
        return s;
    }

    static schema array_of(schema element) {
        schema s;
        s.kind = schema_kind::array;
        s.type = std::string(ARRAY_TYPE);
        s.items = std::make_unique<schema>(std::move(element));
        return s;
    }

    static schema reference(std::string ref_path) {
        schema s;
        s.kind = schema_kind::reference;
        s.ref = std::move(ref_path);
        return s;
    }

    [[nodiscard]] bool is_primitive() const noexcept { return kind == schema_kind::primitive; }
    [[nodiscard]] bool is_array() const noexcept { return kind == schema_kind::array; }
    [[nodiscard]] bool is_ref() const noexcept { return kind == schema_kind::reference; }
};

// Simple-schema items: the legacy non-structural encoding used by
// parameters and response headers.
struct items {
    std::string type;
    std::string format;
    std::string default_value;
    std::string collection_format;
    std::unique_ptr<items> nested;
};

struct parameter {
    std::string name;
    param_location in{param_location::query};
    std::string description;
    bool required = false;
    bool allow_empty_value = false;
    serialization_style style{serialization_style::none};
    std::optional<bool> explode;

    // Structural description of the value.
    schema type_schema;

    // Simple-schema encoding. Left empty when the parameter resolves to a
    // structural body schema.
    std::string type;
    std::string format;
    typed_value default_value;
    std::unique_ptr<openapi::items> items;
    std::string collection_format;

    extension_map extensions;
};

struct header {
    std::string type;
    std::string description;
    std::unique_ptr<openapi::items> items; // only when type is "array"
};

struct response {
    std::string description;
    std::unique_ptr<schema> model;
    std::map<std::string, header> headers;
    extension_map extensions;
};

struct response_set {
    std::map<int, response> status_codes;
    std::optional<response> default_response;

    [[nodiscard]] const response* find(int status) const noexcept {
        auto it = status_codes.find(status);
        return it == status_codes.end() ? nullptr : &it->second;
    }
};

struct operation {
    http::method method = http::method::unknown;
    std::string operation_id;
    std::string summary;
    std::string description;
    bool deprecated = false;
    std::vector<std::string> tags;
    std::vector<parameter> parameters;
    response_set responses;
    extension_map extensions;
};

struct path_item {
    std::string path;
    std::vector<operation> operations;

    // Registers op under its method, replacing an earlier one.
    operation& set_operation(operation op) {
        for (auto& existing : operations) {
            if (existing.method == op.method) {
                existing = std::move(op);
                return existing;
            }
        }
        operations.push_back(std::move(op));
        return operations.back();
    }

    [[nodiscard]] const operation* find(http::method m) const noexcept {
        for (const auto& op : operations) {
            if (op.method == m) {
                return &op;
            }
        }
        return nullptr;
    }
};

struct document {
    document() = default;

    document(const document&) = delete;
    document& operator=(const document&) = delete;
    document(document&&) noexcept = default;
    document& operator=(document&&) noexcept = default;

    path_item& add_path(std::string_view path) {
        if (auto* existing = find_path(path)) {
            return *existing;
        }
        paths.emplace_back();
        auto& p = paths.back();
        p.path = std::string(path);
        return p;
    }

    [[nodiscard]] path_item* find_path(std::string_view path) noexcept {
        for (auto& p : paths) {
            if (p.path == path) {
                return &p;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const path_item* find_path(std::string_view path) const noexcept {
        for (const auto& p : paths) {
            if (p.path == path) {
                return &p;
            }
        }
        return nullptr;
    }

    std::vector<path_item> paths;
};

std::string_view param_location_to_string(param_location in) noexcept;
std::string_view serialization_style_to_string(serialization_style style) noexcept;

} // namespace routedoc::openapi
