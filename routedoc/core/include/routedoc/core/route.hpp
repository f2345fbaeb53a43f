#pragma once

#include "http.hpp"
#include "type_registry.hpp"
#include "value.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace routedoc {

enum class collection_format : uint8_t { none, csv, ssv, tsv, pipes, multi };

enum class parameter_kind : uint8_t { path, query, body, header, form };

std::string_view collection_format_to_string(collection_format format) noexcept;

struct parameter_data {
    std::string name;
    std::string description;
    parameter_kind kind{parameter_kind::query};
    std::string data_type;
    std::string data_format;
    std::string default_value;
    std::string pattern;
    bool required = false;
    bool allow_multiple = false;
    bool allow_empty_value = false;
    bool unique_items = false;
    std::optional<int64_t> min_length;
    std::optional<int64_t> max_length;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<int64_t> min_items;
    std::optional<int64_t> max_items;
    collection_format collection{collection_format::none};
    // value key -> display value
    std::unordered_map<std::string, std::string> allowable_values;
    extension_map extensions;
};

parameter_data path_parameter(std::string_view name, std::string_view description);
parameter_data query_parameter(std::string_view name, std::string_view description);
parameter_data body_parameter(std::string_view name, std::string_view description);
parameter_data header_parameter(std::string_view name, std::string_view description);
parameter_data form_parameter(std::string_view name, std::string_view description);

struct header_items {
    std::string type;
    std::string format;
    std::string default_value;
    collection_format collection{collection_format::none};
    std::shared_ptr<header_items> items;
};

struct header : header_items {
    std::string description;
};

struct response_error {
    int code = 0;
    std::string message;
    type_handle model = nullptr;
    std::map<std::string, header> headers;
    extension_map extensions;
};

struct route {
    http::method method = http::method::get;
    std::string path;
    std::string doc;
    std::string notes;
    std::string operation;
    bool deprecated = false;
    std::map<std::string, value> metadata;
    extension_map extensions;
    std::vector<parameter_data> parameter_docs;
    std::map<int, response_error> response_errors;
    std::optional<response_error> default_response;
    type_handle read_sample = nullptr;

    route& returns(int code, std::string_view message, type_handle model = nullptr);
};

// Read-only snapshot of a group of routes sharing a root path.
class web_service {
public:
    explicit web_service(std::string root_path = "") : root_path_(std::move(root_path)) {}

    // Appends a route whose path is the root path joined with path.
    route& add_route(http::method m, std::string_view path);

    web_service& add_path_parameter(parameter_data param) {
        path_parameters_.push_back(std::move(param));
        return *this;
    }

    [[nodiscard]] std::string_view root_path() const noexcept { return root_path_; }
    [[nodiscard]] const std::vector<parameter_data>& path_parameters() const noexcept {
        return path_parameters_;
    }
    [[nodiscard]] const std::deque<route>& routes() const noexcept { return routes_; }

private:
    std::string root_path_;
    std::vector<parameter_data> path_parameters_;
    std::deque<route> routes_;
};

} // namespace routedoc
