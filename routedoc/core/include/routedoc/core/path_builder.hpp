#pragma once

#include "config.hpp"
#include "openapi_ast.hpp"
#include "path_template.hpp"
#include "result.hpp"
#include "route.hpp"
#include "value.hpp"

#include <memory>
#include <string_view>

namespace routedoc {

// Translates every route of the service into path items keyed by the
// sanitized path. Routes sharing a path and method replace each other in
// registration order.
result<openapi::document> build_paths(const web_service& ws, const build_config& cfg = {});

result<openapi::operation> build_operation(const web_service& ws,
                                           const route& r,
                                           const pattern_map& patterns,
                                           const build_config& cfg);

// pattern is the inline pattern extracted from the route path for this
// parameter, empty when there is none.
result<openapi::parameter> build_parameter(const route& r,
                                           const parameter_data& param,
                                           std::string_view pattern,
                                           const build_config& cfg);

result<openapi::response> build_response(const response_error& err, const build_config& cfg);

openapi::header build_header(const header& h);
std::unique_ptr<openapi::items> build_header_items(const header_items& items);

// Copies entries whose key starts with prefix; all others are dropped.
void extract_vendor_extensions(extension_map& dst,
                               const extension_map& src,
                               std::string_view prefix);

openapi::param_location as_param_location(parameter_kind kind) noexcept;

} // namespace routedoc
