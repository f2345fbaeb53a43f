#include "routedoc/core/path_builder.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace routedoc {

namespace {

result<void> append_parameters(openapi::operation& o,
                               const route& r,
                               const std::vector<parameter_data>& params,
                               const pattern_map& patterns,
                               const build_config& cfg) {
    for (const auto& param : params) {
        auto p = build_parameter(r, param, pattern_for(patterns, param.name), cfg);
        if (!p) {
            return std::unexpected(p.error());
        }
        o.parameters.push_back(std::move(*p));
    }
    return {};
}

void report_failure(const route& r, const std::error_code& ec) {
    std::cerr << "[routedoc] cannot document " << http::method_to_string(r.method) << " "
              << r.path << ": " << ec.message() << "\n";
}

} // namespace

void extract_vendor_extensions(extension_map& dst,
                               const extension_map& src,
                               std::string_view prefix) {
    for (const auto& [key, val] : src) {
        if (std::string_view(key).starts_with(prefix)) {
            dst.insert_or_assign(key, val);
        }
    }
}

result<openapi::operation> build_operation(const web_service& ws,
                                           const route& r,
                                           const pattern_map& patterns,
                                           const build_config& cfg) {
    openapi::operation o;
    o.method = r.method;
    o.operation_id = r.operation;
    o.description = r.notes;
    o.summary = strip_tags(r.doc);
    o.deprecated = r.deprecated;

    if (auto it = r.metadata.find(cfg.tags_metadata_key); it != r.metadata.end()) {
        if (const auto* tags = std::get_if<std::vector<std::string>>(&it->second)) {
            o.tags = *tags;
        }
    }

    extract_vendor_extensions(o.extensions, r.extensions, cfg.extension_prefix);

    // shared path parameters first, then the route's own
    if (auto res = append_parameters(o, r, ws.path_parameters(), patterns, cfg); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = append_parameters(o, r, r.parameter_docs, patterns, cfg); !res) {
        return std::unexpected(res.error());
    }

    for (const auto& [code, err] : r.response_errors) {
        auto rsp = build_response(err, cfg);
        if (!rsp) {
            return std::unexpected(rsp.error());
        }
        o.responses.status_codes.insert_or_assign(code, std::move(*rsp));
    }
    if (r.default_response) {
        auto rsp = build_response(*r.default_response, cfg);
        if (!rsp) {
            return std::unexpected(rsp.error());
        }
        o.responses.default_response = std::move(*rsp);
    }
    if (o.responses.status_codes.empty()) {
        openapi::response ok;
        ok.description = std::string(http::status_text(200));
        o.responses.status_codes.emplace(200, std::move(ok));
    }
    return o;
}

result<openapi::document> build_paths(const web_service& ws, const build_config& cfg) {
    openapi::document doc;
    for (const auto& r : ws.routes()) {
        if (r.method == http::method::unknown) {
            auto ec = make_error_code(error_code::unknown_method);
            report_failure(r, ec);
            return std::unexpected(ec);
        }

        auto sanitized = sanitize_path(r.path);
        auto op = build_operation(ws, r, sanitized.patterns, cfg);
        if (!op) {
            report_failure(r, op.error());
            return std::unexpected(op.error());
        }
        doc.add_path(sanitized.path).set_operation(std::move(*op));
    }

    if (cfg.post_build_handler) {
        cfg.post_build_handler(doc);
    }
    return doc;
}

} // namespace routedoc
