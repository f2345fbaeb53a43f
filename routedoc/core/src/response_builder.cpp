#include "routedoc/core/path_builder.hpp"
#include "routedoc/core/type_classifier.hpp"

#include <string>
#include <utility>

namespace routedoc {

namespace {

result<openapi::schema> model_schema(type_handle model, const build_config& cfg) {
    auto classified = classify_type(model, cfg);
    if (!classified) {
        return std::unexpected(classified.error());
    }
    switch (classified->kind) {
    case type_class::array:
        return openapi::schema::array_of(items_schema(*classified->element, cfg));
    case type_class::primitive:
        // A primitive model keeps its own type name, it is not mapped to a
        // document type like array items are.
        return openapi::schema::primitive(std::move(classified->name));
    case type_class::reference:
        break;
    }
    return openapi::schema::reference(cfg.definition_root + classified->name);
}

} // namespace

result<openapi::response> build_response(const response_error& err, const build_config& cfg) {
    openapi::response r;
    r.description = err.message;

    if (err.model) {
        auto schema = model_schema(err.model, cfg);
        if (!schema) {
            return std::unexpected(schema.error());
        }
        r.model = std::make_unique<openapi::schema>(std::move(*schema));
    }

    for (const auto& [name, h] : err.headers) {
        r.headers.emplace(name, build_header(h));
    }

    extract_vendor_extensions(r.extensions, err.extensions, cfg.extension_prefix);
    return r;
}

openapi::header build_header(const header& h) {
    openapi::header out;
    out.type = h.type;
    out.description = h.description;

    // array headers describe their elements through nested items
    if (h.type == openapi::ARRAY_TYPE && h.items) {
        out.items = build_header_items(*h.items);
    }
    return out;
}

std::unique_ptr<openapi::items> build_header_items(const header_items& items) {
    auto out = std::make_unique<openapi::items>();
    out->format = items.format;
    out->type = items.type;
    out->default_value = items.default_value;
    out->collection_format = std::string(collection_format_to_string(items.collection));
    if (items.items) {
        out->nested = build_header_items(*items.items);
    }
    return out;
}

} // namespace routedoc
