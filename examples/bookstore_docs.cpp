#include "routedoc/core/path_builder.hpp"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace routedoc;

// Domain model
struct book {
    std::string isbn;
    std::string title;
    double price;
};

struct review {
    int id;
    std::string text;
};

namespace {

std::string describe(const openapi::schema& s) {
    switch (s.kind) {
    case openapi::schema_kind::primitive:
        return s.type;
    case openapi::schema_kind::array:
        return "array<" + (s.items ? describe(*s.items) : std::string("?")) + ">";
    case openapi::schema_kind::reference:
        return s.ref;
    case openapi::schema_kind::unset:
        break;
    }
    return "-";
}

void print_document(const openapi::document& doc) {
    for (const auto& item : doc.paths) {
        std::cout << item.path << "\n";
        for (const auto& op : item.operations) {
            std::cout << "  " << http::method_to_string(op.method) << " " << op.operation_id;
            if (!op.summary.empty()) {
                std::cout << " - " << op.summary;
            }
            if (op.deprecated) {
                std::cout << " (deprecated)";
            }
            std::cout << "\n";
            for (const auto& p : op.parameters) {
                std::cout << "    param " << p.name << " in "
                          << openapi::param_location_to_string(p.in) << ": "
                          << describe(p.type_schema);
                if (!p.type_schema.pattern.empty()) {
                    std::cout << " pattern=" << p.type_schema.pattern;
                }
                std::cout << "\n";
            }
            for (const auto& [status, rsp] : op.responses.status_codes) {
                std::cout << "    " << status << " " << rsp.description;
                if (rsp.model) {
                    std::cout << " -> " << describe(*rsp.model);
                }
                std::cout << "\n";
            }
        }
    }
}

} // namespace

int main() {
    type_registry types;
    auto book_t = types.declare<book>("Book");
    types.declare<review>("Review");

    web_service ws("/books");
    ws.add_path_parameter(path_parameter("tenant", "tenant identifier"));

    auto& list = ws.add_route(http::method::get, "");
    list.operation = "listBooks";
    list.doc = "List <b>all</b> books";
    list.metadata["openapi.tags"] = std::vector<std::string>{"books"};
    auto limit = query_parameter("limit", "maximum number of books");
    limit.data_type = "integer";
    limit.default_value = "20";
    list.parameter_docs.push_back(limit);
    auto sort = query_parameter("sort", "ordering");
    sort.allowable_values = {{"title", "title"}, {"price", "price"}, {"isbn", "isbn"}};
    list.parameter_docs.push_back(sort);
    list.returns(200, "OK", types.of<std::vector<book>>());

    auto& get = ws.add_route(http::method::get, "/{isbn:[0-9-]{10,17}}");
    get.operation = "getBook";
    get.doc = "Get one book";
    get.parameter_docs.push_back(path_parameter("isbn", "book ISBN"));
    get.returns(200, "OK", types.of<book*>()).returns(404, "Not Found");

    auto& create = ws.add_route(http::method::post, "");
    create.operation = "createBook";
    create.read_sample = book_t;
    auto body = body_parameter("body", "book to add");
    body.data_type = "Book";
    create.parameter_docs.push_back(body);
    create.returns(201, "Created", book_t);

    auto& reviews = ws.add_route(http::method::get, "/{isbn}/reviews");
    reviews.operation = "listReviews";
    reviews.deprecated = true;
    reviews.returns(200, "OK", types.of<std::vector<review>>());

    auto& count = ws.add_route(http::method::get, "/count");
    count.operation = "countBooks";
    count.returns(200, "OK", types.of<int64_t>());

    auto doc = build_paths(ws);
    if (!doc) {
        std::cerr << "Failed to build document: " << doc.error().message() << "\n";
        return 1;
    }

    print_document(*doc);
    return 0;
}
