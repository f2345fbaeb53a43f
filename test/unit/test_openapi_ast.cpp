#include "routedoc/core/openapi_ast.hpp"

#include <gtest/gtest.h>

using namespace routedoc;
using namespace routedoc::openapi;

TEST(OpenAPIAST, SchemaFactoriesSetExactlyOneShape) {
    auto prim = schema::primitive("integer");
    EXPECT_TRUE(prim.is_primitive());
    EXPECT_EQ(prim.type, "integer");
    EXPECT_TRUE(prim.ref.empty());
    EXPECT_FALSE(prim.items);

    auto ref = schema::reference("#/definitions/Book");
    EXPECT_TRUE(ref.is_ref());
    EXPECT_TRUE(ref.type.empty());
    EXPECT_FALSE(ref.items);

    auto arr = schema::array_of(schema::reference("#/definitions/Book"));
    EXPECT_TRUE(arr.is_array());
    EXPECT_EQ(arr.type, "array");
    EXPECT_TRUE(arr.ref.empty());
    ASSERT_TRUE(arr.items);
    EXPECT_EQ(arr.items->ref, "#/definitions/Book");
}

TEST(OpenAPIAST, PathItemReplacesOperationForSameMethod) {
    path_item item;
    operation first;
    first.method = http::method::get;
    first.operation_id = "first";
    item.set_operation(std::move(first));

    operation post;
    post.method = http::method::post;
    post.operation_id = "create";
    item.set_operation(std::move(post));

    operation second;
    second.method = http::method::get;
    second.operation_id = "second";
    item.set_operation(std::move(second));

    ASSERT_EQ(item.operations.size(), 2U);
    ASSERT_NE(item.find(http::method::get), nullptr);
    EXPECT_EQ(item.find(http::method::get)->operation_id, "second");
    EXPECT_EQ(item.find(http::method::post)->operation_id, "create");
    EXPECT_EQ(item.find(http::method::del), nullptr);
}

TEST(OpenAPIAST, DocumentAddPathLocatesExisting) {
    document doc;
    auto& a = doc.add_path("/books");
    a.operations.emplace_back();
    auto& b = doc.add_path("/books/{id}");
    auto& again = doc.add_path("/books");

    EXPECT_EQ(doc.paths.size(), 2U);
    EXPECT_EQ(again.operations.size(), 1U);
    EXPECT_EQ(b.path, "/books/{id}");
    EXPECT_NE(doc.find_path("/books/{id}"), nullptr);
    EXPECT_EQ(doc.find_path("/authors"), nullptr);
}

TEST(OpenAPIAST, DocumentIsMovable) {
    document doc;
    doc.add_path("/a");
    document moved(std::move(doc));
    ASSERT_EQ(moved.paths.size(), 1U);
    EXPECT_EQ(moved.paths[0].path, "/a");
}

TEST(OpenAPIAST, LocationAndStyleNames) {
    EXPECT_EQ(param_location_to_string(param_location::path), "path");
    EXPECT_EQ(param_location_to_string(param_location::query), "query");
    EXPECT_EQ(param_location_to_string(param_location::header), "header");
    EXPECT_EQ(param_location_to_string(param_location::body), "body");
    EXPECT_EQ(param_location_to_string(param_location::form_data), "formData");

    EXPECT_EQ(serialization_style_to_string(serialization_style::none), "");
    EXPECT_EQ(serialization_style_to_string(serialization_style::simple), "simple");
    EXPECT_EQ(serialization_style_to_string(serialization_style::space_delimited),
              "spaceDelimited");
    EXPECT_EQ(serialization_style_to_string(serialization_style::pipe_delimited),
              "pipeDelimited");
    EXPECT_EQ(serialization_style_to_string(serialization_style::form), "form");
}

TEST(OpenAPIAST, ResponseSetFind) {
    response_set set;
    response created;
    created.description = "Created";
    set.status_codes.emplace(201, std::move(created));
    ASSERT_NE(set.find(201), nullptr);
    EXPECT_EQ(set.find(201)->description, "Created");
    EXPECT_EQ(set.find(200), nullptr);
}
