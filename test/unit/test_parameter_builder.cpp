#include "routedoc/core/path_builder.hpp"

#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <vector>

using namespace routedoc;

namespace {

openapi::parameter build_ok(const route& r,
                            const parameter_data& param,
                            std::string_view pattern = {},
                            const build_config& cfg = {}) {
    auto res = build_parameter(r, param, pattern, cfg);
    EXPECT_TRUE(res.has_value());
    return std::move(res).value();
}

} // namespace

TEST(ParameterBuilder, MapsLocations) {
    route r;
    EXPECT_EQ(build_ok(r, path_parameter("a", "")).in, openapi::param_location::path);
    EXPECT_EQ(build_ok(r, query_parameter("a", "")).in, openapi::param_location::query);
    EXPECT_EQ(build_ok(r, header_parameter("a", "")).in, openapi::param_location::header);
    EXPECT_EQ(build_ok(r, body_parameter("a", "")).in, openapi::param_location::body);
    EXPECT_EQ(build_ok(r, form_parameter("a", "")).in, openapi::param_location::form_data);
}

TEST(ParameterBuilder, ScalarValidationsOnSchema) {
    route r;
    auto param = query_parameter("limit", "page size");
    param.data_type = "integer";
    param.data_format = "int32";
    param.minimum = 1;
    param.maximum = 100;
    param.min_length = 1;
    param.max_length = 3;
    param.pattern = "^[0-9]+$";
    param.required = true;
    param.allow_empty_value = true;
    param.default_value = "20";

    auto p = build_ok(r, param);
    EXPECT_EQ(p.name, "limit");
    EXPECT_EQ(p.description, "page size");
    EXPECT_TRUE(p.required);
    EXPECT_TRUE(p.allow_empty_value);

    EXPECT_TRUE(p.type_schema.is_primitive());
    EXPECT_EQ(p.type_schema.type, "integer");
    EXPECT_EQ(p.type_schema.minimum, 1.0);
    EXPECT_EQ(p.type_schema.maximum, 100.0);
    EXPECT_EQ(p.type_schema.min_length, 1U);
    EXPECT_EQ(p.type_schema.max_length, 3U);
    EXPECT_EQ(p.type_schema.pattern, "^[0-9]+$");

    EXPECT_EQ(p.type, "integer");
    EXPECT_EQ(p.format, "int32");
    ASSERT_TRUE(std::holds_alternative<int64_t>(p.default_value));
    EXPECT_EQ(std::get<int64_t>(p.default_value), 20);
    EXPECT_FALSE(p.items);
    EXPECT_TRUE(p.collection_format.empty());
    EXPECT_EQ(p.style, openapi::serialization_style::none);
}

TEST(ParameterBuilder, DefaultValueAutoTyping) {
    route r;
    auto param = query_parameter("flag", "");

    param.default_value = "true";
    auto b = build_ok(r, param);
    ASSERT_TRUE(std::holds_alternative<bool>(b.default_value));
    EXPECT_TRUE(std::get<bool>(b.default_value));

    param.default_value = "asc";
    auto s = build_ok(r, param);
    ASSERT_TRUE(std::holds_alternative<std::string>(s.default_value));
    EXPECT_EQ(std::get<std::string>(s.default_value), "asc");

    param.default_value = "";
    auto none = build_ok(r, param);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(none.default_value));
}

TEST(ParameterBuilder, NegativeLimitsAreDropped) {
    route r;
    auto param = query_parameter("q", "");
    param.min_length = -4;
    param.max_length = -1;
    auto p = build_ok(r, param);
    EXPECT_EQ(p.type_schema.min_length, 0U);
    EXPECT_FALSE(p.type_schema.max_length.has_value());

    param.allow_multiple = true;
    param.min_items = -2;
    param.max_items = -9;
    auto multi = build_ok(r, param);
    EXPECT_EQ(multi.type_schema.min_items, 0U);
    EXPECT_FALSE(multi.type_schema.max_items.has_value());
}

TEST(ParameterBuilder, MultiValueAppliesValidationsToItems) {
    route r;
    auto param = query_parameter("tags", "");
    param.allow_multiple = true;
    param.data_type = "string";
    param.pattern = "[a-z]+";
    param.min_length = 2;
    param.max_length = 10;
    param.min_items = 1;
    param.max_items = 5;
    param.unique_items = true;
    param.collection = collection_format::csv;

    auto p = build_ok(r, param);
    ASSERT_TRUE(p.type_schema.is_array());
    EXPECT_EQ(p.type_schema.type, "array");
    EXPECT_EQ(p.type_schema.min_items, 1U);
    EXPECT_EQ(p.type_schema.max_items, 5U);
    EXPECT_TRUE(p.type_schema.unique_items);
    // the array itself carries no pattern for non-path parameters
    EXPECT_TRUE(p.type_schema.pattern.empty());

    ASSERT_TRUE(p.type_schema.items);
    const auto& item = *p.type_schema.items;
    EXPECT_EQ(item.type, "string");
    EXPECT_EQ(item.pattern, "[a-z]+");
    EXPECT_EQ(item.min_length, 2U);
    EXPECT_EQ(item.max_length, 10U);

    EXPECT_EQ(p.style, openapi::serialization_style::simple);
    EXPECT_FALSE(p.explode.has_value());

    EXPECT_EQ(p.type, "array");
    ASSERT_TRUE(p.items);
    EXPECT_EQ(p.items->type, "string");
    EXPECT_EQ(p.collection_format, "csv");
}

TEST(ParameterBuilder, CollectionFormatStyles) {
    route r;
    auto param = query_parameter("ids", "");
    param.allow_multiple = true;

    struct expectation {
        collection_format format;
        openapi::serialization_style style;
        bool explode;
    };
    const expectation cases[] = {
        {collection_format::ssv, openapi::serialization_style::space_delimited, false},
        {collection_format::tsv, openapi::serialization_style::space_delimited, false},
        {collection_format::pipes, openapi::serialization_style::pipe_delimited, false},
        {collection_format::multi, openapi::serialization_style::form, true},
        {collection_format::none, openapi::serialization_style::none, false},
    };
    for (const auto& c : cases) {
        param.collection = c.format;
        auto p = build_ok(r, param);
        EXPECT_EQ(p.style, c.style);
        EXPECT_EQ(p.explode.has_value(), c.explode);
        if (c.explode) {
            EXPECT_TRUE(*p.explode);
        }
        EXPECT_EQ(p.collection_format, collection_format_to_string(c.format));
    }
}

TEST(ParameterBuilder, EnumIsSortedByKey) {
    route r;
    auto param = query_parameter("grade", "");
    param.allowable_values = {{"b", "B"}, {"a", "A"}, {"c", "C"}};
    auto p = build_ok(r, param);
    EXPECT_EQ(p.type_schema.enum_values, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(ParameterBuilder, EnumOrderFollowsKeysNotDisplayValues) {
    route r;
    auto param = query_parameter("sort", "");
    param.allowable_values = {{"2-newest", "Newest first"},
                              {"1-oldest", "Oldest first"},
                              {"3-title", "By title"}};
    auto p = build_ok(r, param);
    EXPECT_EQ(p.type_schema.enum_values,
              (std::vector<std::string>{"Oldest first", "Newest first", "By title"}));
}

TEST(ParameterBuilder, EnumAttachesToMultiValueArray) {
    route r;
    auto param = query_parameter("status", "");
    param.allow_multiple = true;
    param.allowable_values = {{"open", "open"}, {"closed", "closed"}};
    auto p = build_ok(r, param);
    EXPECT_EQ(p.type_schema.enum_values, (std::vector<std::string>{"closed", "open"}));
}

TEST(ParameterBuilder, PathParameterUsesExtractedPattern) {
    route r;
    auto param = path_parameter("id", "");
    param.pattern = "ignored";
    auto p = build_ok(r, param, "[0-9]+");
    EXPECT_EQ(p.type_schema.pattern, "[0-9]+");

    auto without = build_ok(r, param, "");
    EXPECT_TRUE(without.type_schema.pattern.empty());
}

TEST(ParameterBuilder, MultiValuePathParameterPatternOnArray) {
    route r;
    auto param = path_parameter("ids", "");
    param.allow_multiple = true;
    param.pattern = "[a-f]+";
    auto p = build_ok(r, param, "[0-9,]+");
    EXPECT_EQ(p.type_schema.pattern, "[0-9,]+");
    ASSERT_TRUE(p.type_schema.items);
    EXPECT_EQ(p.type_schema.items->pattern, "[a-f]+");
}

TEST(ParameterBuilder, BodyMatchingCompositeSampleBecomesReference) {
    type_registry reg;
    route r;
    r.read_sample = reg.composite("Book");
    auto param = body_parameter("body", "the book");
    param.data_type = "Book";
    param.default_value = "42";
    param.allowable_values = {{"x", "X"}};

    auto p = build_ok(r, param);
    EXPECT_TRUE(p.type_schema.is_ref());
    EXPECT_EQ(p.type_schema.ref, "#/definitions/Book");
    EXPECT_TRUE(p.type_schema.enum_values.empty());
    EXPECT_TRUE(p.type.empty());
    EXPECT_TRUE(p.format.empty());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(p.default_value));
    EXPECT_EQ(p.description, "the book");
    EXPECT_TRUE(p.required);
}

TEST(ParameterBuilder, BodyMatchingPrimitiveSampleIsStillReference) {
    type_registry reg;
    route r;
    r.read_sample = reg.primitive("string");
    auto param = body_parameter("body", "");
    param.data_type = "string";
    auto p = build_ok(r, param);
    EXPECT_TRUE(p.type_schema.is_ref());
    EXPECT_EQ(p.type_schema.ref, "#/definitions/string");
}

TEST(ParameterBuilder, BodyMatchingArraySampleOfComposites) {
    type_registry reg;
    route r;
    r.read_sample = reg.array_of(reg.composite("Book"));
    auto param = body_parameter("body", "");
    param.data_type = "[]Book";

    auto p = build_ok(r, param);
    ASSERT_TRUE(p.type_schema.is_array());
    ASSERT_TRUE(p.type_schema.items);
    EXPECT_TRUE(p.type_schema.items->is_ref());
    EXPECT_EQ(p.type_schema.items->ref, "#/definitions/Book");
    EXPECT_TRUE(p.type.empty());
}

TEST(ParameterBuilder, BodyMatchingArraySampleOfPrimitivesMapsType) {
    type_registry reg;
    route r;
    r.read_sample = reg.array_of(reg.primitive("int32"));
    auto param = body_parameter("ids", "");
    param.data_type = "[]int32";

    auto p = build_ok(r, param);
    ASSERT_TRUE(p.type_schema.is_array());
    ASSERT_TRUE(p.type_schema.items);
    EXPECT_TRUE(p.type_schema.items->is_primitive());
    EXPECT_EQ(p.type_schema.items->type, "integer");
}

TEST(ParameterBuilder, BodyNotMatchingSampleKeepsSimpleSchema) {
    type_registry reg;
    route r;
    r.read_sample = reg.composite("Book");
    auto param = body_parameter("body", "");
    param.data_type = "Author";
    auto p = build_ok(r, param);
    EXPECT_TRUE(p.type_schema.is_primitive());
    EXPECT_EQ(p.type_schema.type, "Author");
    EXPECT_EQ(p.type, "Author");
}

TEST(ParameterBuilder, NonBodyParameterIgnoresSample) {
    type_registry reg;
    route r;
    r.read_sample = reg.composite("Book");
    auto param = query_parameter("q", "");
    param.data_type = "Book";
    auto p = build_ok(r, param);
    EXPECT_TRUE(p.type_schema.is_primitive());
    EXPECT_EQ(p.type, "Book");
}

TEST(ParameterBuilder, SampleComparedAgainstPolicyName) {
    type_registry reg;
    route r;
    r.read_sample = reg.composite("Book");
    build_config cfg;
    cfg.naming = [](const type_descriptor& t) -> result<std::string> {
        return "store." + std::string(t.name());
    };

    auto param = body_parameter("body", "");
    param.data_type = "store.Book";
    auto p = build_ok(r, param, {}, cfg);
    EXPECT_EQ(p.type_schema.ref, "#/definitions/store.Book");

    param.data_type = "Book";
    auto plain = build_ok(r, param, {}, cfg);
    EXPECT_TRUE(plain.type_schema.is_primitive());
}

TEST(ParameterBuilder, NamingFailureOnSampleIsReported) {
    type_registry reg;
    route r;
    r.read_sample = reg.composite("Book");
    build_config cfg;
    cfg.naming = [](const type_descriptor&) -> result<std::string> {
        return std::unexpected(make_error_code(error_code::unresolved_type_name));
    };
    auto res = build_parameter(r, body_parameter("body", ""), {}, cfg);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), make_error_code(error_code::unresolved_type_name));
}

TEST(ParameterBuilder, MalformedArraySampleIsInvalidReference) {
    type_descriptor broken(type_kind::array, "[]Broken", nullptr);
    route r;
    r.read_sample = &broken;
    auto param = body_parameter("body", "");
    param.data_type = "[]Broken";
    auto res = build_parameter(r, param, {}, build_config{});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), make_error_code(error_code::invalid_type_reference));
}

TEST(ParameterBuilder, OnlyPrefixedExtensionsAreCopied) {
    route r;
    auto param = query_parameter("q", "");
    param.extensions = {{"x-internal", true}, {"internal", true}, {"X-upper", int64_t{1}}};
    auto p = build_ok(r, param);
    ASSERT_EQ(p.extensions.size(), 1U);
    EXPECT_TRUE(p.extensions.contains("x-internal"));
}
