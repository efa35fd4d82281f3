// json_test.cpp - Tests for the text codec and nlohmann/json interoperability

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace jsonpatch_cpp;
using json = nlohmann::json;

// =============================================================================
// parse
// =============================================================================

TEST(Parse, scalars) {
    EXPECT_TRUE(parse("null").is_null());
    EXPECT_EQ(parse("true"), Value{true});
    EXPECT_EQ(parse("\"hi\""), Value{"hi"});
    EXPECT_EQ(parse("12"), Value{Number{"12"}});
}

TEST(Parse, number_text_is_preserved) {
    const auto v = parse(R"([1.10, 9999999999999999.0, -2.5e10, 18446744073709551615])");
    const auto* arr = v.get_if<Array>();
    ASSERT_NE(arr, nullptr);
    ASSERT_EQ(arr->size(), 4u);
    EXPECT_EQ(std::get<Number>((*arr)[0].data).text, "1.10");
    EXPECT_EQ(std::get<Number>((*arr)[1].data).text, "9999999999999999.0");
    EXPECT_EQ(std::get<Number>((*arr)[2].data).text, "-2.5e10");
    EXPECT_EQ(std::get<Number>((*arr)[3].data).text, "18446744073709551615");
}

TEST(Parse, negative_zero_keeps_its_sign) {
    const auto v = parse(R"({"a":-0,"b":0,"c":-0.0})");
    EXPECT_EQ(dump(v), R"({"a":-0,"b":0,"c":-0.0})");
    EXPECT_NE(parse("-0"), parse("0"));
}

TEST(Parse, numbers_beyond_double_range_are_kept) {
    const auto big = std::string(400, '9');
    const auto v = parse(R"({"n":1e400,"m":-2E+999,"big":)" + big + R"(,"tiny":1e-400})");
    EXPECT_EQ(dump(v), R"({"big":)" + big + R"(,"m":-2E+999,"n":1e400,"tiny":1e-400})");
}

TEST(Parse, number_like_text_inside_strings_is_ignored) {
    const auto v = parse(R"(["-1", {"2e5": 3, "x\"-4": -5}, 1e400, "6"])");
    EXPECT_EQ(dump(v), R"(["-1",{"2e5":3,"x\"-4":-5},1e400,"6"])");
}

TEST(Parse, malformed_numbers_are_still_rejected) {
    for (auto text : {"[01]", "[1.]", "[-]", "[1e]", "[+1]", "[1e400.5]"}) {
        try {
            (void)parse(text);
            ADD_FAILURE() << "expected parse_error for: " << text;
        } catch (const Exception& e) {
            EXPECT_EQ(e.kind(), ErrorKind::parse_error) << text;
        }
    }
}

TEST(Parse, nesting_up_to_the_limit_is_accepted) {
    const auto text = std::string(max_nesting_depth, '[') + std::string(max_nesting_depth, ']');
    EXPECT_TRUE(parse(text).is_array());
}

TEST(Parse, nesting_beyond_the_limit_is_parse_error) {
    const auto deep = max_nesting_depth + 1;
    for (const auto& text : {std::string(deep, '[') + std::string(deep, ']'),
                             std::string(500000, '[') + std::string(500000, ']')}) {
        try {
            (void)parse(text);
            ADD_FAILURE() << "expected parse_error at length " << text.size();
        } catch (const Exception& e) {
            EXPECT_EQ(e.kind(), ErrorKind::parse_error);
        }
    }

    auto objects = std::string{};
    for (std::size_t i = 0; i < deep; ++i) objects += R"({"a":)";
    objects += "1" + std::string(deep, '}');
    EXPECT_FALSE(equal(objects, objects));
}

TEST(Parse, nested_containers) {
    const auto v = parse(R"({"a":[{"b":null},[]],"c":{}})");
    const auto* obj = v.get_if<Object>();
    ASSERT_NE(obj, nullptr);
    ASSERT_TRUE(obj->contains("a"));
    const auto* a = obj->at("a").get_if<Array>();
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->size(), 2u);
    EXPECT_TRUE((*a)[0].is_object());
    EXPECT_EQ((*a)[1], Value{Array{}});
    EXPECT_EQ(obj->at("c"), Value{Object{}});
}

TEST(Parse, duplicate_keys_keep_last) {
    EXPECT_EQ(parse(R"({"a":1,"a":2})"), parse(R"({"a":2})"));
}

TEST(Parse, rejects_malformed_input) {
    for (auto text : {"", "{", "[1,]", "{\"a\"}", "nul", "[1] [2]"}) {
        try {
            (void)parse(text);
            ADD_FAILURE() << "expected parse_error for: " << text;
        } catch (const Exception& e) {
            EXPECT_EQ(e.kind(), ErrorKind::parse_error) << text;
        }
    }
}

// =============================================================================
// dump
// =============================================================================

TEST(Dump, compact_with_sorted_keys) {
    EXPECT_EQ(dump(parse(R"({ "b" : 1, "a" : [ true, null ] })")),
              R"({"a":[true,null],"b":1})");
}

TEST(Dump, numbers_are_written_verbatim) {
    EXPECT_EQ(dump(parse("[1.10,1e5]")), "[1.10,1e5]");
}

TEST(Dump, strings_are_escaped) {
    EXPECT_EQ(dump(Value{"a\"b\\c\n"}), R"("a\"b\\c\n")");
}

TEST(Dump, pretty_printing) {
    const auto v = parse(R"({"a":[1,2],"b":{}})");
    EXPECT_EQ(dump(v, 2), "{\n  \"a\": [\n    1,\n    2\n  ],\n  \"b\": {}\n}");
}

TEST(DumpSize, counts_quotes) {
    EXPECT_EQ(dump_size(Value{"AAAA"}), 6u);
    EXPECT_EQ(dump_size(parse(R"({"a":1})")), 7u);
}

// =============================================================================
// Array helpers
// =============================================================================

TEST(ResemblesArray, checks_outer_syntax_only) {
    EXPECT_TRUE(resembles_array("[]"));
    EXPECT_TRUE(resembles_array("  [1, 2]\n"));
    EXPECT_TRUE(resembles_array("[not json]"));
    EXPECT_FALSE(resembles_array("{}"));
    EXPECT_FALSE(resembles_array("\"[]\""));
    EXPECT_FALSE(resembles_array(""));
}

TEST(SplitArrayElements, empty_array) {
    EXPECT_TRUE(split_array_elements("[]").empty());
    EXPECT_TRUE(split_array_elements("[ ]").empty());
}

TEST(SplitArrayElements, respects_nesting_and_strings) {
    const auto parts = split_array_elements(R"([ 1, {"a":[2,3]}, "x,]y", [4, "\"]"] ])");
    EXPECT_EQ(parts, (std::vector<std::string_view>{
        "1", R"({"a":[2,3]})", R"("x,]y")", R"([4, "\"]"])"}));
}

// =============================================================================
// equal
// =============================================================================

TEST(Equal, ignores_key_order) {
    EXPECT_TRUE(equal(R"({"a":1,"b":[1,2]})", R"({"b":[1,2],"a":1})"));
}

TEST(Equal, array_order_matters) {
    EXPECT_FALSE(equal("[1,2]", "[2,1]"));
}

TEST(Equal, malformed_input_is_not_equal) {
    EXPECT_FALSE(equal("{", "{"));
    EXPECT_FALSE(equal("{}", "nope"));
}

TEST(Equal, kinds_must_match) {
    EXPECT_FALSE(equal("1", "\"1\""));
    EXPECT_FALSE(equal("null", "false"));
}

// =============================================================================
// ADL serialization tests
// =============================================================================

TEST(JsonAdl, value_to_json) {
    json j = parse(R"({"a":[1,2.5,"s",null,false]})");
    EXPECT_EQ(j, json::parse(R"({"a":[1,2.5,"s",null,false]})"));
}

TEST(JsonAdl, json_to_value) {
    const auto j = json::parse(R"({"b":{"c":[true]},"n":-3})");
    auto v = j.get<Value>();
    EXPECT_EQ(v, parse(R"({"b":{"c":[true]},"n":-3})"));
}

TEST(JsonAdl, number_outside_double_range_is_type_mismatch) {
    try {
        json j = parse("1e400");
        FAIL() << "converted " << j.dump();
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::type_mismatch);
    }
}

TEST(JsonAdl, round_trip_through_nlohmann) {
    const auto original = parse(R"([{"x":"y"},[],{},7])");
    json j = original;
    EXPECT_EQ(j.get<Value>(), original);
}
