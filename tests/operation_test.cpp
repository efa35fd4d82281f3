#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/operation.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace jsonpatch_cpp;
using json = nlohmann::json;

namespace {

auto decode_error_kind(std::string_view text) -> ErrorKind {
    try {
        (void)decode_patch(text);
    } catch (const Exception& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decode_patch accepted: " << text;
    return ErrorKind::internal_fault;
}

}  // namespace

// -- OpType -------------------------------------------------------------------

TEST(OpType, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpType::add),     "add");
    EXPECT_EQ(to_string_view(OpType::remove),  "remove");
    EXPECT_EQ(to_string_view(OpType::replace), "replace");
    EXPECT_EQ(to_string_view(OpType::move),    "move");
    EXPECT_EQ(to_string_view(OpType::copy),    "copy");
    EXPECT_EQ(to_string_view(OpType::test),    "test");
}

TEST(OpType, lookup_by_name) {
    EXPECT_EQ(op_type_from_string("move"), OpType::move);
    EXPECT_FALSE(op_type_from_string("Move").has_value());
    EXPECT_FALSE(op_type_from_string("").has_value());
}

// -- Operation ----------------------------------------------------------------

TEST(Operation, absent_value_differs_from_null) {
    const auto absent = Operation{.op = OpType::test, .path = "/a"};
    const auto null = Operation{.op = OpType::test, .path = "/a", .value = Value{}};
    EXPECT_NE(absent, null);
}

TEST(Operation, to_string_wire_form) {
    const auto op = Operation{.op = OpType::replace, .path = "/a", .value = Value{1}};
    EXPECT_EQ(to_string(op), R"({"op":"replace","path":"/a","value":1})");
}

// -- encode_patch -------------------------------------------------------------

TEST(EncodePatch, empty_patch) {
    EXPECT_EQ(encode_patch({}), "[]");
}

TEST(EncodePatch, remove_has_no_value) {
    const auto patch = Patch{{.op = OpType::remove, .path = "/x"}};
    EXPECT_EQ(encode_patch(patch), R"([{"op":"remove","path":"/x"}])");
}

TEST(EncodePatch, add_always_carries_value) {
    const auto patch = Patch{{.op = OpType::add, .path = "/x"}};
    EXPECT_EQ(encode_patch(patch), R"([{"op":"add","path":"/x","value":null}])");
}

TEST(EncodePatch, move_carries_from) {
    const auto patch = Patch{{.op = OpType::move, .path = "/b", .from = "/a"}};
    EXPECT_EQ(encode_patch(patch), R"([{"from":"/a","op":"move","path":"/b"}])");
}

TEST(EncodePatch, number_text_is_verbatim) {
    const auto patch = Patch{{.op = OpType::add, .path = "/n", .value = Value{Number{"1.50"}}}};
    EXPECT_EQ(encode_patch(patch), R"([{"op":"add","path":"/n","value":1.50}])");
}

// -- decode_patch -------------------------------------------------------------

TEST(DecodePatch, all_operation_kinds) {
    const auto patch = decode_patch(R"([
        {"op": "add", "path": "/a", "value": {"b": [1]}},
        {"op": "remove", "path": "/c"},
        {"op": "replace", "path": "/d", "value": null},
        {"op": "move", "from": "/e", "path": "/f"},
        {"op": "copy", "from": "/g", "path": "/h"},
        {"op": "test", "path": "/i", "value": "x"}
    ])");
    ASSERT_EQ(patch.size(), 6u);
    EXPECT_EQ(patch[0].op, OpType::add);
    EXPECT_EQ(patch[0].value, parse(R"({"b":[1]})"));
    EXPECT_EQ(patch[1].op, OpType::remove);
    EXPECT_FALSE(patch[1].value.has_value());
    EXPECT_EQ(patch[2].value, Value{});
    EXPECT_EQ(patch[3].from, "/e");
    EXPECT_EQ(patch[3].path, "/f");
    EXPECT_EQ(patch[4].op, OpType::copy);
    EXPECT_EQ(patch[5].value, Value{"x"});
}

TEST(DecodePatch, accepts_string_and_parsed_document) {
    const auto text = std::string{R"([{"op":"remove","path":"/a"}])"};
    const auto from_text = decode_patch(text);
    ASSERT_EQ(from_text.size(), 1u);
    EXPECT_EQ(from_text[0].op, OpType::remove);
    EXPECT_EQ(decode_patch_value(parse(text)), from_text);
    EXPECT_TRUE(decode_patch(std::string_view{"[]"}).empty());
}

TEST(DecodePatch, parsed_document_must_be_an_array) {
    try {
        (void)decode_patch_value(parse(R"({"op":"remove","path":"/a"})"));
        FAIL() << "expected invalid_operation";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_operation);
    }
}

TEST(DecodePatch, test_without_value_is_accepted) {
    const auto patch = decode_patch(R"([{"op":"test","path":"/a"}])");
    ASSERT_EQ(patch.size(), 1u);
    EXPECT_FALSE(patch[0].value.has_value());
}

TEST(DecodePatch, malformed_json_is_parse_error) {
    EXPECT_EQ(decode_error_kind("[{"), ErrorKind::parse_error);
}

TEST(DecodePatch, structural_errors_are_invalid_operation) {
    EXPECT_EQ(decode_error_kind(R"({"op":"add"})"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([1])"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([{"path":"/a"}])"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([{"op":"jump","path":"/a"}])"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([{"op":"remove"}])"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([{"op":"remove","path":5}])"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([{"op":"add","path":"/a"}])"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([{"op":"move","path":"/a"}])"), ErrorKind::invalid_operation);
    EXPECT_EQ(decode_error_kind(R"([{"op":"copy","from":1,"path":"/a"}])"), ErrorKind::invalid_operation);
}

TEST(DecodePatch, error_names_the_entry) {
    try {
        (void)decode_patch(R"([{"op":"remove","path":"/a"},{"op":"add","path":"/b"}])");
        FAIL() << "expected invalid_operation";
    } catch (const Exception& e) {
        EXPECT_EQ(std::string{e.what()}, "operation 1: missing 'value'");
    }
}

TEST(DecodePatch, encode_then_decode_preserves_operations) {
    const auto patch = Patch{
        {.op = OpType::add, .path = "/a~1b", .value = parse(R"({"k":[1,"2"]})")},
        {.op = OpType::copy, .path = "/c", .from = "/a~1b"},
        {.op = OpType::test, .path = "/c"},
    };
    EXPECT_EQ(decode_patch(encode_patch(patch)), patch);
}

// -- sort_by_path -------------------------------------------------------------

TEST(SortByPath, stable_by_path) {
    auto patch = Patch{
        {.op = OpType::remove, .path = "/b"},
        {.op = OpType::add, .path = "/a", .value = Value{1}},
        {.op = OpType::replace, .path = "/a", .value = Value{2}},
    };
    sort_by_path(patch);
    EXPECT_EQ(patch[0].op, OpType::add);
    EXPECT_EQ(patch[1].op, OpType::replace);
    EXPECT_EQ(patch[2].path, "/b");
}

// -- ADL serialization --------------------------------------------------------

TEST(OperationAdl, op_type_to_json) {
    json j = OpType::copy;
    EXPECT_EQ(j, "copy");
}

TEST(OperationAdl, op_type_from_json) {
    EXPECT_EQ(json("test").get<OpType>(), OpType::test);
    EXPECT_THROW((void)json("nope").get<OpType>(), Exception);
}

TEST(OperationAdl, operation_round_trip) {
    const auto op = Operation{.op = OpType::move, .path = "/x", .from = "/y"};
    json j = op;
    EXPECT_EQ(j, json::parse(R"({"op":"move","from":"/y","path":"/x"})"));
    EXPECT_EQ(j.get<Operation>(), op);
}
