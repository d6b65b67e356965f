#include <catch2/catch_test_macros.hpp>
#include "codec/field_map_codec.hpp"

using namespace piiredact;

TEST_CASE("Codec: parses scalar kinds", "[codec]") {
    const auto result = FieldMapCodec::parse(
        R"({"s":"x","i":1299,"d":12.9,"b":true,"n":null})");
    REQUIRE(result.is_ok());

    const auto& fields = result.value();
    REQUIRE(fields.size() == 5);
    CHECK(*fields.find("s") == FieldValue::from_text("x"));
    CHECK(*fields.find("i") == FieldValue::from_int(1299));
    CHECK(*fields.find("d") == FieldValue::from_double(12.9));
    CHECK(*fields.find("b") == FieldValue::from_bool(true));
    CHECK(fields.find("n")->is_null());
}

TEST_CASE("Codec: keeps field order of the source object", "[codec]") {
    const auto result = FieldMapCodec::parse(R"({"zeta":1,"alpha":2,"mid":3})");
    REQUIRE(result.is_ok());

    const auto& fields = result.value().fields();
    REQUIRE(fields.size() == 3);
    CHECK(fields[0].name == "zeta");
    CHECK(fields[1].name == "alpha");
    CHECK(fields[2].name == "mid");

    CHECK(FieldMapCodec::serialize(result.value()) == R"({"zeta":1,"alpha":2,"mid":3})");
}

TEST_CASE("Codec: nested values are carried as composite", "[codec]") {
    const auto result = FieldMapCodec::parse(R"({"tags":["a","b"],"meta":{"k":1}})");
    REQUIRE(result.is_ok());

    CHECK(result.value().find("tags")->kind == ValueKind::COMPOSITE);
    CHECK(result.value().find("meta")->str == R"({"k":1})");
    CHECK(FieldMapCodec::serialize(result.value()) == R"({"tags":["a","b"],"meta":{"k":1}})");
}

TEST_CASE("Codec: invalid JSON is a parse error", "[codec]") {
    const auto result = FieldMapCodec::parse(R"({"phone": "98765)");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
}

TEST_CASE("Codec: non-object JSON is a contract violation", "[codec]") {
    for (const char* payload : {"[1,2,3]", "\"text\"", "42", "null"}) {
        const auto result = FieldMapCodec::parse(payload);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONTRACT_VIOLATION);
    }
}

TEST_CASE("Codec: serializes masked text and numbers", "[codec]") {
    const FieldMap fields = {
        {"phone", FieldValue::from_text("98XXXXXX10")},
        {"order_value", FieldValue::from_int(1299)},
        {"ok", FieldValue::from_bool(false)},
        {"none", FieldValue::null()},
    };
    CHECK(FieldMapCodec::serialize(fields) ==
          R"({"phone":"98XXXXXX10","order_value":1299,"ok":false,"none":null})");
    CHECK(FieldMapCodec::serialize(FieldMap{}) == "{}");
}

TEST_CASE("Codec: escapes quotes and control characters", "[codec]") {
    const FieldMap fields = {{"note", FieldValue::from_text("say \"hi\"\n")}};
    CHECK(FieldMapCodec::serialize(fields) == R"({"note":"say \"hi\"\n"})");
}
