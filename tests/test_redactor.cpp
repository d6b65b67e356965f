#include <catch2/catch_test_macros.hpp>
#include "core/redactor.hpp"

using namespace piiredact;

namespace {

const FieldMap kRecord = {
    {"phone", FieldValue::from_text("9876543210")},
    {"email", FieldValue::from_text("ravi@email.com")},
    {"order_value", FieldValue::from_int(1299)},
};

const TagMap kTags = {
    {"phone", Tag::standalone_match(StandaloneKind::PHONE)},
    {"email", Tag::candidate(PiiCategory::EMAIL)},
    {"order_value", Tag::ordinary()},
};

} // namespace

TEST_CASE("Redactor: standalone fields are masked regardless of verdict", "[redactor]") {
    Redactor redactor;
    const auto out = redactor.redact(kRecord, kTags, false);

    REQUIRE(out.find("phone") != nullptr);
    CHECK(out.find("phone")->str == "98XXXXXX10");
    CHECK(out.find("email")->str == "ravi@email.com");
}

TEST_CASE("Redactor: candidates are masked only on a true verdict", "[redactor]") {
    Redactor redactor;
    const auto out = redactor.redact(kRecord, kTags, true);

    CHECK(out.find("phone")->str == "98XXXXXX10");
    CHECK(out.find("email")->str == "raXXX@email.com");
    CHECK(*out.find("order_value") == FieldValue::from_int(1299));
}

TEST_CASE("Redactor: output keeps field names and order", "[redactor]") {
    Redactor redactor;
    const auto out = redactor.redact(kRecord, kTags, true);

    REQUIRE(out.size() == kRecord.size());
    for (size_t i = 0; i < out.size(); ++i) {
        CHECK(out.fields()[i].name == kRecord.fields()[i].name);
    }
}

TEST_CASE("Redactor: masked numeric values become text", "[redactor]") {
    Redactor redactor;
    const FieldMap record = {{"contact", FieldValue::from_int(9876543210)}};
    const TagMap tags = {{"contact", Tag::standalone_match(StandaloneKind::PHONE)}};

    const auto out = redactor.redact(record, tags, true);
    CHECK(out.find("contact")->kind == ValueKind::TEXT);
    CHECK(out.find("contact")->str == "98XXXXXX10");
}

TEST_CASE("Redactor: fields without a tag pass through", "[redactor]") {
    Redactor redactor;
    const FieldMap record = {{"note", FieldValue::from_text("hello")}};
    const auto out = redactor.redact(record, {}, true);
    CHECK(out == record);
}

TEST_CASE("Redactor: input record is not modified", "[redactor]") {
    Redactor redactor;
    const FieldMap before = kRecord;
    (void)redactor.redact(kRecord, kTags, true);
    CHECK(kRecord == before);
}
