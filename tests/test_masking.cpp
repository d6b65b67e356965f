#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"

using namespace piiredact;

namespace {

Tag standalone(StandaloneKind kind) { return Tag::standalone_match(kind); }

} // namespace

// ============================================================================
// Digit-shaped values
// ============================================================================

TEST_CASE("Masking: phone keeps first and last two digits", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask("9876543210", standalone(StandaloneKind::PHONE)) == "98XXXXXX10");
    CHECK(engine.mask("98765 43210", standalone(StandaloneKind::PHONE)) == "98XXX XXX10");
    CHECK(engine.mask("+91 9876543210", standalone(StandaloneKind::PHONE)) == "+91 98XXXXXX10");
    CHECK(engine.mask("+91 98765 43210", standalone(StandaloneKind::PHONE)) == "+91 98XXX XXX10");
}

TEST_CASE("Masking: Aadhaar, passport and card", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask("1234 5678 9012", standalone(StandaloneKind::AADHAAR)) == "12XX XXXX XX12");
    CHECK(engine.mask("A1234567", standalone(StandaloneKind::PASSPORT)) == "A1XXXX67");
    CHECK(engine.mask("4111 1111 1111 1111", standalone(StandaloneKind::CREDIT_CARD)) ==
          "41XX XXXX XXXX XX11");
}

TEST_CASE("Masking: span masking keeps text outside the span", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask_span("id 123456 end", {3, 6}) == "id 12XX56 end");
}

TEST_CASE("Masking: spans too short to hide anything get the generic sentinel", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask_span("1234", {0, 4}) == "[REDACTED_PII]");
    CHECK(engine.mask_span("abc", {2, 5}) == "[REDACTED_PII]");
}

TEST_CASE("Masking: unmatched standalone value falls back to sentinel", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask("not a phone", standalone(StandaloneKind::PHONE)) == "[REDACTED_PII]");
}

// ============================================================================
// Handles and names
// ============================================================================

TEST_CASE("Masking: e-mail and UPI handles keep the domain", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask("ravi@email.com", Tag::candidate(PiiCategory::EMAIL)) == "raXXX@email.com");
    CHECK(engine.mask("ravi.kumar@ybl", standalone(StandaloneKind::UPI)) == "raXXX@ybl");
    CHECK(engine.mask_handle("ab@x.com") == "XX@x.com");
    CHECK(engine.mask_handle("a@b.com") == "XX@b.com");
}

TEST_CASE("Masking: handle without a local part gets the generic sentinel", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask_handle("@x.com") == "[REDACTED_PII]");
    CHECK(engine.mask_handle("no handle here") == "[REDACTED_PII]");
}

TEST_CASE("Masking: names keep each initial", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask("Ravi Kumar", Tag::candidate(PiiCategory::NAME)) == "RXXX KXXX");
    CHECK(engine.mask_name("Priya") == "PXXX");
    CHECK(engine.mask_name("A B") == "AXXX BXXX");
}

// ============================================================================
// Sentinels
// ============================================================================

TEST_CASE("Masking: sentinel categories", "[masking]") {
    MaskingEngine engine;
    CHECK(engine.mask("12 MG Road", Tag::candidate(PiiCategory::ADDRESS)) == "[REDACTED_ADDRESS]");
    CHECK(engine.mask("192.168.1.10", standalone(StandaloneKind::IP_ADDRESS)) == "[REDACTED_IP]");
    CHECK(engine.mask("D-99", Tag::candidate(PiiCategory::DEVICE_OR_LOCATION,
                                             LocationSignal::DEVICE)) == "[REDACTED_DEVICE]");
    CHECK(engine.mask("12.9", Tag::candidate(PiiCategory::DEVICE_OR_LOCATION,
                                             LocationSignal::LOCATION)) == "[REDACTED_LOCATION]");
    CHECK(engine.mask("10.0.0.1", Tag::candidate(PiiCategory::DEVICE_OR_LOCATION,
                                                 LocationSignal::NETWORK)) == "[REDACTED_IP]");
}

TEST_CASE("Masking: custom fill character and sentinels", "[masking]") {
    MaskingConfig config;
    config.fill_char = '*';
    config.address_sentinel = "<address>";
    MaskingEngine engine(config);

    CHECK(engine.mask("9876543210", standalone(StandaloneKind::PHONE)) == "98******10");
    CHECK(engine.mask("Ravi Kumar", Tag::candidate(PiiCategory::NAME)) == "R*** K***");
    CHECK(engine.mask("12 MG Road", Tag::candidate(PiiCategory::ADDRESS)) == "<address>");
}

TEST_CASE("Masking: output never equals the input", "[masking]") {
    MaskingEngine engine;
    // Already-masked text would mask to itself
    CHECK(engine.mask_name("XXXX") == "[REDACTED_PII]");
    CHECK(engine.mask_handle("raXXX@email.com") == "[REDACTED_PII]");
}
