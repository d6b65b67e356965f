#include <catch2/catch_test_macros.hpp>
#include "classifier/verdict_aggregator.hpp"

using namespace piiredact;

TEST_CASE("Verdict: empty and ordinary-only maps are not PII", "[verdict]") {
    VerdictAggregator aggregator;
    CHECK_FALSE(aggregator.decide({}));
    CHECK_FALSE(aggregator.decide({{"a", Tag::ordinary()}, {"b", Tag::ordinary()}}));
}

TEST_CASE("Verdict: any standalone tag decides true", "[verdict]") {
    VerdictAggregator aggregator;
    const TagMap tags = {
        {"phone", Tag::standalone_match(StandaloneKind::PHONE)},
        {"order_value", Tag::ordinary()},
    };
    CHECK(aggregator.decide(tags));
    CHECK(VerdictAggregator::has_standalone(tags));
}

TEST_CASE("Verdict: single combinatorial category is not PII", "[verdict]") {
    VerdictAggregator aggregator;
    CHECK_FALSE(aggregator.decide({{"email", Tag::candidate(PiiCategory::EMAIL)}}));

    // Two fields of one category count once
    const TagMap same_category = {
        {"email", Tag::candidate(PiiCategory::EMAIL)},
        {"alt_email", Tag::candidate(PiiCategory::EMAIL)},
    };
    CHECK(aggregator.distinct_categories(same_category) == 1);
    CHECK_FALSE(aggregator.decide(same_category));
}

TEST_CASE("Verdict: two distinct categories decide true", "[verdict]") {
    VerdictAggregator aggregator;
    const TagMap tags = {
        {"name", Tag::candidate(PiiCategory::NAME)},
        {"email", Tag::candidate(PiiCategory::EMAIL)},
    };
    CHECK(aggregator.distinct_categories(tags) == 2);
    CHECK(aggregator.decide(tags));
}

TEST_CASE("Verdict: device and location signals", "[verdict]") {
    const TagMap tags = {
        {"device_id", Tag::candidate(PiiCategory::DEVICE_OR_LOCATION, LocationSignal::DEVICE)},
        {"latitude", Tag::candidate(PiiCategory::DEVICE_OR_LOCATION, LocationSignal::LOCATION)},
        {"longitude", Tag::candidate(PiiCategory::DEVICE_OR_LOCATION, LocationSignal::LOCATION)},
    };

    SECTION("One category by default") {
        VerdictAggregator aggregator;
        CHECK(aggregator.distinct_categories(tags) == 1);
        CHECK_FALSE(aggregator.decide(tags));
    }

    SECTION("Split into separate categories") {
        VerdictAggregator aggregator(true);
        CHECK(aggregator.distinct_categories(tags) == 2);
        CHECK(aggregator.decide(tags));
    }
}
