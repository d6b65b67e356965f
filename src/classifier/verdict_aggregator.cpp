#include "classifier/verdict_aggregator.hpp"

#include <cstdint>

namespace piiredact {

namespace {

// One bit per counted category
uint32_t category_bit(const Tag& tag, bool split_device_and_location) {
    switch (tag.category) {
        case PiiCategory::NAME:    return 1u << 0;
        case PiiCategory::EMAIL:   return 1u << 1;
        case PiiCategory::ADDRESS: return 1u << 2;
        case PiiCategory::DEVICE_OR_LOCATION:
            if (!split_device_and_location) return 1u << 3;
            switch (tag.signal) {
                case LocationSignal::LOCATION: return 1u << 4;
                case LocationSignal::NETWORK:  return 1u << 5;
                default:                       return 1u << 3;
            }
        case PiiCategory::NONE:
            return 0;
    }
    return 0;
}

} // anonymous namespace

bool VerdictAggregator::has_standalone(const TagMap& tags) {
    for (const auto& [name, tag] : tags) {
        if (tag.is_standalone()) return true;
    }
    return false;
}

size_t VerdictAggregator::distinct_categories(const TagMap& tags) const {
    uint32_t seen = 0;
    for (const auto& [name, tag] : tags) {
        if (tag.is_candidate()) {
            seen |= category_bit(tag, split_device_and_location_);
        }
    }

    size_t count = 0;
    for (; seen != 0; seen &= seen - 1) {
        ++count;
    }
    return count;
}

bool VerdictAggregator::decide(const TagMap& tags) const {
    if (has_standalone(tags)) {
        return true;
    }
    return distinct_categories(tags) >= kCombinatorialThreshold;
}

} // namespace piiredact
