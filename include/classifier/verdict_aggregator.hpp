#pragma once

#include "core/types.hpp"

#include <cstddef>

namespace piiredact {

/**
 * @brief Derives the record-level is_pii verdict from a tag map
 *
 * - Any STANDALONE tag -> true
 * - Otherwise true iff at least two distinct combinatorial categories are
 *   present (repeated fields of one category count once)
 *
 * With split_device_and_location, the DEVICE, LOCATION and NETWORK signals
 * of DEVICE_OR_LOCATION count as separate categories.
 */
class VerdictAggregator {
public:
    static constexpr size_t kCombinatorialThreshold = 2;

    VerdictAggregator() = default;
    explicit VerdictAggregator(bool split_device_and_location)
        : split_device_and_location_(split_device_and_location) {}

    [[nodiscard]] bool decide(const TagMap& tags) const;

    /**
     * @brief Number of distinct combinatorial categories in the tag map
     */
    [[nodiscard]] size_t distinct_categories(const TagMap& tags) const;

    [[nodiscard]] static bool has_standalone(const TagMap& tags);

private:
    bool split_device_and_location_ = false;
};

} // namespace piiredact
