#pragma once

#include "core/masking.hpp"
#include "core/types.hpp"

#include <utility>

namespace piiredact {

/**
 * @brief Builds the redacted copy of a record
 *
 * - STANDALONE fields are always masked
 * - COMBINATORIAL fields are masked only when the verdict is true
 * - ORDINARY fields (and fields missing from the tag map) pass through
 *
 * The input map is never modified; masked values are always TEXT.
 */
class Redactor {
public:
    Redactor() = default;
    explicit Redactor(MaskingEngine masking) : masking_(std::move(masking)) {}

    [[nodiscard]] FieldMap redact(const FieldMap& fields, const TagMap& tags, bool verdict) const;

private:
    MaskingEngine masking_;
};

} // namespace piiredact
