#pragma once

#include "classifier/rule_set.hpp"
#include "core/types.hpp"

#include <optional>
#include <regex>
#include <string_view>

namespace piiredact {

/**
 * @brief Tags every field of one record
 *
 * Per field, first match wins:
 * 1. Standalone shapes, in order: phone, Aadhaar, passport, UPI handle,
 *    credit card, IPv4
 * 2. Combinatorial candidates: name, e-mail, address, device/location
 * 3. Ordinary
 *
 * Blank, boolean and composite values are always ordinary. The classifier
 * holds only its immutable rule set and compiled patterns, so one instance
 * can serve any number of threads.
 */
class FieldClassifier {
public:
    FieldClassifier() : FieldClassifier(RuleSet::defaults()) {}
    explicit FieldClassifier(RuleSet rules);

    /**
     * @brief Classify one record
     * @return One tag per field, keyed by the original field name
     */
    [[nodiscard]] TagMap classify(const FieldMap& fields) const;

    [[nodiscard]] const RuleSet& rules() const { return rules_; }

private:
    // Companion fields that enable co-occurrence rules
    struct RecordContext {
        bool has_first_name = false;
        bool has_last_name = false;
        bool has_city = false;
        bool has_postal_code = false;
        bool has_latitude = false;
        bool has_longitude = false;
    };

    [[nodiscard]] RecordContext scan_companions(const FieldMap& fields) const;

    [[nodiscard]] std::optional<StandaloneKind> match_standalone(
        std::string_view lower_name, std::string_view text) const;

    [[nodiscard]] std::optional<Tag> match_candidate(
        std::string_view lower_name, std::string_view text,
        const RecordContext& ctx) const;

    [[nodiscard]] bool is_upi_handle(std::string_view lower_name, std::string_view text) const;

    RuleSet rules_;

    std::regex email_regex_;
    std::regex upi_regex_;
};

} // namespace piiredact
