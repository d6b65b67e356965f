#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

namespace piiredact {

using AliasSet = std::unordered_set<std::string>;

/**
 * @brief Recognized field-name aliases, one set per field role
 *
 * All entries are lower-case; field names are lower-cased before lookup.
 * A field whose name is in none of these sets is still matched on value
 * shape alone (phone/Aadhaar/card digit runs, passport tokens, UPI handles
 * with a whitelisted provider, e-mail addresses).
 */
struct FieldAliases {
    AliasSet phone;
    AliasSet aadhaar;
    AliasSet passport;
    AliasSet upi;
    AliasSet ip;
    AliasSet name;          // Full-name fields; a lone first name never qualifies
    AliasSet first_name;
    AliasSet last_name;
    AliasSet email;
    AliasSet address;
    AliasSet city;
    AliasSet postal_code;
    AliasSet device;
    AliasSet latitude;
    AliasSet longitude;
};

/**
 * @brief Immutable pattern table consumed by FieldClassifier
 *
 * Loaded once (built-in defaults, optionally overridden from config) and
 * passed explicitly, so tests can substitute their own rule set.
 */
struct RuleSet {
    FieldAliases aliases;

    // Payment-provider handles accepted as UPI ids in any field
    AliasSet upi_providers;

    // Credit card candidates must pass the Luhn checksum
    bool luhn_check = true;

    // A whole-value IPv4 in any field is standalone; when off, ip-alias
    // fields are DEVICE_OR_LOCATION candidates and other fields ordinary
    bool ip_standalone = true;

    // Count device, location and network signals as separate categories
    bool split_device_and_location = false;

    [[nodiscard]] static RuleSet defaults();

    [[nodiscard]] static bool matches(const AliasSet& aliases, std::string_view lower_name) {
        return aliases.contains(std::string(lower_name));
    }
};

} // namespace piiredact
