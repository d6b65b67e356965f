#include "classifier/field_classifier.hpp"
#include "classifier/value_patterns.hpp"
#include "core/utils.hpp"

namespace piiredact {

namespace {

constexpr size_t kPhoneDigits = 10;
constexpr size_t kAadhaarDigits = 12;

// std::regex recurses per input character; longer values are never handles
// (RFC 5321 caps a path at 256 octets) and would exhaust the stack
constexpr size_t kMaxHandleLength = 320;
constexpr size_t kMaxEmailSearchLength = 4096;

bool may_hold_handle(const std::string& value, size_t max_length) {
    return value.size() <= max_length && value.find('@') != std::string::npos;
}

// Only scalar text and numbers carry identifying shapes
bool is_matchable(const FieldValue& value) {
    if (value.is_blank()) return false;
    return value.kind == ValueKind::TEXT ||
           value.kind == ValueKind::INTEGER ||
           value.kind == ValueKind::NUMBER;
}

} // anonymous namespace

FieldClassifier::FieldClassifier(RuleSet rules)
    : rules_(std::move(rules)),
      // local@domain.tld
      email_regex_(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})"),
      // handle@provider, provider without dots
      upi_regex_(R"([A-Za-z0-9._-]{2,}@([A-Za-z]{2,}))") {}

TagMap FieldClassifier::classify(const FieldMap& fields) const {
    TagMap tags;
    tags.reserve(fields.size());

    const RecordContext ctx = scan_companions(fields);

    for (const auto& field : fields) {
        if (!is_matchable(field.value)) {
            tags[field.name] = Tag::ordinary();
            continue;
        }

        const std::string lower_name = utils::to_lower(field.name);
        const std::string text = field.value.text();

        // Stage 1: standalone shapes
        if (const auto kind = match_standalone(lower_name, text)) {
            tags[field.name] = Tag::standalone_match(*kind);
            continue;
        }

        // Stage 2: combinatorial candidates
        if (const auto candidate = match_candidate(lower_name, text, ctx)) {
            tags[field.name] = *candidate;
            continue;
        }

        tags[field.name] = Tag::ordinary();
    }

    return tags;
}

FieldClassifier::RecordContext FieldClassifier::scan_companions(const FieldMap& fields) const {
    RecordContext ctx;
    const auto& a = rules_.aliases;

    for (const auto& field : fields) {
        if (!is_matchable(field.value)) continue;
        const std::string lower_name = utils::to_lower(field.name);

        if (RuleSet::matches(a.first_name, lower_name)) ctx.has_first_name = true;
        if (RuleSet::matches(a.last_name, lower_name)) ctx.has_last_name = true;
        if (RuleSet::matches(a.city, lower_name)) ctx.has_city = true;
        if (RuleSet::matches(a.latitude, lower_name)) ctx.has_latitude = true;
        if (RuleSet::matches(a.longitude, lower_name)) ctx.has_longitude = true;
        if (RuleSet::matches(a.postal_code, lower_name) &&
            patterns::is_postal_code(field.value.text())) {
            ctx.has_postal_code = true;
        }
    }
    return ctx;
}

std::optional<StandaloneKind> FieldClassifier::match_standalone(
    std::string_view lower_name, std::string_view text) const {

    const auto& a = rules_.aliases;

    if (patterns::locate_digits(text, kPhoneDigits, RuleSet::matches(a.phone, lower_name))) {
        return StandaloneKind::PHONE;
    }

    if (patterns::locate_digits(text, kAadhaarDigits, RuleSet::matches(a.aadhaar, lower_name))) {
        return StandaloneKind::AADHAAR;
    }

    if (RuleSet::matches(a.passport, lower_name)) {
        if (patterns::find_passport(text)) {
            return StandaloneKind::PASSPORT;
        }
    } else if (patterns::is_passport_token(utils::trim(text))) {
        return StandaloneKind::PASSPORT;
    }

    if (is_upi_handle(lower_name, text)) {
        return StandaloneKind::UPI;
    }

    if (patterns::match_card_number(text, rules_.luhn_check)) {
        return StandaloneKind::CREDIT_CARD;
    }

    if (rules_.ip_standalone && patterns::is_ipv4(utils::trim(text))) {
        return StandaloneKind::IP_ADDRESS;
    }

    return std::nullopt;
}

bool FieldClassifier::is_upi_handle(std::string_view lower_name, std::string_view text) const {
    const std::string value = utils::trim(text);
    if (!may_hold_handle(value, kMaxHandleLength)) {
        return false;
    }
    std::smatch match;
    if (!std::regex_match(value, match, upi_regex_)) {
        return false;
    }
    if (RuleSet::matches(rules_.aliases.upi, lower_name)) {
        return true;
    }
    return rules_.upi_providers.contains(utils::to_lower(match[1].str()));
}

std::optional<Tag> FieldClassifier::match_candidate(
    std::string_view lower_name, std::string_view text,
    const RecordContext& ctx) const {

    const auto& a = rules_.aliases;

    // Name: full-name fields with two or more alphabetic tokens
    if (RuleSet::matches(a.name, lower_name) && patterns::count_alpha_tokens(text) >= 2) {
        return Tag::candidate(PiiCategory::NAME);
    }
    // A first name alone is not identifying; first + last together are
    if ((RuleSet::matches(a.first_name, lower_name) || RuleSet::matches(a.last_name, lower_name)) &&
        ctx.has_first_name && ctx.has_last_name) {
        return Tag::candidate(PiiCategory::NAME);
    }

    // Email: whole value in any field, embedded address in e-mail fields
    const std::string value = utils::trim(text);
    if ((may_hold_handle(value, kMaxHandleLength) && std::regex_match(value, email_regex_)) ||
        (RuleSet::matches(a.email, lower_name) &&
         may_hold_handle(value, kMaxEmailSearchLength) &&
         std::regex_search(value, email_regex_))) {
        return Tag::candidate(PiiCategory::EMAIL);
    }

    // Address: dedicated field, or city + postal code together
    if (RuleSet::matches(a.address, lower_name)) {
        return Tag::candidate(PiiCategory::ADDRESS);
    }
    if (RuleSet::matches(a.city, lower_name) && ctx.has_postal_code) {
        return Tag::candidate(PiiCategory::ADDRESS);
    }
    if (RuleSet::matches(a.postal_code, lower_name) && ctx.has_city &&
        patterns::is_postal_code(text)) {
        return Tag::candidate(PiiCategory::ADDRESS);
    }

    // Device / location / network
    if (RuleSet::matches(a.device, lower_name)) {
        return Tag::candidate(PiiCategory::DEVICE_OR_LOCATION, LocationSignal::DEVICE);
    }
    if ((RuleSet::matches(a.latitude, lower_name) || RuleSet::matches(a.longitude, lower_name)) &&
        ctx.has_latitude && ctx.has_longitude) {
        return Tag::candidate(PiiCategory::DEVICE_OR_LOCATION, LocationSignal::LOCATION);
    }
    if (RuleSet::matches(a.ip, lower_name)) {
        return Tag::candidate(PiiCategory::DEVICE_OR_LOCATION, LocationSignal::NETWORK);
    }

    return std::nullopt;
}

} // namespace piiredact
