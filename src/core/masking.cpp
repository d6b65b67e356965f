#include "core/masking.hpp"
#include "core/utils.hpp"

namespace piiredact {

namespace {

constexpr size_t kPhoneDigits = 10;
constexpr size_t kAadhaarDigits = 12;

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

std::string MaskingEngine::mask(std::string_view value, const Tag& tag) const {
    switch (tag.kind) {
        case TagKind::STANDALONE:
            return mask_standalone(value, tag.standalone);

        case TagKind::COMBINATORIAL:
            switch (tag.category) {
                case PiiCategory::NAME:
                    return mask_name(value);
                case PiiCategory::EMAIL:
                    return mask_handle(value);
                default:
                    return sentinel_for(tag);
            }

        case TagKind::ORDINARY:
            break;
    }
    return config_.generic_sentinel;
}

std::string MaskingEngine::mask_standalone(std::string_view value, StandaloneKind kind) const {
    std::optional<patterns::Span> span;

    switch (kind) {
        case StandaloneKind::PHONE:
            span = patterns::locate_digits(value, kPhoneDigits, true);
            break;
        case StandaloneKind::AADHAAR:
            span = patterns::locate_digits(value, kAadhaarDigits, true);
            break;
        case StandaloneKind::PASSPORT:
            span = patterns::find_passport(value);
            break;
        case StandaloneKind::CREDIT_CARD:
            span = patterns::match_card_number(value, false);
            break;
        case StandaloneKind::UPI:
            return mask_handle(value);
        case StandaloneKind::IP_ADDRESS:
            return config_.ip_sentinel;
        case StandaloneKind::NONE:
            break;
    }

    if (!span) {
        return config_.generic_sentinel;
    }
    return mask_span(value, *span);
}

std::string MaskingEngine::mask_span(std::string_view value, patterns::Span span) const {
    if (span.pos > value.size() || span.len > value.size() - span.pos) {
        return config_.generic_sentinel;
    }

    const auto body = value.substr(span.pos, span.len);
    size_t alnum_total = 0;
    for (const char c : body) {
        if (utils::is_alnum(c)) ++alnum_total;
    }

    // Nothing left to hide once prefix and suffix are kept
    if (alnum_total <= kKeepPrefix + kKeepSuffix) {
        return config_.generic_sentinel;
    }

    std::string result(value);
    size_t seen = 0;
    for (size_t i = span.pos; i < span.pos + span.len; ++i) {
        if (!utils::is_alnum(result[i])) continue;
        if (seen >= kKeepPrefix && seen < alnum_total - kKeepSuffix) {
            result[i] = config_.fill_char;
        }
        ++seen;
    }
    return ensure_changed(std::move(result), value);
}

std::string MaskingEngine::mask_handle(std::string_view value) const {
    const std::string trimmed = utils::trim(value);
    const auto at = trimmed.find('@');
    if (at == std::string::npos || at == 0 ||
        trimmed.find_first_of(" \t\n\r") != std::string::npos) {
        return config_.generic_sentinel;
    }

    const std::string_view local(trimmed.data(), at);
    std::string result;
    result.reserve(trimmed.size() + kMaskFill);
    if (local.size() <= kKeepPrefix) {
        result.append(kKeepPrefix, config_.fill_char);
    } else {
        result.append(local.substr(0, kKeepPrefix));
        result.append(kMaskFill, config_.fill_char);
    }
    result.append(trimmed, at, std::string::npos);
    return ensure_changed(std::move(result), value);
}

std::string MaskingEngine::mask_name(std::string_view value) const {
    std::string result;
    result.reserve(value.size() + kMaskFill);

    size_t i = 0;
    while (i < value.size()) {
        if (utils::is_space(value[i])) {
            result += value[i++];
            continue;
        }
        // Keep the whole first code point of each token
        result += value[i++];
        while (i < value.size() && is_utf8_continuation(value[i])) {
            result += value[i++];
        }
        result.append(kMaskFill, config_.fill_char);
        while (i < value.size() && !utils::is_space(value[i])) ++i;
    }
    return ensure_changed(std::move(result), value);
}

const std::string& MaskingEngine::sentinel_for(const Tag& tag) const {
    if (tag.is_standalone() && tag.standalone == StandaloneKind::IP_ADDRESS) {
        return config_.ip_sentinel;
    }
    if (tag.is_candidate()) {
        switch (tag.category) {
            case PiiCategory::ADDRESS:
                return config_.address_sentinel;
            case PiiCategory::DEVICE_OR_LOCATION:
                switch (tag.signal) {
                    case LocationSignal::LOCATION: return config_.location_sentinel;
                    case LocationSignal::NETWORK:  return config_.ip_sentinel;
                    default:                       return config_.device_sentinel;
                }
            default:
                break;
        }
    }
    return config_.generic_sentinel;
}

std::string MaskingEngine::ensure_changed(std::string masked, std::string_view original) const {
    if (masked == original) {
        return config_.generic_sentinel;
    }
    return masked;
}

} // namespace piiredact
