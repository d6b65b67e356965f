#include "classifier/value_patterns.hpp"
#include "core/utils.hpp"

namespace piiredact::patterns {

namespace {

constexpr size_t kCardMinDigits = 13;
constexpr size_t kCardMaxDigits = 19;
constexpr size_t kPassportLength = 8;
constexpr size_t kMaxCountryCodeDigits = 3;

// Trimmed sub-range of text (spaces, tabs, newlines)
Span trimmed_span(std::string_view text) {
    const auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {0, 0};
    }
    const auto end = text.find_last_not_of(" \t\n\r");
    return {start, end - start + 1};
}

} // anonymous namespace

bool is_digit_separator(char c) {
    return c == ' ' || c == '-' || c == '(' || c == ')';
}

std::string digits_only(std::string_view text) {
    std::string digits;
    digits.reserve(text.size());
    for (const char c : text) {
        if (utils::is_digit(c)) digits += c;
    }
    return digits;
}

std::optional<Span> match_grouped_digits(std::string_view text, size_t count) {
    const Span span = trimmed_span(text);
    if (span.len == 0) return std::nullopt;

    const auto body = text.substr(span.pos, span.len);
    size_t digits = 0;
    for (const char c : body) {
        if (utils::is_digit(c)) {
            ++digits;
        } else if (!is_digit_separator(c)) {
            return std::nullopt;
        }
    }
    if (digits != count) return std::nullopt;
    return span;
}

std::optional<Span> find_digit_run(std::string_view text, size_t count) {
    size_t i = 0;
    while (i < text.size()) {
        if (!utils::is_digit(text[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < text.size() && utils::is_digit(text[j])) ++j;
        if (j - i == count) {
            return Span{i, count};
        }
        i = j;
    }
    return std::nullopt;
}

std::optional<Span> match_country_code_tail(std::string_view text, size_t count) {
    const Span span = trimmed_span(text);
    const auto body = text.substr(span.pos, span.len);
    if (body.empty() || body.front() != '+') return std::nullopt;

    size_t i = 1;
    while (i < body.size() && i <= kMaxCountryCodeDigits && utils::is_digit(body[i])) ++i;
    if (i == 1 || i >= body.size() || !is_digit_separator(body[i])) {
        return std::nullopt;
    }

    const auto tail = match_grouped_digits(body.substr(i + 1), count);
    if (!tail) return std::nullopt;
    return Span{span.pos + i + 1 + tail->pos, tail->len};
}

std::optional<Span> locate_digits(std::string_view text, size_t count, bool allow_embedded) {
    if (auto whole = match_grouped_digits(text, count)) {
        return whole;
    }
    if (!allow_embedded) {
        return std::nullopt;
    }
    if (auto tail = match_country_code_tail(text, count)) {
        return tail;
    }
    return find_digit_run(text, count);
}

bool is_passport_token(std::string_view token) {
    if (token.size() != kPassportLength) return false;
    if (token[0] < 'A' || token[0] > 'Z') return false;
    for (size_t i = 1; i < token.size(); ++i) {
        if (!utils::is_digit(token[i])) return false;
    }
    return true;
}

std::optional<Span> find_passport(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        if (!utils::is_alnum(text[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < text.size() && utils::is_alnum(text[j])) ++j;
        if (is_passport_token(text.substr(i, j - i))) {
            return Span{i, j - i};
        }
        i = j;
    }
    return std::nullopt;
}

bool is_ipv4(std::string_view text) {
    int octets = 0;
    size_t i = 0;
    while (true) {
        size_t j = i;
        int value = 0;
        while (j < text.size() && utils::is_digit(text[j]) && j - i < 3) {
            value = value * 10 + (text[j] - '0');
            ++j;
        }
        if (j == i || value > 255) return false;
        ++octets;
        if (j == text.size()) break;
        if (text[j] != '.' || octets == 4) return false;
        i = j + 1;
    }
    return octets == 4;
}

bool luhn_valid(std::string_view number) {
    const std::string digits = digits_only(number);
    if (digits.empty()) return false;

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

std::optional<Span> match_card_number(std::string_view text, bool require_luhn) {
    const Span span = trimmed_span(text);
    if (span.len == 0) return std::nullopt;

    const auto body = text.substr(span.pos, span.len);
    if (!utils::is_digit(body.front()) || !utils::is_digit(body.back())) {
        return std::nullopt;
    }

    size_t digits = 0;
    for (const char c : body) {
        if (utils::is_digit(c)) {
            ++digits;
        } else if (c != ' ' && c != '-') {
            return std::nullopt;
        }
    }
    if (digits < kCardMinDigits || digits > kCardMaxDigits) {
        return std::nullopt;
    }
    if (require_luhn && !luhn_valid(body)) {
        return std::nullopt;
    }
    return span;
}

bool is_postal_code(std::string_view text) {
    const std::string value = utils::trim(text);
    if (value.empty()) return false;

    size_t digits = 0;
    size_t separators = 0;
    for (const char c : value) {
        if (utils::is_digit(c)) {
            ++digits;
        } else if (c == ' ' || c == '-') {
            ++separators;
        } else {
            return false;
        }
    }
    return separators <= 1 && digits >= 4 && digits <= 9;
}

size_t count_alpha_tokens(std::string_view text) {
    size_t tokens = 0;
    bool in_token = false;
    for (const char c : text) {
        if (utils::is_alpha(c)) {
            if (!in_token) ++tokens;
            in_token = true;
        } else {
            in_token = false;
        }
    }
    return tokens;
}

} // namespace piiredact::patterns
