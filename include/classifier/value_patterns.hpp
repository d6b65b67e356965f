#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Value-shape matchers shared by the classifier and the masking engine
 *
 * All functions are pure and allocation-light; none of them throw.
 */
namespace piiredact::patterns {

// Half-open character range [pos, pos + len) inside a value
struct Span {
    size_t pos = 0;
    size_t len = 0;
};

// Separators tolerated inside grouped digit strings ("98765 43210", "(987) 654-3210")
[[nodiscard]] bool is_digit_separator(char c);

[[nodiscard]] std::string digits_only(std::string_view text);

/**
 * @brief Whole (trimmed) text is digits plus separators with exactly
 *        `count` digits
 * @return Span of the trimmed text on success
 */
[[nodiscard]] std::optional<Span> match_grouped_digits(std::string_view text, size_t count);

/**
 * @brief First run of exactly `count` digits not adjacent to another digit
 */
[[nodiscard]] std::optional<Span> find_digit_run(std::string_view text, size_t count);

/**
 * @brief "+<1-3 digit country code><separator><grouped digits>" with exactly
 *        `count` digits after the country code ("+91 98765 43210")
 * @return Span of the grouped tail
 */
[[nodiscard]] std::optional<Span> match_country_code_tail(std::string_view text, size_t count);

/**
 * @brief Whole-value grouped match, else (if allowed) a country-code
 *        prefixed tail, else an embedded bounded run
 */
[[nodiscard]] std::optional<Span> locate_digits(
    std::string_view text, size_t count, bool allow_embedded);

// One upper-case letter followed by seven digits
[[nodiscard]] bool is_passport_token(std::string_view token);

// Passport token bounded by non-alphanumerics
[[nodiscard]] std::optional<Span> find_passport(std::string_view text);

// Four dot-separated decimal octets, each in [0, 255]
[[nodiscard]] bool is_ipv4(std::string_view text);

/**
 * @brief Luhn checksum over the digits of `number` (separators ignored)
 */
[[nodiscard]] bool luhn_valid(std::string_view number);

/**
 * @brief 13-19 digits, optionally grouped by spaces or hyphens
 * @param require_luhn Also require a valid Luhn checksum
 * @return Span of the trimmed text on success
 */
[[nodiscard]] std::optional<Span> match_card_number(std::string_view text, bool require_luhn);

// 4-9 digits, optionally split by a space or hyphen ("560001", "12345-6789")
[[nodiscard]] bool is_postal_code(std::string_view text);

// Number of maximal [A-Za-z]+ runs
[[nodiscard]] size_t count_alpha_tokens(std::string_view text);

} // namespace piiredact::patterns
