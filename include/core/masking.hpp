#pragma once

#include "classifier/value_patterns.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace piiredact {

struct MaskingConfig {
    char fill_char = 'X';
    std::string address_sentinel = "[REDACTED_ADDRESS]";
    std::string ip_sentinel = "[REDACTED_IP]";
    std::string device_sentinel = "[REDACTED_DEVICE]";
    std::string location_sentinel = "[REDACTED_LOCATION]";
    std::string generic_sentinel = "[REDACTED_PII]";
};

/**
 * @brief Shape-preserving masking of sensitive values
 *
 * Strategies (selected by tag):
 * - DIGITS:   phone / Aadhaar / card / passport runs keep their first 2 and
 *             last 2 characters ("9876543210" -> "98XXXXXX10")
 * - HANDLE:   e-mail / UPI keep 2 leading characters of the local part and
 *             the domain ("ravi@email.com" -> "raXXX@email.com")
 * - NAME:     each token keeps its first letter plus a fixed fill
 *             ("Ravi Kumar" -> "RXXX KXXX")
 * - SENTINEL: address, IP, device and location values are replaced whole
 *
 * Masking is total: a value that does not fit the expected sub-shape gets
 * the generic sentinel, and a masked value never equals its input.
 */
class MaskingEngine {
public:
    static constexpr size_t kKeepPrefix = 2;
    static constexpr size_t kKeepSuffix = 2;
    static constexpr size_t kMaskFill = 3;

    MaskingEngine() = default;
    explicit MaskingEngine(MaskingConfig config) : config_(std::move(config)) {}

    /**
     * @brief Mask one value according to its classification tag
     */
    [[nodiscard]] std::string mask(std::string_view value, const Tag& tag) const;

    /**
     * @brief Keep the first/last 2 alphanumerics inside span, fill the rest
     *
     * Characters outside the span and separators inside it are kept.
     */
    [[nodiscard]] std::string mask_span(std::string_view value, patterns::Span span) const;

    [[nodiscard]] std::string mask_handle(std::string_view value) const;

    [[nodiscard]] std::string mask_name(std::string_view value) const;

    [[nodiscard]] const std::string& sentinel_for(const Tag& tag) const;

    [[nodiscard]] const MaskingConfig& config() const { return config_; }

private:
    [[nodiscard]] std::string mask_standalone(std::string_view value, StandaloneKind kind) const;

    // Falls back to the generic sentinel when masking changed nothing
    [[nodiscard]] std::string ensure_changed(std::string masked, std::string_view original) const;

    MaskingConfig config_;
};

} // namespace piiredact
