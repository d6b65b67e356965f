#include "core/types.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace piiredact {

// ============================================================================
// FieldValue
// ============================================================================

bool FieldValue::is_blank() const {
    switch (kind) {
        case ValueKind::NULL_VALUE:
            return true;
        case ValueKind::TEXT:
        case ValueKind::COMPOSITE:
            return utils::trim(str).empty();
        default:
            return false;
    }
}

std::string FieldValue::text() const {
    switch (kind) {
        case ValueKind::NULL_VALUE:
            return "";
        case ValueKind::BOOLEAN:
            return utils::booltostr(boolean);
        case ValueKind::INTEGER:
            return std::format("{}", integer);
        case ValueKind::NUMBER:
            if (std::isfinite(number) && number == std::floor(number) &&
                std::fabs(number) < 1e15) {
                return std::format("{}", static_cast<int64_t>(number));
            }
            return std::format("{}", number);
        case ValueKind::TEXT:
        case ValueKind::COMPOSITE:
            return str;
    }
    return "";
}

bool FieldValue::operator==(const FieldValue& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case ValueKind::NULL_VALUE: return true;
        case ValueKind::BOOLEAN:    return boolean == other.boolean;
        case ValueKind::INTEGER:    return integer == other.integer;
        case ValueKind::NUMBER:     return number == other.number;
        case ValueKind::TEXT:
        case ValueKind::COMPOSITE:  return str == other.str;
    }
    return false;
}

// ============================================================================
// FieldMap
// ============================================================================

FieldMap::FieldMap(std::initializer_list<Field> fields) {
    fields_.reserve(fields.size());
    for (const auto& f : fields) {
        set(f.name, f.value);
    }
}

void FieldMap::set(std::string name, FieldValue value) {
    const auto it = index_.find(name);
    if (it != index_.end()) {
        fields_[it->second].value = std::move(value);
        return;
    }
    index_.emplace(name, fields_.size());
    fields_.emplace_back(std::move(name), std::move(value));
}

const FieldValue* FieldMap::find(std::string_view name) const {
    const auto it = index_.find(std::string(name));
    if (it != index_.end() && it->second < fields_.size()) {
        return &fields_[it->second].value;
    }
    return nullptr;
}

// ============================================================================
// Tag names
// ============================================================================

const char* standalone_kind_to_string(StandaloneKind kind) {
    switch (kind) {
        case StandaloneKind::NONE:        return "None";
        case StandaloneKind::PHONE:       return "Phone";
        case StandaloneKind::AADHAAR:     return "Aadhaar";
        case StandaloneKind::PASSPORT:    return "Passport";
        case StandaloneKind::UPI:         return "Upi";
        case StandaloneKind::CREDIT_CARD: return "CreditCard";
        case StandaloneKind::IP_ADDRESS:  return "IpAddress";
    }
    return "None";
}

const char* category_to_string(PiiCategory category) {
    switch (category) {
        case PiiCategory::NONE:               return "None";
        case PiiCategory::NAME:               return "Name";
        case PiiCategory::EMAIL:              return "Email";
        case PiiCategory::ADDRESS:            return "Address";
        case PiiCategory::DEVICE_OR_LOCATION: return "DeviceOrLocation";
    }
    return "None";
}

std::string Tag::type_string() const {
    switch (kind) {
        case TagKind::STANDALONE:
            return std::format("Standalone.{}", standalone_kind_to_string(standalone));
        case TagKind::COMBINATORIAL:
            return std::format("Combinatorial.{}", category_to_string(category));
        default:
            return "Ordinary";
    }
}

} // namespace piiredact
