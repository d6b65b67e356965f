#include "codec/field_map_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <limits>

namespace piiredact {

using json = nlohmann::ordered_json;

namespace {

constexpr int kCompactIndent = -1;

std::string dump_compact(const json& value) {
    return value.dump(kCompactIndent, ' ', false, json::error_handler_t::replace);
}

FieldValue to_field_value(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return FieldValue::null();
        case json::value_t::boolean:
            return FieldValue::from_bool(value.get<bool>());
        case json::value_t::number_integer:
            return FieldValue::from_int(value.get<int64_t>());
        case json::value_t::number_unsigned: {
            const auto u = value.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return FieldValue::from_int(static_cast<int64_t>(u));
            }
            return FieldValue::from_double(static_cast<double>(u));
        }
        case json::value_t::number_float:
            return FieldValue::from_double(value.get<double>());
        case json::value_t::string:
            return FieldValue::from_text(value.get<std::string>());
        default:
            return FieldValue::from_composite(dump_compact(value));
    }
}

json to_json(const FieldValue& value) {
    switch (value.kind) {
        case ValueKind::NULL_VALUE: return nullptr;
        case ValueKind::BOOLEAN:    return value.boolean;
        case ValueKind::INTEGER:    return value.integer;
        case ValueKind::NUMBER:     return value.number;
        case ValueKind::TEXT:       return value.str;
        case ValueKind::COMPOSITE: {
            // Produced by dump_compact(), so it parses; keep text otherwise
            json nested = json::parse(value.str, nullptr, false);
            if (nested.is_discarded()) return value.str;
            return nested;
        }
    }
    return nullptr;
}

} // anonymous namespace

Result<FieldMap> FieldMapCodec::parse(std::string_view json_text) {
    json root;
    try {
        root = json::parse(json_text.begin(), json_text.end());
    } catch (const json::exception& e) {
        return Result<FieldMap>::error(ErrorCategory::PARSE_ERROR,
            std::format("Invalid JSON payload: {}", e.what()));
    }

    if (!root.is_object()) {
        return Result<FieldMap>::error(ErrorCategory::CONTRACT_VIOLATION,
            std::format("Payload must be a JSON object, got {}", root.type_name()));
    }

    FieldMap fields;
    for (const auto& item : root.items()) {
        fields.set(item.key(), to_field_value(item.value()));
    }
    return Result<FieldMap>::ok(std::move(fields));
}

std::string FieldMapCodec::serialize(const FieldMap& fields) {
    json root = json::object();
    for (const auto& field : fields) {
        root[field.name] = to_json(field.value);
    }
    return dump_compact(root);
}

} // namespace piiredact
