#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace piiredact {

/**
 * @brief JSON object text <-> FieldMap
 *
 * Parsing keeps the field order of the source object. Integral numbers
 * stay INTEGER, other numbers NUMBER; nested arrays/objects are carried as
 * COMPOSITE (compact JSON) and re-emitted verbatim.
 *
 * Errors:
 * - PARSE_ERROR         text is not valid JSON
 * - CONTRACT_VIOLATION  valid JSON, but not an object
 */
class FieldMapCodec {
public:
    [[nodiscard]] static Result<FieldMap> parse(std::string_view json_text);

    /**
     * @brief Serialize to compact JSON; invalid UTF-8 is replaced, never thrown
     */
    [[nodiscard]] static std::string serialize(const FieldMap& fields);
};

} // namespace piiredact
