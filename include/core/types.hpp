#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace piiredact {

// ============================================================================
// Field Values
// ============================================================================

enum class ValueKind {
    NULL_VALUE,
    BOOLEAN,
    INTEGER,
    NUMBER,
    TEXT,
    COMPOSITE       // Nested array/object, carried as compact JSON text
};

/**
 * @brief Scalar value of one record field
 *
 * Numbers keep their native form for output fidelity; shape matching
 * always works on text().
 */
struct FieldValue {
    ValueKind kind;
    bool boolean;
    int64_t integer;
    double number;
    std::string str;    // TEXT content or COMPOSITE JSON text

    FieldValue() : kind(ValueKind::NULL_VALUE), boolean(false), integer(0), number(0.0) {}

    static FieldValue null() { return FieldValue{}; }

    static FieldValue from_bool(bool v) {
        FieldValue fv;
        fv.kind = ValueKind::BOOLEAN;
        fv.boolean = v;
        return fv;
    }

    static FieldValue from_int(int64_t v) {
        FieldValue fv;
        fv.kind = ValueKind::INTEGER;
        fv.integer = v;
        return fv;
    }

    static FieldValue from_double(double v) {
        FieldValue fv;
        fv.kind = ValueKind::NUMBER;
        fv.number = v;
        return fv;
    }

    static FieldValue from_text(std::string v) {
        FieldValue fv;
        fv.kind = ValueKind::TEXT;
        fv.str = std::move(v);
        return fv;
    }

    static FieldValue from_composite(std::string json_text) {
        FieldValue fv;
        fv.kind = ValueKind::COMPOSITE;
        fv.str = std::move(json_text);
        return fv;
    }

    [[nodiscard]] bool is_null() const { return kind == ValueKind::NULL_VALUE; }

    /**
     * @brief Null, empty or whitespace-only text. Never classified as PII.
     */
    [[nodiscard]] bool is_blank() const;

    /**
     * @brief Textual rendering used for shape matching
     *
     * INTEGER -> "1299", NUMBER -> shortest round-trip form ("12.9"),
     * BOOLEAN -> "true"/"false", NULL -> "".
     */
    [[nodiscard]] std::string text() const;

    bool operator==(const FieldValue& other) const;
};

struct Field {
    std::string name;
    FieldValue value;

    Field() = default;
    Field(std::string n, FieldValue v) : name(std::move(n)), value(std::move(v)) {}

    bool operator==(const Field&) const = default;
};

/**
 * @brief Insertion-ordered name -> value mapping for one record
 *
 * Names are assumed unique; set() on an existing name replaces the value
 * in place.
 */
class FieldMap {
public:
    FieldMap() = default;
    FieldMap(std::initializer_list<Field> fields);

    void set(std::string name, FieldValue value);

    [[nodiscard]] const FieldValue* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] const std::vector<Field>& fields() const { return fields_; }
    [[nodiscard]] size_t size() const { return fields_.size(); }
    [[nodiscard]] bool empty() const { return fields_.empty(); }

    [[nodiscard]] auto begin() const { return fields_.begin(); }
    [[nodiscard]] auto end() const { return fields_.end(); }

    bool operator==(const FieldMap& other) const { return fields_ == other.fields_; }

private:
    std::vector<Field> fields_;
    std::unordered_map<std::string, size_t> index_;  // name -> position
};

// ============================================================================
// Classification Tags
// ============================================================================

enum class TagKind {
    ORDINARY,
    STANDALONE,
    COMBINATORIAL
};

// Which standalone rule matched (drives the mask shape)
enum class StandaloneKind {
    NONE,
    PHONE,
    AADHAAR,
    PASSPORT,
    UPI,
    CREDIT_CARD,
    IP_ADDRESS
};

enum class PiiCategory {
    NONE,
    NAME,
    EMAIL,
    ADDRESS,
    DEVICE_OR_LOCATION
};

// Sub-signal of DEVICE_OR_LOCATION candidates
enum class LocationSignal {
    NONE,
    DEVICE,
    LOCATION,
    NETWORK
};

struct Tag {
    TagKind kind;
    StandaloneKind standalone;
    PiiCategory category;
    LocationSignal signal;

    Tag()
        : kind(TagKind::ORDINARY),
          standalone(StandaloneKind::NONE),
          category(PiiCategory::NONE),
          signal(LocationSignal::NONE) {}

    static Tag ordinary() { return Tag{}; }

    static Tag standalone_match(StandaloneKind k) {
        Tag t;
        t.kind = TagKind::STANDALONE;
        t.standalone = k;
        return t;
    }

    static Tag candidate(PiiCategory c, LocationSignal s = LocationSignal::NONE) {
        Tag t;
        t.kind = TagKind::COMBINATORIAL;
        t.category = c;
        t.signal = s;
        return t;
    }

    [[nodiscard]] bool is_standalone() const { return kind == TagKind::STANDALONE; }
    [[nodiscard]] bool is_candidate() const { return kind == TagKind::COMBINATORIAL; }
    [[nodiscard]] bool is_ordinary() const { return kind == TagKind::ORDINARY; }

    bool operator==(const Tag&) const = default;

    std::string type_string() const;
};

using TagMap = std::unordered_map<std::string, Tag>;

[[nodiscard]] const char* standalone_kind_to_string(StandaloneKind kind);
[[nodiscard]] const char* category_to_string(PiiCategory category);

// ============================================================================
// Engine Output
// ============================================================================

struct RedactionResult {
    FieldMap fields;
    bool is_pii;

    RedactionResult() : is_pii(false) {}
    RedactionResult(FieldMap f, bool pii) : fields(std::move(f)), is_pii(pii) {}
};

} // namespace piiredact
