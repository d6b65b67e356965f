#include "core/redactor.hpp"

namespace piiredact {

FieldMap Redactor::redact(const FieldMap& fields, const TagMap& tags, bool verdict) const {
    FieldMap out;

    for (const auto& field : fields) {
        const auto it = tags.find(field.name);
        const bool masked = it != tags.end() &&
            (it->second.is_standalone() || (verdict && it->second.is_candidate()));

        if (!masked) {
            out.set(field.name, field.value);
            continue;
        }
        out.set(field.name, FieldValue::from_text(masking_.mask(field.value.text(), it->second)));
    }

    return out;
}

} // namespace piiredact
