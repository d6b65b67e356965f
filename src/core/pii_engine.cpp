#include "core/pii_engine.hpp"

namespace piiredact {

PiiEngine::PiiEngine(const Config& config)
    : classifier_(config.rules),
      aggregator_(config.rules.split_device_and_location),
      redactor_(MaskingEngine(config.masking)) {}

RedactionResult PiiEngine::process(const FieldMap& fields) const {
    const TagMap tags = classify(fields);
    const bool verdict = decide(tags);
    return RedactionResult(redact(fields, tags, verdict), verdict);
}

} // namespace piiredact
