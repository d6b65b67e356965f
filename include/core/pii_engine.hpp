#pragma once

#include "classifier/field_classifier.hpp"
#include "classifier/rule_set.hpp"
#include "classifier/verdict_aggregator.hpp"
#include "core/masking.hpp"
#include "core/redactor.hpp"
#include "core/types.hpp"

namespace piiredact {

/**
 * @brief PII classification and redaction engine
 *
 * field map -> classify -> tag map -> decide -> verdict -> redact
 *
 * Stateless per record: the engine holds only immutable configuration, so
 * a single instance may be shared by any number of worker threads.
 */
class PiiEngine {
public:
    struct Config {
        RuleSet rules = RuleSet::defaults();
        MaskingConfig masking;
    };

    PiiEngine() : PiiEngine(Config{}) {}
    explicit PiiEngine(const Config& config);

    [[nodiscard]] TagMap classify(const FieldMap& fields) const {
        return classifier_.classify(fields);
    }

    [[nodiscard]] bool decide(const TagMap& tags) const {
        return aggregator_.decide(tags);
    }

    [[nodiscard]] FieldMap redact(const FieldMap& fields, const TagMap& tags, bool verdict) const {
        return redactor_.redact(fields, tags, verdict);
    }

    /**
     * @brief classify + decide + redact for one record
     */
    [[nodiscard]] RedactionResult process(const FieldMap& fields) const;

    [[nodiscard]] const FieldClassifier& classifier() const { return classifier_; }
    [[nodiscard]] const VerdictAggregator& aggregator() const { return aggregator_; }

private:
    FieldClassifier classifier_;
    VerdictAggregator aggregator_;
    Redactor redactor_;
};

} // namespace piiredact
