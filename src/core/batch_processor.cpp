#include "core/batch_processor.hpp"
#include "codec/field_map_codec.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <thread>

namespace piiredact {

static constexpr std::string_view kEmptyObject = "{}";

OutputRecord BatchProcessor::process_one(const RawRecord& record, RecordOutcome& outcome) const {
    OutputRecord out;
    out.record_id = record.record_id;

    if (utils::trim(record.payload).empty()) {
        outcome = RecordOutcome::EMPTY_PAYLOAD;
        out.redacted_json = std::string(kEmptyObject);
        return out;
    }

    auto parsed = FieldMapCodec::parse(record.payload);
    if (parsed.is_error()) {
        utils::log::warn(std::format("record {}: {} ({}), passing through unredacted",
            record.record_id, parsed.error_message(),
            error_category_to_string(parsed.error_category())));
        outcome = RecordOutcome::MALFORMED;
        out.redacted_json = record.payload;
        return out;
    }

    const auto result = engine_.process(parsed.value());
    outcome = RecordOutcome::PROCESSED;
    out.redacted_json = FieldMapCodec::serialize(result.fields);
    out.is_pii = result.is_pii;
    return out;
}

unsigned BatchProcessor::worker_count(size_t num_records) const {
    if (num_records < config_.parallel_threshold) {
        return 1;
    }
    const unsigned requested = config_.threads > 0
        ? static_cast<unsigned>(config_.threads)
        : std::thread::hardware_concurrency();
    return std::clamp(requested, 1u, kMaxWorkers);
}

std::vector<OutputRecord> BatchProcessor::process_all(
    const std::vector<RawRecord>& records, BatchStats& stats) const {

    utils::Timer timer;
    const size_t num_records = records.size();

    std::vector<OutputRecord> outputs(num_records);
    std::vector<RecordOutcome> outcomes(num_records, RecordOutcome::PROCESSED);

    // Each worker owns a disjoint index range [start, end)
    auto process_range = [&](size_t start, size_t end) {
        for (size_t i = start; i < end; ++i) {
            outputs[i] = process_one(records[i], outcomes[i]);
        }
    };

    const unsigned num_workers = worker_count(num_records);
    if (num_workers > 1) {
        const size_t chunk = (num_records + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (unsigned w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_records);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, process_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        process_range(0, num_records);
    }

    stats = BatchStats{};
    stats.total = num_records;
    for (size_t i = 0; i < num_records; ++i) {
        switch (outcomes[i]) {
            case RecordOutcome::PROCESSED:
                if (outputs[i].is_pii) ++stats.pii;
                break;
            case RecordOutcome::EMPTY_PAYLOAD:
                ++stats.empty;
                break;
            case RecordOutcome::MALFORMED:
                ++stats.malformed;
                break;
        }
    }
    stats.elapsed = timer.elapsed_us();
    return outputs;
}

} // namespace piiredact
