#pragma once

#include "core/pii_engine.hpp"
#include "io/record_io.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace piiredact {

enum class RecordOutcome {
    PROCESSED,
    EMPTY_PAYLOAD,      // Written as "{}" with is_pii = false
    MALFORMED           // Raw payload passed through with is_pii = false
};

struct BatchStats {
    size_t total = 0;
    size_t pii = 0;
    size_t malformed = 0;
    size_t empty = 0;
    std::chrono::microseconds elapsed{0};
};

/**
 * @brief Runs a batch of raw records through the engine
 *
 * Output order always matches input order. Large batches are split into
 * contiguous chunks processed concurrently; the engine is shared read-only.
 * A bad payload only affects its own row.
 */
class BatchProcessor {
public:
    struct Config {
        size_t threads = 0;                 // 0 = hardware concurrency
        size_t parallel_threshold = 1000;
    };

    static constexpr unsigned kMaxWorkers = 4;

    explicit BatchProcessor(const PiiEngine& engine)
        : BatchProcessor(engine, Config{}) {}
    BatchProcessor(const PiiEngine& engine, const Config& config)
        : engine_(engine), config_(config) {}

    /**
     * @brief Process one record; never throws for bad payloads
     */
    [[nodiscard]] OutputRecord process_one(const RawRecord& record, RecordOutcome& outcome) const;

    [[nodiscard]] std::vector<OutputRecord> process_all(
        const std::vector<RawRecord>& records, BatchStats& stats) const;

private:
    [[nodiscard]] unsigned worker_count(size_t num_records) const;

    const PiiEngine& engine_;
    Config config_;
};

} // namespace piiredact
