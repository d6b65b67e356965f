#include "config/config_loader.hpp"
#include "core/batch_processor.hpp"
#include "core/pii_engine.hpp"
#include "core/utils.hpp"
#include "io/csv.hpp"
#include "io/record_io.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

using namespace piiredact;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

struct CliOptions {
    std::string input_file;
    std::optional<std::string> output_file;
    std::optional<std::string> config_file;
    std::optional<int> threads;
};

void print_usage(const char* prog) {
    utils::log::error(std::format(
        "Usage: {} <input.csv> [-o output.csv] [-c config.toml] [-t threads]", prog));
}

std::optional<int> parse_threads(std::string_view text) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

// Returns nullopt (after logging why) on any usage error
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool takes_value = (arg == "-o" || arg == "-c" || arg == "-t");

        if (takes_value) {
            if (i + 1 >= argc) {
                utils::log::error(std::format("Option {} requires a value", arg));
                return std::nullopt;
            }
            const std::string value = argv[++i];
            if (arg == "-o") {
                opts.output_file = value;
            } else if (arg == "-c") {
                opts.config_file = value;
            } else {
                opts.threads = parse_threads(value);
                if (!opts.threads) {
                    utils::log::error(std::format("Invalid thread count '{}'", value));
                    return std::nullopt;
                }
            }
        } else if (!arg.empty() && arg.front() == '-') {
            utils::log::error(std::format("Unknown option {}", arg));
            return std::nullopt;
        } else if (opts.input_file.empty()) {
            opts.input_file = std::string(arg);
        } else {
            utils::log::error(std::format("Unexpected argument '{}'", arg));
            return std::nullopt;
        }
    }

    if (opts.input_file.empty()) {
        return std::nullopt;
    }
    return opts;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argc > 0 ? argv[0] : "pii_redactor");
        return kExitUsage;
    }

    try {
        utils::log::info("PII Redactor starting...");

        // [1/4] Configuration
        RedactorConfig config;
        if (opts->config_file) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", *opts->config_file));
            auto config_result = ConfigLoader::load_from_file(*opts->config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return kExitFailure;
            }
            config = std::move(config_result.config);
        } else {
            utils::log::info("[1/4] No config file given, using built-in defaults");
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        if (opts->output_file) config.output.file = *opts->output_file;
        if (opts->threads) config.processing.threads = *opts->threads;

        // [2/4] Input
        utils::log::info(std::format("[2/4] Reading {}", opts->input_file));
        const CsvReader reader(config.input.delimiter);
        const auto table = reader.read_file(opts->input_file);
        if (table.is_error()) {
            utils::log::error(std::format("{} ({})", table.error_message(),
                error_category_to_string(table.error_category())));
            return kExitFailure;
        }

        const auto records = RecordSource::from_table(table.value(), config.input);
        if (records.is_error()) {
            utils::log::error(std::format("{}: {}", opts->input_file, records.error_message()));
            return kExitFailure;
        }

        // [3/4] Classification + redaction
        utils::log::info(std::format("[3/4] Processing {} records", records.value().size()));
        PiiEngine::Config engine_config;
        engine_config.rules = config.rules;
        engine_config.masking = config.masking;
        const PiiEngine engine(engine_config);

        BatchProcessor::Config batch_config;
        batch_config.threads = static_cast<size_t>(config.processing.threads);
        batch_config.parallel_threshold = static_cast<size_t>(config.processing.parallel_threshold);
        const BatchProcessor processor(engine, batch_config);

        BatchStats stats;
        const auto outputs = processor.process_all(records.value(), stats);

        // [4/4] Output
        utils::log::info(std::format("[4/4] Writing {}", config.output.file));
        std::ofstream out(config.output.file, std::ios::binary | std::ios::trunc);
        if (!out) {
            utils::log::error(std::format("Cannot open output file {}", config.output.file));
            return kExitFailure;
        }

        RecordSink sink(out, config.output);
        sink.write_header();
        for (const auto& record : outputs) {
            sink.write(record);
        }
        out.flush();
        if (!out) {
            utils::log::error(std::format("Write to {} failed", config.output.file));
            return kExitFailure;
        }

        utils::log::info(std::format(
            "Processed {} records in {}ms: {} PII, {} malformed, {} empty",
            stats.total, stats.elapsed.count() / 1000, stats.pii, stats.malformed, stats.empty));
        utils::log::info(std::format("OK: wrote {}", config.output.file));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }

    return kExitOk;
}
