#include <catch2/catch_test_macros.hpp>
#include "io/csv.hpp"
#include "io/record_io.hpp"

#include <sstream>

using namespace piiredact;

// ============================================================================
// CsvReader
// ============================================================================

TEST_CASE("Csv: header and rows", "[csv]") {
    CsvReader reader;
    const auto result = reader.parse("record_id,data_json\n1,{}\n2,x\n");
    REQUIRE(result.is_ok());

    const auto& table = result.value();
    REQUIRE(table.header.size() == 2);
    CHECK(table.header[1] == "data_json");
    REQUIRE(table.rows.size() == 2);
    CHECK(table.rows[0][0] == "1");
    CHECK(table.rows[1][1] == "x");
    CHECK(table.column_index("data_json") == 1);
    CHECK_FALSE(table.column_index("missing").has_value());
}

TEST_CASE("Csv: quoted fields with delimiters, quotes and newlines", "[csv]") {
    CsvReader reader;
    const auto result = reader.parse(
        "record_id,data_json\r\n"
        "1,\"{\"\"phone\"\": \"\"9876543210\"\", \"\"n\"\": 1}\"\r\n"
        "2,\"line one\nline two\"\r\n");
    REQUIRE(result.is_ok());

    const auto& rows = result.value().rows;
    REQUIRE(rows.size() == 2);
    CHECK(rows[0][1] == R"({"phone": "9876543210", "n": 1})");
    CHECK(rows[1][1] == "line one\nline two");
}

TEST_CASE("Csv: BOM, blank lines and missing trailing newline", "[csv]") {
    CsvReader reader;
    const auto result = reader.parse("\xEF\xBB\xBFrecord_id,data_json\n\n1,a\n\n2,b");
    REQUIRE(result.is_ok());

    const auto& table = result.value();
    CHECK(table.header[0] == "record_id");
    REQUIRE(table.rows.size() == 2);
    CHECK(table.rows[1][1] == "b");
}

TEST_CASE("Csv: short rows are padded to the header width", "[csv]") {
    CsvReader reader;
    const auto result = reader.parse("a,b,c\n1\n");
    REQUIRE(result.is_ok());
    REQUIRE(result.value().rows.size() == 1);
    CHECK(result.value().rows[0].size() == 3);
    CHECK(result.value().rows[0][2].empty());
}

TEST_CASE("Csv: custom delimiter", "[csv]") {
    CsvReader reader(';');
    const auto result = reader.parse("record_id;data_json\n7;{\"a\":1}\n");
    REQUIRE(result.is_ok());
    CHECK(result.value().rows[0][1] == R"({"a":1})");
}

TEST_CASE("Csv: errors", "[csv]") {
    CsvReader reader;

    SECTION("Unterminated quote") {
        const auto result = reader.parse("a,b\n1,\"open\n");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    }

    SECTION("Empty input") {
        const auto result = reader.parse("");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    }

    SECTION("Missing file") {
        const auto result = reader.read_file("/nonexistent/dir/input.csv");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    }
}

// ============================================================================
// CsvWriter
// ============================================================================

TEST_CASE("Csv: writer quotes only when needed", "[csv]") {
    std::ostringstream out;
    CsvWriter writer(out);
    writer.write_row({"1", R"({"a":"b,c"})", "plain"});

    CHECK(out.str() == "1,\"{\"\"a\"\":\"\"b,c\"\"}\",plain\n");
    CHECK(writer.quote("no special") == "no special");
    CHECK(writer.quote("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("Csv: written rows read back unchanged", "[csv]") {
    std::ostringstream out;
    CsvWriter writer(out);
    writer.write_row({"record_id", "redacted_data_json"});
    writer.write_row({"1", R"({"name":"RXXX KXXX","note":"a, \"b\""})"});

    CsvReader reader;
    const auto result = reader.parse(out.str());
    REQUIRE(result.is_ok());
    REQUIRE(result.value().rows.size() == 1);
    CHECK(result.value().rows[0][1] == R"({"name":"RXXX KXXX","note":"a, \"b\""})");
}

// ============================================================================
// RecordSource / RecordSink
// ============================================================================

TEST_CASE("RecordIo: source picks the first payload column present", "[csv][record_io]") {
    CsvReader reader;
    const auto table = reader.parse("record_id,Data_json\n1,{}\n2,\n");
    REQUIRE(table.is_ok());

    const auto records = RecordSource::from_table(table.value(), InputConfig{});
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 2);
    CHECK(records.value()[0].record_id == "1");
    CHECK(records.value()[0].payload == "{}");
    CHECK(records.value()[1].payload.empty());
}

TEST_CASE("RecordIo: missing columns are parse errors", "[csv][record_io]") {
    CsvReader reader;

    SECTION("No id column") {
        const auto table = reader.parse("id,data_json\n1,{}\n");
        REQUIRE(table.is_ok());
        const auto records = RecordSource::from_table(table.value(), InputConfig{});
        REQUIRE(records.is_error());
        CHECK(records.error_category() == ErrorCategory::PARSE_ERROR);
    }

    SECTION("No payload column") {
        const auto table = reader.parse("record_id,payload\n1,{}\n");
        REQUIRE(table.is_ok());
        const auto records = RecordSource::from_table(table.value(), InputConfig{});
        REQUIRE(records.is_error());
        CHECK(records.error_category() == ErrorCategory::PARSE_ERROR);
    }
}

TEST_CASE("RecordIo: sink writes header and True/False verdicts", "[csv][record_io]") {
    std::ostringstream out;
    RecordSink sink(out, OutputConfig{});
    sink.write_header();
    sink.write({"1", R"({"phone":"98XXXXXX10"})", true});
    sink.write({"2", "{}", false});

    CHECK(out.str() ==
          "record_id,redacted_data_json,is_pii\n"
          "1,\"{\"\"phone\"\":\"\"98XXXXXX10\"\"}\",True\n"
          "2,{},False\n");
}
