// letters_per_group_cli_test.cpp - End-to-end tests for the letters_per_group tool
//
// Tests for:
//   - Argument handling: --help, missing required args, unknown args
//   - CSV in -> CSV letters table out, skipped partitions reported
//   - Option plumbing: --alpha, --adjust, --order, custom column names
//   - Parquet output and JSON summary
//   - Error reporting for bad input

#include <gtest/gtest.h>

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>

#include "test_cli_helpers.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

using cli_test_helpers::BINARY_PATH;
using cli_test_helpers::read_all_lines;
using cli_test_helpers::read_text;
using cli_test_helpers::run_command;
using cli_test_helpers::temp_path;
using cli_test_helpers::write_text;

// E1 separates three treatments; E2 has a single treatment.
std::string sample_csv() {
    std::string csv = "Enzyme,Treatment,Viability\n";
    for (int v = 1; v <= 5; ++v) csv += "E1,ctrl," + std::to_string(v) + "\n";
    for (int v = 6; v <= 10; ++v) csv += "E1,low," + std::to_string(v) + "\n";
    for (int v = 11; v <= 15; ++v) csv += "E1,high," + std::to_string(v) + "\n";
    csv += "E2,ctrl,0.5\nE2,ctrl,0.7\n";
    return csv;
}

class LettersCliTest : public ::testing::Test {
protected:
    std::string input_ = temp_path("input.csv");
    std::string output_ = temp_path("letters.csv");
    std::string parquet_ = temp_path("letters.parquet");
    std::string summary_ = temp_path("summary.json");

    void SetUp() override { write_text(input_, sample_csv()); }

    void TearDown() override {
        for (const auto& p : {input_, output_, parquet_, summary_}) {
            std::filesystem::remove(p);
        }
    }

    std::string base_cmd() const {
        return BINARY_PATH + " --input " + input_ + " --output " + output_;
    }
};

}  // anonymous namespace

// ===========================================================================
// Argument handling
// ===========================================================================

TEST_F(LettersCliTest, BinaryExists) {
    EXPECT_TRUE(std::filesystem::exists(BINARY_PATH))
        << "Expected binary at " << BINARY_PATH;
}

TEST_F(LettersCliTest, HelpExitsZero) {
    auto result = run_command(BINARY_PATH + " --help");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("--partition-col"), std::string::npos) << result.output;
}

TEST_F(LettersCliTest, MissingInputExitsNonZero) {
    auto result = run_command(BINARY_PATH + " --output " + output_);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.output.find("--input"), std::string::npos) << result.output;
}

TEST_F(LettersCliTest, MissingOutputExitsNonZero) {
    auto result = run_command(BINARY_PATH + " --input " + input_);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.output.find("--output"), std::string::npos) << result.output;
}

TEST_F(LettersCliTest, UnknownArgumentExitsNonZero) {
    auto result = run_command(base_cmd() + " --bogus");
    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.output.find("--bogus"), std::string::npos) << result.output;
}

// ===========================================================================
// Letters table
// ===========================================================================

TEST_F(LettersCliTest, WritesLettersCsv) {
    auto result = run_command(base_cmd());
    ASSERT_EQ(result.exit_code, 0) << result.output;

    auto lines = read_all_lines(output_);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "partition,group,letters,mean,count");
    EXPECT_EQ(lines[1], "E1,ctrl,b,3,5");
    EXPECT_EQ(lines[2], "E1,high,a,13,5");
    EXPECT_EQ(lines[3], "E1,low,a,8,5");
}

TEST_F(LettersCliTest, ReportsSkippedPartition) {
    auto result = run_command(base_cmd());
    ASSERT_EQ(result.exit_code, 0) << result.output;
    EXPECT_NE(result.output.find("SKIP: E2"), std::string::npos) << result.output;
}

TEST_F(LettersCliTest, OrderOptionControlsRowOrder) {
    auto result = run_command(base_cmd() + " --order low,high,ctrl");
    ASSERT_EQ(result.exit_code, 0) << result.output;
    auto lines = read_all_lines(output_);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1].substr(0, 7), "E1,low,");
    EXPECT_EQ(lines[2].substr(0, 8), "E1,high,");
    EXPECT_EQ(lines[3].substr(0, 8), "E1,ctrl,");
}

TEST_F(LettersCliTest, AlphaOptionIsApplied) {
    auto result = run_command(base_cmd() + " --alpha 0.001");
    ASSERT_EQ(result.exit_code, 0) << result.output;
    auto lines = read_all_lines(output_);
    ASSERT_EQ(lines.size(), 4u);
    for (size_t i = 1; i < lines.size(); ++i) {
        EXPECT_NE(lines[i].find(",a,"), std::string::npos) << lines[i];
    }
}

TEST_F(LettersCliTest, InvalidAlphaFails) {
    auto result = run_command(base_cmd() + " --alpha 1.5");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("ERROR:"), std::string::npos) << result.output;
}

TEST_F(LettersCliTest, UnknownAdjustMethodFails) {
    auto result = run_command(base_cmd() + " --adjust fdr_bh");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("ERROR:"), std::string::npos) << result.output;
}

TEST_F(LettersCliTest, CustomColumnsAndNumericGroups) {
    write_text(input_,
               "site,dose,yield\n"
               "S1,0,1\nS1,0,2\nS1,0,3\nS1,0,4\nS1,0,5\n"
               "S1,10,11\nS1,10,12\nS1,10,13\nS1,10,14\nS1,10,15\n");
    auto result = run_command(base_cmd() +
                              " --partition-col site --group-col dose --value-col yield");
    ASSERT_EQ(result.exit_code, 0) << result.output;
    auto lines = read_all_lines(output_);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "S1,0,b,3,5");
    EXPECT_EQ(lines[2], "S1,10,a,13,5");
}

TEST_F(LettersCliTest, MissingColumnFails) {
    auto result = run_command(base_cmd() + " --group-col Dose");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("Dose"), std::string::npos) << result.output;
}

// ===========================================================================
// Parquet output and summary
// ===========================================================================

TEST_F(LettersCliTest, WritesParquetLettersTable) {
    auto result = run_command(BINARY_PATH + " --input " + input_ + " --output " + parquet_);
    ASSERT_EQ(result.exit_code, 0) << result.output;

    auto infile = arrow::io::ReadableFile::Open(parquet_).ValueOrDie();
    auto reader = parquet::arrow::OpenFile(infile, arrow::default_memory_pool()).ValueOrDie();
    std::shared_ptr<arrow::Table> table;
    ASSERT_TRUE(reader->ReadTable(&table).ok());
    EXPECT_EQ(table->num_rows(), 3);
    EXPECT_EQ(table->num_columns(), 5);
    EXPECT_EQ(table->schema()->field(2)->name(), "letters");
}

TEST_F(LettersCliTest, WritesJsonSummary) {
    auto result = run_command(base_cmd() + " --summary " + summary_ + " --adjust bonferroni");
    ASSERT_EQ(result.exit_code, 0) << result.output;
    auto json = read_text(summary_);
    EXPECT_NE(json.find("\"adjust\":\"bonferroni\""), std::string::npos) << json;
    EXPECT_NE(json.find("\"comparisons\":["), std::string::npos);
    EXPECT_NE(json.find("\"skipped\":[{\"partition\":\"E2\""), std::string::npos) << json;
}
