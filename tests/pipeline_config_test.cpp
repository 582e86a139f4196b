#include "signalflow/pipeline_config.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace signalflow;

TEST(PipelineConfigTest, EmptyObjectUsesDefaults) {
    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(ParsePipelineConfig("{}", &config, &error)) << error;

    EXPECT_EQ(config.preset, "combined");
    EXPECT_EQ(config.signal.leftLookback, 5u);
    EXPECT_DOUBLE_EQ(config.signal.changePenalty, 20.0);
    EXPECT_EQ(config.solver.min_size, 2u);
    EXPECT_EQ(config.solver.jump, 5u);
    EXPECT_EQ(config.timestamp_column, "Datetime");
    EXPECT_EQ(config.close_column, "Close");
    EXPECT_EQ(config.output_column, "cpd_pvt_signals");
    EXPECT_TRUE(config.technical_signals);
    EXPECT_EQ(config.recent_limit, 10u);
    EXPECT_FALSE(config.since.has_value());
    EXPECT_TRUE(error.empty());
}

TEST(PipelineConfigTest, PresetThenOverrides) {
    const std::string text = R"({
        "preset": "light",
        "signal": { "change_penalty": 4.5, "change_model": "L2" },
        "solver": { "jump": 1 },
        "symbols": ["RELIANCE", "TCS"],
        "parallel": false,
        "since": "2025-02-04"
    })";

    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(ParsePipelineConfig(text, &config, &error)) << error;

    EXPECT_EQ(config.signal.leftLookback, 3u);
    EXPECT_EQ(config.signal.proximityWindow, 5u);
    EXPECT_DOUBLE_EQ(config.signal.changePenalty, 4.5);
    EXPECT_EQ(config.signal.changeModel, CostModel::L2);
    EXPECT_EQ(config.solver.jump, 1u);
    EXPECT_EQ(config.symbols, (std::vector<std::string>{"RELIANCE", "TCS"}));
    EXPECT_FALSE(config.parallel);
    ASSERT_TRUE(config.since.has_value());
    EXPECT_EQ(*config.since, 1738627200);
}

TEST(PipelineConfigTest, RejectsInvalidValues) {
    const std::vector<std::string> invalid = {
        R"({"preset": "aggressive"})",
        R"({"signal": {"change_model": "ar"}})",
        R"({"signal": {"change_penalty": -2}})",
        R"({"signal": {"left_lookback": -1}})",
        R"({"solver": {"jump": 0}})",
        R"({"symbols": "TCS"})",
        R"({"since": "yesterday"})",
        R"({"parallel": "yes"})",
        R"([1, 2])",
        "{ not json",
    };

    for (const auto& text : invalid) {
        PipelineConfig config;
        config.output_column = "untouched";
        std::string error;
        EXPECT_FALSE(ParsePipelineConfig(text, &config, &error)) << text;
        EXPECT_FALSE(error.empty()) << text;
        EXPECT_EQ(config.output_column, "untouched") << text;
    }
}

TEST(PipelineConfigTest, SerializedConfigParsesBack) {
    PipelineConfig original;
    original.signal.proximityWindow = 12;
    original.signal.changeModel = CostModel::Normal;
    original.symbols = {"INFY"};
    original.since = ParseUtcDateTime("2025-02-04 09:15:00");

    PipelineConfig parsed;
    std::string error;
    ASSERT_TRUE(ParsePipelineConfig(original.ToJsonString(), &parsed, &error)) << error;

    EXPECT_EQ(parsed.signal.proximityWindow, 12u);
    EXPECT_EQ(parsed.signal.changeModel, CostModel::Normal);
    EXPECT_EQ(parsed.symbols, original.symbols);
    EXPECT_EQ(parsed.since, original.since);
}

TEST(PipelineConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "signalflow_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"close_column": "Adj Close", "recent_limit": 3})";
    }

    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(LoadPipelineConfig(path, &config, &error)) << error;
    EXPECT_EQ(config.close_column, "Adj Close");
    EXPECT_EQ(config.recent_limit, 3u);
    std::filesystem::remove(path);

    EXPECT_FALSE(LoadPipelineConfig(path, &config, &error));
    EXPECT_NE(error.find("Unable to open"), std::string::npos);
}

TEST(DateTimeTest, ParsesAndFormatsUtc) {
    EXPECT_EQ(ParseUtcDateTime("1970-01-02"), 86400);
    EXPECT_EQ(ParseUtcDateTime("2025-02-04 09:15:00"), 1738660500);
    EXPECT_FALSE(ParseUtcDateTime("04/02/2025").has_value());
    EXPECT_EQ(FormatUtcDateTime(1738660500), "2025-02-04 09:15:00");
    EXPECT_EQ(FormatUtcDateTime(1738660500, "%d-%b-%y %H:%M"), "04-Feb-25 09:15");
}

TEST(PipelineConfigTest, OutOfRangeCountsAreErrorsNotExceptions) {
    const std::vector<std::string> invalid = {
        R"({"recent_limit": 18446744073709551615})",
        R"({"solver": {"jump": 1e300}})",
        R"({"signal": {"proximity_window": -1e300}})",
        R"({"recent_limit": 2.5})",
    };

    for (const auto& text : invalid) {
        PipelineConfig config;
        std::string error;
        bool ok = true;
        EXPECT_NO_THROW(ok = ParsePipelineConfig(text, &config, &error)) << text;
        EXPECT_FALSE(ok) << text;
        EXPECT_NE(error.find("must be an integer"), std::string::npos) << text;
    }

    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(ParsePipelineConfig(R"({"recent_limit": 25.0})", &config, &error)) << error;
    EXPECT_EQ(config.recent_limit, 25u);
}

TEST(PipelineConfigTest, SymbolsFileKeys) {
    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(ParsePipelineConfig(R"({"symbols_file": "imp_files/nifty_100.csv", "symbol_column": "Symbol"})",
                                    &config, &error)) << error;
    EXPECT_EQ(config.symbols_file, "imp_files/nifty_100.csv");
    EXPECT_EQ(config.symbol_column, "Symbol");

    PipelineConfig parsed;
    ASSERT_TRUE(ParsePipelineConfig(config.ToJsonString(), &parsed, &error)) << error;
    EXPECT_EQ(parsed.symbols_file, config.symbols_file);
    EXPECT_EQ(parsed.symbol_column, "Symbol");

    PipelineConfig defaults;
    EXPECT_TRUE(defaults.symbols_file.empty());
    EXPECT_EQ(defaults.symbol_column, "SYMBOL");
    ASSERT_TRUE(ParsePipelineConfig(defaults.ToJsonString(), &parsed, &error)) << error;
    EXPECT_TRUE(parsed.symbols_file.empty());
}
