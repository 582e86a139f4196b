#pragma once

#include "signal_fuser.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace signalflow {

struct SolverSettings {
    std::size_t min_size = 2;
    std::size_t jump = 5;
};

struct PipelineConfig {
    std::string preset = "combined";
    SignalConfig signal = SignalConfig::combined();
    SolverSettings solver;

    std::string timestamp_column = "Datetime";
    // strptime format used when the timestamp column holds strings.
    std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
    std::string close_column = "Close";
    std::string output_column = "cpd_pvt_signals";
    bool technical_signals = true;

    std::string data_directory = "stocks_data";
    std::vector<std::string> symbols;
    // CSV universe file; when set, its symbol column replaces `symbols`.
    std::string symbols_file;
    std::string symbol_column = "SYMBOL";
    bool parallel = true;
    std::size_t recent_limit = 10;
    // Only bars strictly after this instant (unix seconds) are reported.
    std::optional<int64_t> since;
    std::string output_path = "output.csv";

    [[nodiscard]] std::string ToJsonString() const;
};

// Parses "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" as UTC.
std::optional<int64_t> ParseUtcDateTime(const std::string& text);
std::string FormatUtcDateTime(int64_t unix_seconds, const char* format = "%Y-%m-%d %H:%M:%S");

bool ParsePipelineConfig(const std::string& text,
                         PipelineConfig* config,
                         std::string* error = nullptr);

bool LoadPipelineConfig(const std::filesystem::path& file_path,
                        PipelineConfig* config,
                        std::string* error = nullptr);

} // namespace signalflow
