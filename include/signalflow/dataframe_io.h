#pragma once

#include "analytics_dataframe.h"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>

namespace signalflow {

// Collapses runs of spaces and tabs into a single delimiter so Arrow's CSV
// reader can parse space-aligned bar files.
class WhitespaceNormalizingInputStream : public arrow::io::InputStream {
public:
    WhitespaceNormalizingInputStream(std::shared_ptr<arrow::io::InputStream> underlying,
                                     char normalized_delimiter = '\t');

    bool closed() const override;
    arrow::Result<int64_t> Tell() const override;
    arrow::Result<int64_t> Read(int64_t nbytes, void* out) override;
    arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override;

private:
    arrow::Status Close() override;

    std::shared_ptr<arrow::io::InputStream> underlying_;
    std::shared_ptr<arrow::Buffer> read_buffer_;
    const char* read_ptr_ = nullptr;
    const char* read_end_ = nullptr;
    int64_t pos_ = 0;
    bool in_whitespace_ = false;
    bool at_line_start_ = true;
    char normalized_delimiter_;
};

struct CsvReadOptions {
    bool auto_detect_delimiter = true;
    char delimiter = ',';
    bool has_header = true;
    // When set, becomes the frame's timestamp column.
    std::string timestamp_column;

    static CsvReadOptions Defaults() {
        return CsvReadOptions{};
    }
};

struct CsvWriteOptions {
    char delimiter = ',';
    bool write_header = true;

    static CsvWriteOptions Defaults() {
        return CsvWriteOptions{};
    }
};

class DataFrameIO {
public:
    static arrow::Result<AnalyticsDataFrame> read_csv(
        const std::string& file_path,
        const CsvReadOptions& options = CsvReadOptions::Defaults());

    // Parses CSV text held in memory.
    static arrow::Result<AnalyticsDataFrame> read_csv_text(
        const std::string& text,
        const CsvReadOptions& options = CsvReadOptions::Defaults());

    static arrow::Status write_csv(
        const AnalyticsDataFrame& df,
        const std::string& file_path,
        const CsvWriteOptions& options = CsvWriteOptions::Defaults());

    static char detect_delimiter(const std::string& sample_line);

private:
    static arrow::Result<AnalyticsDataFrame> read_stream(
        std::shared_ptr<arrow::io::InputStream> input,
        char delimiter,
        const CsvReadOptions& options);

    static arrow::Result<std::shared_ptr<arrow::Table>> parse_csv_stream(
        std::shared_ptr<arrow::io::InputStream> input,
        char delimiter,
        bool has_header);
};

} // namespace signalflow
