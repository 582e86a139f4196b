#include "signalflow/dataframe_io.h"

#include <arrow/buffer.h>
#include <arrow/csv/api.h>
#include <arrow/csv/writer.h>
#include <arrow/io/file.h>
#include <arrow/io/memory.h>
#include <arrow/util/macros.h>

#include <algorithm>
#include <sstream>
#include <vector>

namespace signalflow {

WhitespaceNormalizingInputStream::WhitespaceNormalizingInputStream(
    std::shared_ptr<arrow::io::InputStream> underlying, char normalized_delimiter)
    : underlying_(std::move(underlying)),
      normalized_delimiter_(normalized_delimiter) {}

arrow::Status WhitespaceNormalizingInputStream::Close() {
    return underlying_->Close();
}

bool WhitespaceNormalizingInputStream::closed() const {
    return underlying_->closed();
}

arrow::Result<int64_t> WhitespaceNormalizingInputStream::Tell() const {
    return pos_;
}

arrow::Result<std::shared_ptr<arrow::Buffer>> WhitespaceNormalizingInputStream::Read(int64_t nbytes) {
    ARROW_ASSIGN_OR_RAISE(auto out_buffer, arrow::AllocateResizableBuffer(nbytes));
    ARROW_ASSIGN_OR_RAISE(int64_t bytes_read, Read(nbytes, out_buffer->mutable_data()));
    ARROW_RETURN_NOT_OK(out_buffer->Resize(bytes_read));
    return std::shared_ptr<arrow::Buffer>(std::move(out_buffer));
}

arrow::Result<int64_t> WhitespaceNormalizingInputStream::Read(int64_t nbytes, void* out) {
    auto write_ptr = static_cast<char*>(out);
    auto write_end = write_ptr + nbytes;

    while (write_ptr < write_end) {
        if (read_ptr_ == read_end_) {
            ARROW_ASSIGN_OR_RAISE(read_buffer_, underlying_->Read(32768));
            if (read_buffer_->size() == 0) {
                break;
            }
            read_ptr_ = reinterpret_cast<const char*>(read_buffer_->data());
            read_end_ = read_ptr_ + read_buffer_->size();
        }

        // A blank run becomes one delimiter, emitted only once the next field
        // starts, so leading and trailing blanks on a line are dropped.
        while (read_ptr_ < read_end_ && write_ptr < write_end) {
            const char c = *read_ptr_;
            if (c == ' ' || c == '\t') {
                in_whitespace_ = true;
                ++read_ptr_;
                continue;
            }
            if (c == '\n' || c == '\r') {
                *write_ptr++ = c;
                ++read_ptr_;
                in_whitespace_ = false;
                at_line_start_ = true;
                continue;
            }
            if (in_whitespace_ && !at_line_start_) {
                *write_ptr++ = normalized_delimiter_;
                in_whitespace_ = false;
                if (write_ptr == write_end) {
                    break;
                }
            }
            *write_ptr++ = c;
            ++read_ptr_;
            in_whitespace_ = false;
            at_line_start_ = false;
        }
    }

    int64_t total_written = write_ptr - static_cast<char*>(out);
    pos_ += total_written;
    return total_written;
}

arrow::Result<AnalyticsDataFrame> DataFrameIO::read_csv(
    const std::string& file_path,
    const CsvReadOptions& options) {

    ARROW_ASSIGN_OR_RAISE(auto input_file, arrow::io::ReadableFile::Open(file_path));

    char delimiter = options.delimiter;
    if (options.auto_detect_delimiter) {
        ARROW_ASSIGN_OR_RAISE(auto buffer, input_file->Read(1024));
        std::string sample(reinterpret_cast<const char*>(buffer->data()), buffer->size());

        std::istringstream stream(sample);
        std::string first_line;
        std::getline(stream, first_line);
        delimiter = detect_delimiter(first_line);

        ARROW_RETURN_NOT_OK(input_file->Seek(0));
    }

    return read_stream(input_file, delimiter, options);
}

arrow::Result<AnalyticsDataFrame> DataFrameIO::read_csv_text(
    const std::string& text,
    const CsvReadOptions& options) {

    char delimiter = options.delimiter;
    if (options.auto_detect_delimiter) {
        delimiter = detect_delimiter(text.substr(0, text.find('\n')));
    }

    auto input = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(text));
    return read_stream(input, delimiter, options);
}

arrow::Status DataFrameIO::write_csv(
    const AnalyticsDataFrame& df,
    const std::string& file_path,
    const CsvWriteOptions& options) {

    auto table = df.get_table();
    if (!table) {
        return arrow::Status::Invalid("No table data available");
    }

    ARROW_ASSIGN_OR_RAISE(auto output_stream, arrow::io::FileOutputStream::Open(file_path));

    auto write_options = arrow::csv::WriteOptions::Defaults();
    write_options.include_header = options.write_header;
    write_options.delimiter = options.delimiter;

    ARROW_RETURN_NOT_OK(arrow::csv::WriteCSV(*table, write_options, output_stream.get()));
    return output_stream->Close();
}

char DataFrameIO::detect_delimiter(const std::string& sample_line) {
    const std::vector<char> delimiters = {'\t', ',', ';', '|', ' '};
    std::vector<long> counts(delimiters.size(), 0);

    for (std::size_t i = 0; i < delimiters.size() - 1; ++i) {
        counts[i] = std::count(sample_line.begin(), sample_line.end(), delimiters[i]);
    }

    // Runs of blanks count once.
    long space_delimiters = 0;
    for (std::size_t i = 1; i < sample_line.length(); ++i) {
        if (sample_line[i] == ' ' && sample_line[i - 1] != ' ' && sample_line[i - 1] != '\t') {
            ++space_delimiters;
        }
    }
    counts[4] = space_delimiters;

    auto max_it = std::max_element(counts.begin(), counts.end());
    if (*max_it == 0) {
        return ',';
    }
    return delimiters[static_cast<std::size_t>(std::distance(counts.begin(), max_it))];
}

arrow::Result<AnalyticsDataFrame> DataFrameIO::read_stream(
    std::shared_ptr<arrow::io::InputStream> input,
    char delimiter,
    const CsvReadOptions& options) {

    if (delimiter == ' ') {
        input = std::make_shared<WhitespaceNormalizingInputStream>(input);
        delimiter = '\t';
    }

    ARROW_ASSIGN_OR_RAISE(auto table, parse_csv_stream(input, delimiter, options.has_header));

    AnalyticsDataFrame df(std::move(table));
    if (!options.timestamp_column.empty()) {
        if (!df.has_column(options.timestamp_column)) {
            return arrow::Status::Invalid("Timestamp column not found: ", options.timestamp_column);
        }
        df.set_timestamp_column(options.timestamp_column);
    }
    return df;
}

arrow::Result<std::shared_ptr<arrow::Table>> DataFrameIO::parse_csv_stream(
    std::shared_ptr<arrow::io::InputStream> input,
    char delimiter,
    bool has_header) {

    arrow::csv::ReadOptions read_options = arrow::csv::ReadOptions::Defaults();
    read_options.use_threads = true;
    read_options.autogenerate_column_names = !has_header;

    arrow::csv::ParseOptions parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = delimiter;

    arrow::csv::ConvertOptions convert_options = arrow::csv::ConvertOptions::Defaults();

    ARROW_ASSIGN_OR_RAISE(auto reader, arrow::csv::TableReader::Make(
        arrow::io::default_io_context(),
        input,
        read_options,
        parse_options,
        convert_options));

    return reader->Read();
}

} // namespace signalflow
