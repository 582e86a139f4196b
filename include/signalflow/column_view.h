#pragma once

#include <arrow/array/array_primitive.h>
#include <arrow/array/concatenate.h>
#include <arrow/chunked_array.h>
#include <arrow/result.h>
#include <arrow/table.h>
#include <arrow/type_traits.h>

#include <cstddef>
#include <memory>
#include <string>

namespace signalflow {

// Read-only typed view over one primitive Arrow column. Multi-chunk columns
// are concatenated once; single-chunk columns are not copied. The view shares
// ownership of the array it reads from.
template<typename T>
class ColumnView {
    using ArrowType = typename arrow::CTypeTraits<T>::ArrowType;
    using ArrayType = typename arrow::TypeTraits<ArrowType>::ArrayType;

public:
    static arrow::Result<ColumnView<T>> from_arrow_column(
        const std::shared_ptr<arrow::Table>& table,
        const std::string& column_name) {
        if (!table) {
            return arrow::Status::Invalid("Input table is null");
        }
        return from_chunked_array(table->GetColumnByName(column_name), column_name);
    }

    static arrow::Result<ColumnView<T>> from_chunked_array(
        const std::shared_ptr<arrow::ChunkedArray>& column,
        const std::string& column_name) {
        if (!column) {
            return arrow::Status::Invalid("Column not found: ", column_name);
        }
        if (!column->type()->Equals(arrow::TypeTraits<ArrowType>::type_singleton())) {
            return arrow::Status::TypeError("Column '", column_name, "' is ",
                                            column->type()->ToString(), ", expected ",
                                            arrow::TypeTraits<ArrowType>::type_singleton()->ToString());
        }
        if (column->num_chunks() == 0) {
            return ColumnView<T>(nullptr);
        }
        if (column->num_chunks() == 1) {
            return ColumnView<T>(std::static_pointer_cast<ArrayType>(column->chunk(0)));
        }
        ARROW_ASSIGN_OR_RAISE(auto combined, arrow::Concatenate(column->chunks()));
        return ColumnView<T>(std::static_pointer_cast<ArrayType>(combined));
    }

    const T* data() const { return array_ ? array_->raw_values() : nullptr; }
    std::size_t size() const { return array_ ? static_cast<std::size_t>(array_->length()) : 0; }
    int64_t null_count() const { return array_ ? array_->null_count() : 0; }

    const T* begin() const { return data(); }
    const T* end() const { return data() + size(); }

    T operator[](std::size_t i) const { return array_->Value(static_cast<int64_t>(i)); }
    bool is_valid(std::size_t i) const { return array_->IsValid(static_cast<int64_t>(i)); }

private:
    explicit ColumnView(std::shared_ptr<ArrayType> array) : array_(std::move(array)) {}

    std::shared_ptr<ArrayType> array_;
};

} // namespace signalflow
