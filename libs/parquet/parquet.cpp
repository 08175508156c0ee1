#include "parquet.hpp"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <fmt/format.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace gridseries::parquet {

namespace {

inline void check(const arrow::Status& st, const char* what) {
    if (!st.ok()) {
        throw std::runtime_error(fmt::format("{} ({})", what, st.ToString()));
    }
}

auto build_string_array(const Column<std::string>& col) -> std::shared_ptr<arrow::Array> {
    arrow::StringBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(col.size())), "reserve failed");
    for (const auto& value : col) {
        check(builder.Append(value.data(), static_cast<int32_t>(value.size())),
              "append string failed");
    }
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), "finish string failed");
    return arr;
}

auto build_date_array(const Column<Date>& col) -> std::shared_ptr<arrow::Array> {
    arrow::Date32Builder builder;
    check(builder.Reserve(static_cast<int64_t>(col.size())), "reserve failed");
    for (const auto& value : col) {
        check(builder.Append(value.days), "append date failed");
    }
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), "finish date failed");
    return arr;
}

auto build_double_array(const Column<double>& col) -> std::shared_ptr<arrow::Array> {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(col.size())), "reserve failed");
    for (double value : col) {
        check(builder.Append(value), "append double failed");
    }
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), "finish double failed");
    return arr;
}

auto to_arrow(const engine::SeriesTable& table) -> std::shared_ptr<arrow::Table> {
    std::vector<std::shared_ptr<arrow::Field>> fields{
        arrow::field(table.id_column, arrow::utf8()),
        arrow::field(table.date_column, arrow::date32()),
        arrow::field(table.value_column, arrow::float64()),
    };
    std::vector<std::shared_ptr<arrow::Array>> arrays{
        build_string_array(table.geography_ids),
        build_date_array(table.dates),
        build_double_array(table.values),
    };
    for (std::size_t i = 0; i < table.metadata.size(); ++i) {
        fields.push_back(arrow::field(table.metadata_columns[i], arrow::utf8()));
        arrays.push_back(build_string_array(table.metadata[i]));
    }
    return arrow::Table::Make(arrow::schema(std::move(fields)), arrays);
}

template <typename ArrayT, typename Fn>
void for_each_value(const std::shared_ptr<arrow::ChunkedArray>& chunked, Fn&& fn) {
    for (const auto& chunk : chunked->chunks()) {
        auto arr = std::static_pointer_cast<ArrayT>(chunk);
        for (int64_t i = 0; i < arr->length(); ++i) {
            if (arr->IsNull(i)) {
                throw std::runtime_error("unexpected null value");
            }
            fn(*arr, i);
        }
    }
}

auto read_strings(const std::shared_ptr<arrow::ChunkedArray>& chunked) -> Column<std::string> {
    Column<std::string> out;
    out.reserve(static_cast<std::size_t>(chunked->length()));
    for_each_value<arrow::StringArray>(chunked, [&](const arrow::StringArray& arr, int64_t i) {
        out.push_back(std::string(arr.GetView(i)));
    });
    return out;
}

}  // namespace

auto ParquetSeriesWriter::write_file(const engine::SeriesTable& table,
                                     const std::filesystem::path& path) const -> Result<void> {
    try {
        auto arrow_table = to_arrow(table);

        auto sink_result = arrow::io::FileOutputStream::Open(path.string());
        if (!sink_result.ok()) {
            return write_failure(fmt::format("{}: cannot open for writing ({})", path.string(),
                                             sink_result.status().ToString()));
        }
        auto props = ::parquet::WriterProperties::Builder()
                         .compression(::parquet::Compression::ZSTD)
                         ->build();
        auto sink = sink_result.ValueOrDie();
        auto st = ::parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), sink,
                                               /*chunk_size=*/static_cast<int64_t>(64) * 1024 * 1024,
                                               props);
        if (!st.ok()) {
            return write_failure(
                fmt::format("{}: failed to write ({})", path.string(), st.ToString()));
        }
        check(sink->Close(), "close failed");
    } catch (const std::exception& e) {
        return write_failure(fmt::format("{}: {}", path.string(), e.what()));
    }
    return {};
}

auto read_series(const std::filesystem::path& path) -> Result<engine::SeriesTable> {
    auto input_result = arrow::io::ReadableFile::Open(path.string());
    if (!input_result.ok()) {
        return source_read_failure(fmt::format("{}: failed to open ({})", path.string(),
                                               input_result.status().ToString()));
    }
    std::unique_ptr<::parquet::arrow::FileReader> reader;
    auto st = ::parquet::arrow::OpenFile(input_result.ValueOrDie(), arrow::default_memory_pool(),
                                         &reader);
    if (!st.ok()) {
        return source_read_failure(
            fmt::format("{}: failed to read ({})", path.string(), st.ToString()));
    }
    std::shared_ptr<arrow::Table> table;
    st = reader->ReadTable(&table);
    if (!st.ok()) {
        return source_read_failure(
            fmt::format("{}: failed to load table ({})", path.string(), st.ToString()));
    }

    const auto& schema = *table->schema();
    if (table->num_columns() < 3 || schema.field(0)->type()->id() != arrow::Type::STRING ||
        schema.field(1)->type()->id() != arrow::Type::DATE32 ||
        schema.field(2)->type()->id() != arrow::Type::DOUBLE) {
        return source_read_failure(
            fmt::format("{}: not a series artifact ({})", path.string(), schema.ToString()));
    }

    engine::SeriesTable out;
    try {
        out.id_column = schema.field(0)->name();
        out.date_column = schema.field(1)->name();
        out.value_column = schema.field(2)->name();
        out.geography_ids = read_strings(table->column(0));
        for_each_value<arrow::Date32Array>(table->column(1),
                                           [&](const arrow::Date32Array& arr, int64_t i) {
                                               out.dates.push_back(Date{arr.Value(i)});
                                           });
        for_each_value<arrow::DoubleArray>(table->column(2),
                                           [&](const arrow::DoubleArray& arr, int64_t i) {
                                               out.values.push_back(arr.Value(i));
                                           });
        for (int c = 3; c < table->num_columns(); ++c) {
            if (schema.field(c)->type()->id() != arrow::Type::STRING) {
                return source_read_failure(fmt::format("{}: metadata column '{}' is not UTF8",
                                                       path.string(), schema.field(c)->name()));
            }
            out.metadata_columns.push_back(schema.field(c)->name());
            out.metadata.push_back(read_strings(table->column(c)));
        }
    } catch (const std::exception& e) {
        return source_read_failure(fmt::format("{}: {}", path.string(), e.what()));
    }
    return out;
}

}  // namespace gridseries::parquet
