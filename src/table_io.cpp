#include "competix/table_io.hpp"
#include "competix/errors.hpp"
#include "competix/log.hpp"

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace competix {

namespace {

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

[[noreturn]] void fail(const std::string& path, const std::string& what,
                       const arrow::Status& st) {
    throw ArtifactError(path + ": " + what + ": " + st.ToString());
}

std::shared_ptr<arrow::Table> read_csv(const std::string& path,
                                       std::shared_ptr<arrow::io::ReadableFile> infile,
                                       const std::vector<std::string>& text_columns) {
    auto read_opts = arrow::csv::ReadOptions::Defaults();
    auto parse_opts = arrow::csv::ParseOptions::Defaults();
    parse_opts.newlines_in_values = true;
    auto convert_opts = arrow::csv::ConvertOptions::Defaults();
    // Identifiers such as "3M" or "1-800" must not be inferred as numbers.
    for (const auto& name : text_columns) convert_opts.column_types[name] = arrow::utf8();

    auto reader_res = arrow::csv::TableReader::Make(
        arrow::io::default_io_context(), infile, read_opts, parse_opts, convert_opts);
    if (!reader_res.ok()) fail(path, "failed to create CSV reader", reader_res.status());
    auto reader = std::move(reader_res).ValueOrDie();

    auto table_res = reader->Read();
    if (!table_res.ok()) fail(path, "failed to read CSV", table_res.status());
    return std::move(table_res).ValueOrDie();
}

std::shared_ptr<arrow::Table> read_parquet(const std::string& path,
                                           std::shared_ptr<arrow::io::ReadableFile> infile) {
    auto reader_res = parquet::arrow::OpenFile(infile, arrow::default_memory_pool());
    if (!reader_res.ok()) fail(path, "failed to create Parquet reader", reader_res.status());
    std::unique_ptr<parquet::arrow::FileReader> pq_reader = std::move(reader_res).ValueOrDie();

    std::shared_ptr<arrow::Table> table;
    auto st = pq_reader->ReadTable(&table);
    if (!st.ok()) fail(path, "failed to read Parquet as Arrow table", st);
    return table;
}

std::string cell_string(const arrow::Array& arr, int64_t i, const std::string& path) {
    switch (arr.type_id()) {
    case arrow::Type::STRING:
        return std::string(static_cast<const arrow::StringArray&>(arr).GetView(i));
    case arrow::Type::LARGE_STRING:
        return std::string(static_cast<const arrow::LargeStringArray&>(arr).GetView(i));
    default: {
        auto scalar = arr.GetScalar(i);
        if (!scalar.ok()) fail(path, "failed to read cell", scalar.status());
        return (*scalar)->ToString();
    }
    }
}

// One delimiter-joined string per list cell; null lists and null items are skipped.
template <typename ListArrayT>
void append_joined(const ListArrayT& list, char delimiter, const std::string& path,
                   std::vector<std::string>& out) {
    using offset_type = typename ListArrayT::offset_type;
    const auto& values = *list.values();
    for (int64_t i = 0; i < list.length(); ++i) {
        std::string joined;
        if (!list.IsNull(i)) {
            for (offset_type j = list.value_offset(i); j < list.value_offset(i + 1); ++j) {
                if (values.IsNull(j)) continue;
                if (!joined.empty()) joined.push_back(delimiter);
                joined += cell_string(values, j, path);
            }
        }
        out.push_back(std::move(joined));
    }
}

// Values of one column as strings; list columns are joined with delimiter so
// tag parsing sees one representation.
std::vector<std::string> column_strings(const arrow::Table& table,
                                        const std::string& name,
                                        char delimiter,
                                        const std::string& path) {
    auto col = table.GetColumnByName(name);
    if (!col) throw ArtifactError(path + ": missing column '" + name + "'");

    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(table.num_rows()));
    for (const auto& chunk : col->chunks()) {
        if (chunk->type_id() == arrow::Type::LIST) {
            append_joined(static_cast<const arrow::ListArray&>(*chunk), delimiter, path, out);
            continue;
        }
        if (chunk->type_id() == arrow::Type::LARGE_LIST) {
            append_joined(static_cast<const arrow::LargeListArray&>(*chunk), delimiter, path, out);
            continue;
        }
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) {
                out.emplace_back();
            } else {
                out.push_back(cell_string(*chunk, i, path));
            }
        }
    }
    return out;
}

}  // namespace

std::shared_ptr<arrow::Table> read_table(const std::string& path,
                                         const std::vector<std::string>& text_columns) {
    auto infile_res = arrow::io::ReadableFile::Open(path);
    if (!infile_res.ok()) fail(path, "failed to open file", infile_res.status());
    auto infile = std::move(infile_res).ValueOrDie();

    if (has_suffix(path, ".csv")) return read_csv(path, infile, text_columns);
    if (has_suffix(path, ".parquet")) return read_parquet(path, infile);
    throw ArtifactError(path + ": unsupported input format (expected .csv or .parquet)");
}

std::vector<Company> companies_from_table(const arrow::Table& table, const InputSchema& schema,
                                          const std::string& source) {
    auto ids = column_strings(table, schema.id_column, schema.tag_delimiter, source);
    auto customers = column_strings(table, schema.customers_column, schema.tag_delimiter, source);
    auto products = column_strings(table, schema.product_column, schema.tag_delimiter, source);
    auto categories = column_strings(table, schema.categories_column, schema.tag_delimiter, source);

    std::vector<Company> companies(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        companies[i].id = std::move(ids[i]);
        companies[i].customers = std::move(customers[i]);
        companies[i].product = std::move(products[i]);
        companies[i].tags = parse_tags(categories[i], schema.tag_delimiter);
    }
    return companies;
}

std::vector<Company> read_companies(const std::string& path, const InputSchema& schema) {
    auto table = read_table(path, {schema.id_column, schema.customers_column,
                                   schema.product_column, schema.categories_column});
    auto companies = companies_from_table(*table, schema, path);
    CX_INFO("io", "read %zu companies from %s (%d columns)",
            companies.size(), fs::path(path).filename().c_str(), table->num_columns());
    return companies;
}

void write_parquet(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
    auto out_res = arrow::io::FileOutputStream::Open(path);
    if (!out_res.ok()) fail(path, "failed to open for writing", out_res.status());
    auto out = std::move(out_res).ValueOrDie();

    // Keep the Arrow schema so list widths and fixed-size lists read back unchanged.
    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    auto st = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), out,
                                         /*chunk_size=*/64 * 1024,
                                         parquet::default_writer_properties(), arrow_props);
    if (!st.ok()) fail(path, "failed to write Parquet", st);
    st = out->Close();
    if (!st.ok()) fail(path, "failed to close", st);
    CX_DEBUG("io", "wrote %lld rows to %s",
             static_cast<long long>(table->num_rows()), path.c_str());
}

}  // namespace competix
