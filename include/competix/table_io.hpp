#ifndef COMPETIX_TABLE_IO_HPP
#define COMPETIX_TABLE_IO_HPP

#include "company.hpp"

#include <memory>
#include <string>
#include <vector>

namespace arrow { class Table; }

namespace competix {

// Column names of the input table; defaults match the company dataset export.
struct InputSchema {
    std::string id_column         = "company_name";
    std::string customers_column  = "main_customers";
    std::string product_column    = "main_product";
    std::string categories_column = "category_list";
    char        tag_delimiter     = ',';
};

// Reads companies from a .csv or .parquet file, one record per row, in file
// order. Null cells read as empty strings. A list<string> or large_list<string>
// category column is accepted as-is. Throws ArtifactError when the file cannot be read or a
// required column is missing.
std::vector<Company> read_companies(const std::string& path,
                                    const InputSchema& schema = {});

// Same as read_companies over a table already in memory; source names the
// table in error messages.
std::vector<Company> companies_from_table(const arrow::Table& table,
                                          const InputSchema& schema = {},
                                          const std::string& source = "table");

// Arrow table from a .csv or .parquet file. CSV columns named in
// text_columns are read as utf8 instead of being type-inferred.
std::shared_ptr<arrow::Table> read_table(const std::string& path,
                                         const std::vector<std::string>& text_columns = {});

// Writes table as Parquet to path. Throws ArtifactError on failure.
void write_parquet(const std::shared_ptr<arrow::Table>& table,
                   const std::string& path);

}  // namespace competix

#endif  // COMPETIX_TABLE_IO_HPP
