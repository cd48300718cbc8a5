#ifndef ULTRABAR_CSV_IO_HPP
#define ULTRABAR_CSV_IO_HPP

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <stdexcept>

#include <csv.hpp>

/**
 * @file csv_io.hpp
 *
 * @brief Read and write the comma-separated tables of the pipeline.
 */

namespace ultrabar {

/**
 * @cond
 */
inline void check_csv_columns(const std::vector<std::string>& available, const std::vector<std::string>& required) {
    for (const auto& r : required) {
        if (std::find(available.begin(), available.end(), r) == available.end()) {
            throw std::runtime_error("missing '" + r + "' column in the CSV header");
        }
    }
}
/**
 * @endcond
 */

/**
 * Stream the rows of a CSV file whose first row is the header.
 * Fields are separated by commas and may be double-quoted, and rows may end with `\n` or `\r\n`.
 * Rows with a different number of fields from the header cause an error.
 *
 * @tparam Function_ Function that accepts a `csv::CSVRow&`.
 *
 * @param path Path to the CSV file.
 * @param required Names of the columns that must be present in the header.
 * @param fun Function to be called on each row, in order of appearance.
 * Fields should be accessed by column name, e.g., `row["Center"].get<std::string>()`.
 *
 * Errors are rethrown with `path` in the message.
 */
template<class Function_>
void read_csv_file(const std::string& path, const std::vector<std::string>& required, Function_ fun) {
    try {
        if (std::filesystem::file_size(path) == 0) {
            throw std::runtime_error("expected a header in the CSV file");
        }

        csv::CSVFormat format;
        format.delimiter(',').quote('"').header_row(0).variable_columns(csv::VariableColumnPolicy::THROW);
        csv::CSVReader reader(path, format);
        check_csv_columns(reader.get_col_names(), required);

        for (auto& row : reader) {
            fun(row);
        }

    } catch (std::exception& e) {
        throw std::runtime_error("failed to read '" + path + "'; " + std::string(e.what()));
    }
}

/**
 * Stream the rows of a CSV file without a header.
 * An empty file contains no rows.
 *
 * @tparam Function_ Function that accepts a `csv::CSVRow&`.
 *
 * @param path Path to the CSV file.
 * @param columns Names to assign to the columns.
 * Every row should have exactly this number of fields.
 * @param fun Function to be called on each row, in order of appearance.
 *
 * Errors are rethrown with `path` in the message.
 */
template<class Function_>
void read_headerless_csv_file(const std::string& path, const std::vector<std::string>& columns, Function_ fun) {
    try {
        if (std::filesystem::file_size(path) == 0) {
            return;
        }

        csv::CSVFormat format;
        format.delimiter(',').quote('"').header_row(-1).column_names(columns).variable_columns(csv::VariableColumnPolicy::KEEP);
        csv::CSVReader reader(path, format);

        size_t counter = 0;
        for (auto& row : reader) {
            ++counter;
            if (row.size() != columns.size()) {
                throw std::runtime_error(
                    "expected " + std::to_string(columns.size()) + " fields but found " + std::to_string(row.size()) + 
                    " (row " + std::to_string(counter) + ")"
                );
            }
            fun(row);
        }

    } catch (std::exception& e) {
        throw std::runtime_error("failed to read '" + path + "'; " + std::string(e.what()));
    }
}

/**
 * Write a CSV file, quoting fields that contain commas, quotes or newlines.
 * Any existing file is overwritten.
 *
 * @param path Path to the output file.
 * @param header Column names, or empty for a headerless file.
 * @param rows Contents of each row.
 */
inline void write_csv_file(const std::string& path, const std::vector<std::string>& header, const std::vector<std::vector<std::string> >& rows) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("failed to open '" + path + "' for writing");
    }

    {
        auto writer = csv::make_csv_writer(out);
        if (!header.empty()) {
            writer << header;
        }
        for (const auto& r : rows) {
            writer << r;
        }
    }

    out.close();
    if (!out) {
        throw std::runtime_error("failed to write '" + path + "'");
    }
}

}

#endif
