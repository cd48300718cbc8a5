#ifndef ULTRABAR_EXTRACTED_RECORD_HPP
#define ULTRABAR_EXTRACTED_RECORD_HPP

#include <string>
#include <vector>
#include <stdexcept>

#include "csv_io.hpp"

/**
 * @file ExtractedRecord.hpp
 *
 * @brief Per-read records produced by the extraction step.
 */

namespace ultrabar {

/**
 * Classification of an extracted read against the reference tags.
 */
enum class ReadClass : char { EXPECTED, UNEXPECTED };

/**
 * @param label A read classification.
 * @return Its name in the output tables.
 */
inline const char* to_string(ReadClass label) {
    return label == ReadClass::EXPECTED ? "Expected" : "Unexpected";
}

/**
 * @param label Name of a read classification.
 * @return The classification.
 */
inline ReadClass parse_read_class(const std::string& label) {
    if (label == "Expected") {
        return ReadClass::EXPECTED;
    } else if (label == "Unexpected") {
        return ReadClass::UNEXPECTED;
    }
    throw std::runtime_error("unknown read class '" + label + "'");
}

/**
 * @param tag1 Tag sequence at the first position.
 * @param tag2 Tag sequence at the second position.
 * @return Key for the combination of tags.
 */
inline std::string combination_key(const std::string& tag1, const std::string& tag2) {
    std::string output;
    output.reserve(tag1.size() + tag2.size() + 1);
    output += tag1;
    output += '_';
    output += tag2;
    return output;
}

/**
 * @brief Barcode and tags extracted from a single read pair.
 */
struct ExtractedRecord {
    std::string read_id;
    std::string barcode;
    std::string tag1;
    std::string tag2;

    /**
     * Combination key, see `combination_key()`.
     */
    std::string combination;

    std::string sample_id;
    ReadClass label = ReadClass::UNEXPECTED;
};

/**
 * @cond
 */
inline const std::vector<std::string>& extracted_record_header() {
    static const std::vector<std::string> header{ "gRNA1", "gRNA2", "Clonal_barcode", "Read_ID", "Sample_ID", "Class", "gRNA_combination" };
    return header;
}

inline std::vector<std::string> to_row(const ExtractedRecord& record) {
    return std::vector<std::string>{ 
        record.tag1, 
        record.tag2, 
        record.barcode,
        record.read_id,
        record.sample_id,
        to_string(record.label),
        record.combination
    };
}
/**
 * @endcond
 */

/**
 * @param path Path to an intermediate or unexpected-read table, as written by `write_extraction()`.
 * @return Records in the table, in the order of appearance.
 */
inline std::vector<ExtractedRecord> load_extracted_records(const std::string& path) {
    std::vector<ExtractedRecord> output;
    read_csv_file(path, extracted_record_header(), [&](csv::CSVRow& row) -> void {
        ExtractedRecord current;
        current.tag1 = row["gRNA1"].get<std::string>();
        current.tag2 = row["gRNA2"].get<std::string>();
        current.barcode = row["Clonal_barcode"].get<std::string>();
        current.read_id = row["Read_ID"].get<std::string>();
        current.sample_id = row["Sample_ID"].get<std::string>();
        current.label = parse_read_class(row["Class"].get<std::string>());
        current.combination = row["gRNA_combination"].get<std::string>();
        output.push_back(std::move(current));
    });
    return output;
}

}

#endif
