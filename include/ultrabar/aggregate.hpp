#ifndef ULTRABAR_AGGREGATE_HPP
#define ULTRABAR_AGGREGATE_HPP

#include <map>
#include <string>
#include <tuple>
#include <vector>
#include <stdexcept>

#include "csv_io.hpp"
#include "merge.hpp"
#include "utils.hpp"

/**
 * @file aggregate.hpp
 *
 * @brief Count reads per clonal barcode and guide combination.
 */

namespace ultrabar {

/**
 * @brief Read count for a clonal barcode in a sample, collapsed across all raw barcodes in the same cluster.
 */
struct FrequencyRow {
    std::string combination;

    /**
     * Cluster center.
     */
    std::string barcode;

    std::string tag1;
    std::string tag2;
    std::string sample_id;
    Count frequency = 0;
};

/**
 * @brief Read count for a raw barcode in a sample.
 */
struct RawFrequencyRow {
    std::string combination;
    std::string center;
    std::string tag1;
    std::string tag2;

    /**
     * Raw barcode sequence.
     */
    std::string barcode;

    std::string sample_id;
    Count frequency = 0;
};

/**
 * @brief Row counts for the aggregation.
 */
struct AggregationCounts {
    /**
     * Number of annotated reads that were counted.
     */
    Count rows_in = 0;

    /**
     * Number of annotated reads that were skipped as their barcode has no cluster center.
     */
    Count missing_center = 0;

    /**
     * Number of output groups.
     */
    Count groups = 0;
};

/**
 * Count reads for each combination of guide pair, cluster center, guides, raw barcode and sample.
 * Reads without a cluster center are not assigned to any group.
 *
 * @param rows Annotated reads.
 * @param[out] counts Row counts for the aggregation, may be `nullptr`.
 *
 * @return Read counts, sorted by the grouping fields in the above order.
 */
inline std::vector<RawFrequencyRow> aggregate_raw(const std::vector<UnifiedRow>& rows, AggregationCounts* counts = nullptr) {
    typedef std::tuple<std::string, std::string, std::string, std::string, std::string, std::string> Key;
    std::map<Key, Count> groups;
    Count missing = 0;

    for (const auto& r : rows) {
        if (!r.center) {
            ++missing;
            continue;
        }
        ++(groups[Key(r.combination, *(r.center), r.tag1, r.tag2, r.barcode, r.sample_id)]);
    }

    std::vector<RawFrequencyRow> output;
    output.reserve(groups.size());
    for (const auto& g : groups) {
        RawFrequencyRow current;
        std::tie(current.combination, current.center, current.tag1, current.tag2, current.barcode, current.sample_id) = g.first;
        current.frequency = g.second;
        output.push_back(std::move(current));
    }

    if (counts) {
        counts->rows_in = rows.size() - missing;
        counts->missing_center = missing;
        counts->groups = output.size();
    }
    return output;
}

/**
 * Count reads for each combination of guide pair, cluster center, guides and sample.
 * All raw barcodes in the same cluster are collapsed into a single count.
 * Reads without a cluster center are not assigned to any group.
 *
 * @param rows Annotated reads.
 * @param[out] counts Row counts for the aggregation, may be `nullptr`.
 *
 * @return Read counts, sorted by the grouping fields in the above order.
 */
inline std::vector<FrequencyRow> aggregate_complete(const std::vector<UnifiedRow>& rows, AggregationCounts* counts = nullptr) {
    typedef std::tuple<std::string, std::string, std::string, std::string, std::string> Key;
    std::map<Key, Count> groups;
    Count missing = 0;

    for (const auto& r : rows) {
        if (!r.center) {
            ++missing;
            continue;
        }
        ++(groups[Key(r.combination, *(r.center), r.tag1, r.tag2, r.sample_id)]);
    }

    std::vector<FrequencyRow> output;
    output.reserve(groups.size());
    for (const auto& g : groups) {
        FrequencyRow current;
        std::tie(current.combination, current.barcode, current.tag1, current.tag2, current.sample_id) = g.first;
        current.frequency = g.second;
        output.push_back(std::move(current));
    }

    if (counts) {
        counts->rows_in = rows.size() - missing;
        counts->missing_center = missing;
        counts->groups = output.size();
    }
    return output;
}

/**
 * @param path Path to the output file.
 * @param rows Read counts for raw barcodes.
 */
inline void write_raw_frequencies(const std::string& path, const std::vector<RawFrequencyRow>& rows) {
    std::vector<std::vector<std::string> > contents;
    contents.reserve(rows.size());
    for (const auto& r : rows) {
        contents.push_back(std::vector<std::string>{ r.combination, r.center, r.tag1, r.tag2, r.barcode, r.sample_id, std::to_string(r.frequency) });
    }
    write_csv_file(path, { "gRNA_combination", "Clonal_barcode_center", "gRNA1", "gRNA2", "Clonal_barcode", "Sample_ID", "Frequency" }, contents);
}

/**
 * @param path Path to the output file.
 * @param rows Read counts for clonal barcodes.
 */
inline void write_frequencies(const std::string& path, const std::vector<FrequencyRow>& rows) {
    std::vector<std::vector<std::string> > contents;
    contents.reserve(rows.size());
    for (const auto& r : rows) {
        contents.push_back(std::vector<std::string>{ r.combination, r.barcode, r.tag1, r.tag2, r.sample_id, std::to_string(r.frequency) });
    }
    write_csv_file(path, { "gRNA_combination", "Clonal_barcode", "gRNA1", "gRNA2", "Sample_ID", "Frequency" }, contents);
}

/**
 * @param path Path to a file written by `write_frequencies()`.
 * @return Read counts for clonal barcodes.
 */
inline std::vector<FrequencyRow> load_frequencies(const std::string& path) {
    std::vector<FrequencyRow> output;
    read_csv_file(path, { "gRNA_combination", "Clonal_barcode", "gRNA1", "gRNA2", "Sample_ID", "Frequency" }, [&](csv::CSVRow& row) -> void {
        FrequencyRow current;
        current.combination = row["gRNA_combination"].get<std::string>();
        current.barcode = row["Clonal_barcode"].get<std::string>();
        current.tag1 = row["gRNA1"].get<std::string>();
        current.tag2 = row["gRNA2"].get<std::string>();
        current.sample_id = row["Sample_ID"].get<std::string>();
        current.frequency = std::stoull(row["Frequency"].get<std::string>());
        output.push_back(std::move(current));
    });
    return output;
}

}

#endif
