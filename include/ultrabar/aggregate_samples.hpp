#ifndef ULTRABAR_AGGREGATE_SAMPLES_HPP
#define ULTRABAR_AGGREGATE_SAMPLES_HPP

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "aggregate.hpp"
#include "merge.hpp"

/**
 * @file aggregate_samples.hpp
 *
 * @brief Aggregate and combine read counts across samples.
 */

namespace ultrabar {

/**
 * @brief Aggregated read counts for one sample.
 */
struct SampleAggregate {
    /**
     * Read counts for each raw barcode.
     */
    std::vector<RawFrequencyRow> raw;

    /**
     * Read counts for each cluster center.
     */
    std::vector<FrequencyRow> complete;

    JoinReport joins;
    AggregationCounts counts;
};

/**
 * Annotate the reads in a sample with `merge_sample()` and count them with `aggregate_raw()` and `aggregate_complete()`.
 * A summary of the row counts is logged, along with warnings for any rows lost in the joins.
 *
 * @param sample_dir Path to the directory for a sample.
 * @return Read counts for the sample.
 */
inline SampleAggregate aggregate_sample(const std::string& sample_dir) {
    SampleAggregate output;
    auto rows = merge_sample(sample_dir, output.joins);
    output.raw = aggregate_raw(rows);
    output.complete = aggregate_complete(rows, &(output.counts));

    const auto& joins = output.joins;
    if (joins.barcodes_without_cluster) {
        spdlog::warn("{} barcode entries in '{}' have no matching cluster", joins.barcodes_without_cluster, sample_dir);
    }
    if (joins.pairs_without_record) {
        spdlog::warn("{} reads in '{}' have no matching extracted record", joins.pairs_without_record, sample_dir);
    }
    if (output.counts.missing_center) {
        spdlog::warn("{} reads in '{}' have no cluster center and were not counted", output.counts.missing_center, sample_dir);
    }

    spdlog::info(
        "Sample directory '{}': {} reads in, {} annotated, {} raw barcodes, {} clonal barcodes",
        sample_dir,
        joins.pairs_in,
        joins.rows_out,
        output.raw.size(),
        output.complete.size()
    );

    return output;
}

/**
 * @param tables Read counts for each sample.
 * @return Concatenation of all tables, in the order of `tables`.
 */
inline std::vector<FrequencyRow> combine_samples(const std::vector<std::vector<FrequencyRow> >& tables) {
    std::vector<FrequencyRow> output;
    size_t total = 0;
    for (const auto& t : tables) {
        total += t.size();
    }
    output.reserve(total);
    for (const auto& t : tables) {
        output.insert(output.end(), t.begin(), t.end());
    }
    return output;
}

/**
 * @param rows Read counts for multiple samples.
 * @param sample_id Identifier for the sample of interest.
 * @return Read counts for `sample_id`, in the order of `rows`.
 */
inline std::vector<FrequencyRow> filter_sample(const std::vector<FrequencyRow>& rows, const std::string& sample_id) {
    std::vector<FrequencyRow> output;
    for (const auto& r : rows) {
        if (r.sample_id == sample_id) {
            output.push_back(r);
        }
    }
    return output;
}

/**
 * @brief Options for `aggregate_samples()`.
 */
struct AggregateSamplesOptions {
    /**
     * Whether to stop at the first failed sample.
     * If `false`, failures are recorded and the remaining samples are still processed.
     */
    bool stop_on_error = false;
};

/**
 * @brief Outcome of `aggregate_samples()`.
 */
struct AggregateSamplesReport {
    /**
     * Names of the successfully processed samples.
     */
    std::vector<std::string> samples;

    /**
     * Name and error message for each failed sample.
     */
    std::vector<std::pair<std::string, std::string> > failures;

    /**
     * Path to the combined table.
     */
    std::string combined_file;

    /**
     * Number of rows in the combined table.
     */
    Count combined_rows = 0;
};

/**
 * @cond
 */
inline std::vector<std::filesystem::path> list_sample_directories(const std::string& input_root) {
    std::vector<std::filesystem::path> output;
    for (const auto& entry : std::filesystem::directory_iterator(input_root)) {
        if (entry.is_directory()) {
            output.push_back(entry.path());
        }
    }
    std::sort(output.begin(), output.end());
    return output;
}
/**
 * @endcond
 */

/**
 * Aggregate read counts for each sample, i.e., each subdirectory of `input_root`, in order of their names.
 * For each sample, the raw and complete tables from `aggregate_sample()` are written to `<output_prefix><sample>/Combined_ND_df.csv` and `<output_prefix><sample>/Combined_deduplexed_df.csv`, respectively.
 * The complete tables of all successful samples are then concatenated with `combine_samples()` and written to `<output_prefix>gRNA_clonalbarcode_combined.csv`.
 *
 * @param input_root Path to the directory containing one subdirectory per sample.
 * @param output_prefix Prefix of the output paths.
 * This is used as-is, so it should end with a path separator if it refers to a directory.
 * @param options Further options.
 *
 * @return Report on the processed and failed samples.
 */
inline AggregateSamplesReport aggregate_samples(const std::string& input_root, const std::string& output_prefix, const AggregateSamplesOptions& options) {
    AggregateSamplesReport report;
    std::vector<std::vector<FrequencyRow> > completed;

    for (const auto& sample_dir : list_sample_directories(input_root)) {
        auto sample_id = sample_dir.filename().string();

        try {
            auto result = aggregate_sample(sample_dir.string());

            std::filesystem::path outdir(output_prefix + sample_id);
            std::filesystem::create_directories(outdir);
            write_raw_frequencies((outdir / "Combined_ND_df.csv").string(), result.raw);
            write_frequencies((outdir / "Combined_deduplexed_df.csv").string(), result.complete);

            completed.push_back(std::move(result.complete));
            report.samples.push_back(sample_id);

        } catch (std::exception& e) {
            if (options.stop_on_error) {
                throw;
            }
            spdlog::error("Failed to aggregate sample {}: {}", sample_id, e.what());
            report.failures.emplace_back(sample_id, e.what());
        }
    }

    auto combined = combine_samples(completed);
    report.combined_file = output_prefix + "gRNA_clonalbarcode_combined.csv";
    auto parent = std::filesystem::path(report.combined_file).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    write_frequencies(report.combined_file, combined);
    report.combined_rows = combined.size();

    spdlog::info("Combined {} rows from {} samples into '{}'", report.combined_rows, report.samples.size(), report.combined_file);
    return report;
}

}

#endif
