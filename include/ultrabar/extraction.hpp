#ifndef ULTRABAR_EXTRACTION_HPP
#define ULTRABAR_EXTRACTION_HPP

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "byteme/SomeFileReader.hpp"

#include "AnchorTemplate.hpp"
#include "ExtractedRecord.hpp"
#include "PairedReadExtractor.hpp"
#include "TagReference.hpp"
#include "csv_io.hpp"
#include "process_data.hpp"
#include "utils.hpp"

/**
 * @file extraction.hpp
 *
 * @brief Run the extraction step for one sample and write its outputs.
 */

namespace ultrabar {

/**
 * @brief Read counts from the extraction of one sample.
 */
struct ExtractionSummary {
    std::string sample_id;

    /**
     * Number of read pairs in the input files.
     */
    Count total = 0;

    /**
     * Number of read pairs in which both templates matched.
     */
    Count extracted = 0;

    /**
     * Number of extracted read pairs with expected guides.
     */
    Count expected = 0;

    /**
     * @return Proportion of read pairs that were extracted, or zero if there are no reads.
     */
    double extraction_rate() const {
        return total ? static_cast<double>(extracted) / static_cast<double>(total) : 0.0;
    }

    /**
     * @return Proportion of read pairs with expected guides, or zero if there are no reads.
     */
    double expected_rate() const {
        return total ? static_cast<double>(expected) / static_cast<double>(total) : 0.0;
    }
};

/**
 * @param summary Read counts for a sample.
 * @return One-line report of the counts and rates.
 */
inline std::string format_summary(const ExtractionSummary& summary) {
    return fmt::format(
        "Sample {} has a total of {} reads. {} reads ({:.3f}) have barcode and sgRNA. {} reads ({:.3f}) have expected sgRNA.",
        summary.sample_id,
        summary.total,
        summary.extracted,
        summary.extraction_rate(),
        summary.expected,
        summary.expected_rate()
    );
}

/**
 * @param output_dir Path to an output directory.
 * @return Name of the last component of `output_dir`, ignoring any trailing separators.
 */
inline std::string sample_id_from_directory(const std::string& output_dir) {
    std::filesystem::path path(output_dir);
    auto name = path.filename();
    if (name.empty()) {
        name = path.parent_path().filename();
    }
    return name.string();
}

/**
 * @brief Options for `write_extraction()`.
 */
struct WriteExtractionOptions {
    /**
     * Whether to only keep expected records in the intermediate table and the partitioned barcode files.
     * If `false`, all extracted records are kept, regardless of their classification.
     */
    bool expected_only = false;
};

/**
 * @brief Barcode files written for each combination of guides.
 */
struct PartitionManifest {
    /**
     * Combination key and path to the barcode file for each combination, in order of increasing key.
     */
    std::vector<std::pair<std::string, std::string> > files;
};

/**
 * Write the per-read outputs of the extraction step for one sample:
 *
 * - `Unexpected_reads.csv`, containing all unexpected records.
 * - `Intermediate_df.csv`, containing all records that are passed to clustering.
 * - `Clonal_barcode/<combination>.bartender`, one headerless file of barcode and read name per combination.
 * - `Bartender_input_address`, listing the path to each barcode file on a separate line.
 *
 * Records are written in the order of `records`.
 * Existing files are overwritten.
 *
 * @param records Extracted records for a sample.
 * @param output_dir Path to the output directory.
 * This is created if it does not already exist.
 * @param options Further options.
 *
 * @return Manifest of the barcode files.
 */
inline PartitionManifest write_extraction(const std::vector<ExtractedRecord>& records, const std::string& output_dir, const WriteExtractionOptions& options) {
    std::filesystem::path root(output_dir);
    std::filesystem::path barcode_dir = root / "Clonal_barcode";
    std::filesystem::create_directories(barcode_dir);

    std::vector<std::vector<std::string> > unexpected_rows, intermediate_rows;
    std::map<std::string, std::vector<const ExtractedRecord*> > by_combination;

    for (const auto& r : records) {
        bool is_unexpected = (r.label == ReadClass::UNEXPECTED);
        if (is_unexpected) {
            unexpected_rows.push_back(to_row(r));
            if (options.expected_only) {
                continue;
            }
        }
        intermediate_rows.push_back(to_row(r));
        by_combination[r.combination].push_back(&r);
    }

    write_csv_file((root / "Unexpected_reads.csv").string(), extracted_record_header(), unexpected_rows);
    write_csv_file((root / "Intermediate_df.csv").string(), extracted_record_header(), intermediate_rows);

    PartitionManifest manifest;
    std::vector<std::vector<std::string> > pairs;
    for (const auto& combo : by_combination) {
        auto path = (barcode_dir / (combo.first + ".bartender")).string();

        pairs.clear();
        pairs.reserve(combo.second.size());
        for (auto rptr : combo.second) {
            pairs.push_back(std::vector<std::string>{ rptr->barcode, rptr->read_id });
        }
        write_csv_file(path, {}, pairs);

        spdlog::debug("Wrote {} reads for combination {} to '{}'", pairs.size(), combo.first, path);
        manifest.files.emplace_back(combo.first, std::move(path));
    }

    auto manifest_path = (root / "Bartender_input_address").string();
    std::ofstream manifest_out(manifest_path, std::ios::binary | std::ios::trunc);
    if (!manifest_out) {
        throw std::runtime_error("failed to open '" + manifest_path + "' for writing");
    }
    for (const auto& f : manifest.files) {
        manifest_out << f.second << '\n';
    }
    manifest_out.close();
    if (!manifest_out) {
        throw std::runtime_error("failed to write '" + manifest_path + "'");
    }

    return manifest;
}

/**
 * @brief Options for `run_extraction()`.
 */
struct RunExtractionOptions {
    /**
     * Identifier for the sample.
     * If empty, this is set to the name of the output directory.
     */
    std::string sample_id;

    /**
     * Template for the first read, see `PairedReadExtractor`.
     */
    std::string mate1_template = default_mate1_template();

    /**
     * Template for the reverse complement of the second read, see `PairedReadExtractor`.
     */
    std::string mate2_template = default_mate2_template();

    /**
     * Whether to use the read name as the read identifier, see `PairedReadExtractor::Options::short_read_id`.
     */
    bool short_read_id = false;

    /**
     * Options for reading the paired FASTQ files.
     */
    ProcessPairedEndDataOptions process;

    /**
     * Options for writing the outputs.
     */
    WriteExtractionOptions write;
};

/**
 * Extract barcodes and guides from a pair of FASTQ files, write the outputs with `write_extraction()`, and log a summary.
 *
 * @param fastq1 Path to the FASTQ file for the first reads, possibly Gzip-compressed.
 * @param fastq2 Path to the FASTQ file for the second reads, possibly Gzip-compressed.
 * @param reference Known guides for each position.
 * @param output_dir Path to the output directory.
 * @param options Further options.
 *
 * @return Read counts for the sample.
 */
inline ExtractionSummary run_extraction(
    const std::string& fastq1, 
    const std::string& fastq2, 
    const TagReference& reference, 
    const std::string& output_dir, 
    const RunExtractionOptions& options)
{
    ExtractionSummary summary;
    summary.sample_id = options.sample_id.empty() ? sample_id_from_directory(output_dir) : options.sample_id;

    PairedReadExtractor::Options eopt;
    eopt.sample_id = summary.sample_id;
    eopt.short_read_id = options.short_read_id;
    PairedReadExtractor extractor(AnchorTemplate(options.mate1_template), AnchorTemplate(options.mate2_template), reference, std::move(eopt));

    {
        byteme::SomeFileReader reader1(fastq1.c_str(), byteme::SomeFileReaderOptions());
        byteme::SomeFileReader reader2(fastq2.c_str(), byteme::SomeFileReaderOptions());
        try {
            process_paired_end_data(&reader1, &reader2, extractor, options.process);
        } catch (std::exception& e) {
            throw std::runtime_error("failed to process '" + fastq1 + "' and '" + fastq2 + "'; " + std::string(e.what()));
        }
    }

    summary.total = extractor.get_total();
    summary.extracted = extractor.get_extracted();
    summary.expected = extractor.get_expected();

    write_extraction(extractor.get_records(), output_dir, options.write);
    spdlog::info("{}", format_summary(summary));
    return summary;
}

}

#endif
