#ifndef ULTRABAR_PAIRED_READ_EXTRACTOR_HPP
#define ULTRABAR_PAIRED_READ_EXTRACTOR_HPP

#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

#include "AnchorTemplate.hpp"
#include "ExtractedRecord.hpp"
#include "TagReference.hpp"
#include "reverse_complement.hpp"
#include "utils.hpp"

/**
 * @file PairedReadExtractor.hpp
 *
 * @brief Extract clonal barcodes and guide pairs from paired-end reads.
 */

namespace ultrabar {

/**
 * @return Template for the first read, with a 16-bp clonal barcode and a 16-21 bp guide between fixed anchors.
 * This corresponds to the pattern `TAGTT(.{16})TATGG(.{16,21})GTTTA`.
 */
inline std::string default_mate1_template() {
    return "TAGTT" + std::string(16, '-') + "TATGG" + std::string(16, '-') + std::string(5, '+') + "GTTTA";
}

/**
 * @return Template for the reverse complement of the second read, with a 16-21 bp guide between fixed anchors.
 * This corresponds to the pattern `TGTTG(.{16,21})GTTTG`.
 */
inline std::string default_mate2_template() {
    return "TGTTG" + std::string(16, '-') + std::string(5, '+') + "GTTTG";
}

/**
 * @brief Handler for paired reads containing a clonal barcode and two guides.
 *
 * In this design, the first read contains a clonal barcode followed by the first guide, each flanked by constant anchors.
 * The reverse complement of the second read contains the second guide between its own anchors.
 * A read pair is extracted if both templates match; otherwise it only contributes to the total number of reads.
 * Extracted reads are classified as expected if both guides are present in the reference tags for their positions.
 *
 * Records are stored in the order of the read pairs in the input files.
 * This class is intended to be used with `process_paired_end_data()`.
 */
class PairedReadExtractor {
public:
    /**
     * @brief Optional parameters for `PairedReadExtractor`.
     */
    struct Options {
        /**
         * Identifier for the sample, stored in each record.
         */
        std::string sample_id;

        /**
         * Whether to use the read name as the read identifier, see `read_name_from_header()`.
         * If `false`, the full header line of the first read is used, including the leading `@` and any description.
         */
        bool short_read_id = false;
    };

public:
    /**
     * @param template1 Template for the first read.
     * This should contain two variable regions, the first for the clonal barcode and the second for the first guide.
     * @param template2 Template for the reverse complement of the second read.
     * This should contain one variable region for the second guide.
     * @param reference Known guides for each position.
     * @param options Optional parameters.
     */
    PairedReadExtractor(AnchorTemplate template1, AnchorTemplate template2, TagReference reference, Options options) :
        my_template1(std::move(template1)),
        my_template2(std::move(template2)),
        my_reference(std::move(reference)),
        my_options(std::move(options))
    {
        if (my_template1.variable_region_lengths().size() != 2) {
            throw std::runtime_error("expected two variable regions in the template for the first read");
        }
        if (my_template2.variable_region_lengths().size() != 1) {
            throw std::runtime_error("expected one variable region in the template for the second read");
        }
    }

    /**
     * @param reference Known guides for each position.
     * @param options Optional parameters.
     *
     * The default templates from `default_mate1_template()` and `default_mate2_template()` are used.
     */
    PairedReadExtractor(TagReference reference, Options options) :
        PairedReadExtractor(AnchorTemplate(default_mate1_template()), AnchorTemplate(default_mate2_template()), std::move(reference), std::move(options)) {}

private:
    AnchorTemplate my_template1, my_template2;
    TagReference my_reference;
    Options my_options;

    std::vector<ExtractedRecord> my_records;
    Count my_total = 0;
    Count my_extracted = 0;
    Count my_expected = 0;

public:
    /**
     *@cond
     */
    struct State {
        std::vector<ExtractedRecord> records;
        Count total = 0;
        Count extracted = 0;
        Count expected = 0;

        // Workspaces, re-used across reads in the same block.
        std::string buffer2;
        AnchorTemplate::Match match1, match2;
    };

    State initialize() const {
        return State();
    }

    void reduce(State& s) {
        my_total += s.total;
        my_extracted += s.extracted;
        my_expected += s.expected;
        my_records.reserve(my_records.size() + s.records.size());
        for (auto& r : s.records) {
            my_records.push_back(std::move(r));
        }
        s.records.clear();
    }

    void process(
        State& state, 
        const std::pair<const char*, const char*>& name1,
        const std::pair<const char*, const char*>& read1,
        const std::pair<const char*, const char*>&,
        const std::pair<const char*, const char*>& read2
    ) const {
        ++state.total;

        if (!my_template1.search(read1.first, read1.second - read1.first, state.match1)) {
            return;
        }

        reverse_complement(read2.first, read2.second - read2.first, state.buffer2);
        if (!my_template2.search(state.buffer2.c_str(), state.buffer2.size(), state.match2)) {
            return;
        }

        ++state.extracted;
        ExtractedRecord current;
        if (my_options.short_read_id) {
            current.read_id = read_name_from_header(name1.first, name1.second);
        } else {
            current.read_id.assign(name1.first, name1.second);
        }

        const auto& barcode_region = state.match1.variable_regions[0];
        current.barcode.assign(read1.first + barcode_region.first, read1.first + barcode_region.second);
        const auto& tag1_region = state.match1.variable_regions[1];
        current.tag1.assign(read1.first + tag1_region.first, read1.first + tag1_region.second);
        const auto& tag2_region = state.match2.variable_regions[0];
        current.tag2 = state.buffer2.substr(tag2_region.first, tag2_region.second - tag2_region.first);

        current.combination = combination_key(current.tag1, current.tag2);
        current.sample_id = my_options.sample_id;

        if (my_reference.is_expected(current.tag1, current.tag2)) {
            current.label = ReadClass::EXPECTED;
            ++state.expected;
        } else {
            current.label = ReadClass::UNEXPECTED;
        }

        state.records.push_back(std::move(current));
    }
    /**
     *@endcond
     */

public:
    /**
     * @return Records for all extracted read pairs.
     */
    const std::vector<ExtractedRecord>& get_records() const {
        return my_records;
    }

    /**
     * @return Records for all extracted read pairs, moved out of the handler.
     */
    std::vector<ExtractedRecord> release_records() {
        return std::move(my_records);
    }

    /**
     * @return Total number of read pairs processed by the handler.
     */
    Count get_total() const {
        return my_total;
    }

    /**
     * @return Number of read pairs in which both templates matched.
     */
    Count get_extracted() const {
        return my_extracted;
    }

    /**
     * @return Number of extracted read pairs in which both guides are in the reference.
     */
    Count get_expected() const {
        return my_expected;
    }
};

}

#endif
