#ifndef ULTRABAR_PROCESS_DATA_HPP
#define ULTRABAR_PROCESS_DATA_HPP

#include <string>
#include <vector>
#include <stdexcept>

#include "FastqReader.hpp"
#include "utils.hpp"

/**
 * @file process_data.hpp
 *
 * @brief Process paired-end data.
 */

namespace ultrabar {

/**
 * @cond
 */
class ChunkOfReads {
public:
    void clear() {
        my_size = 0;
    }

    void add_read(const std::string& header, const std::string& sequence) {
        if (my_size == my_headers.size()) {
            my_headers.emplace_back();
            my_sequences.emplace_back();
        }
        my_headers[my_size] = header;
        my_sequences[my_size] = sequence;
        ++my_size;
    }

    size_t size() const {
        return my_size;
    }

    std::pair<const char*, const char*> get_header(size_t i) const {
        return bounds(my_headers[i]);
    }

    std::pair<const char*, const char*> get_sequence(size_t i) const {
        return bounds(my_sequences[i]);
    }

private:
    // Strings are retained across chunks to recycle their allocations.
    std::vector<std::string> my_headers, my_sequences;
    size_t my_size = 0;

    static std::pair<const char*, const char*> bounds(const std::string& s) {
        return std::make_pair(s.c_str(), s.c_str() + s.size());
    }
};
/**
 * @endcond
 */

/**
 * @brief Options for `process_paired_end_data()`.
 */
struct ProcessPairedEndDataOptions {
    /**
     * Number of read pairs in each block.
     */
    int block_size = 100000;

    /**
     * Whether to check that the mates in each pair have the same name.
     * Names are only compared up to the first whitespace, and a trailing `/1` or `/2` is ignored.
     */
    bool check_names = true;
};

/**
 * Run a handler for each read pair in paired-end data, by calling `handler.process()` on each pair.
 * The two files are advanced in lock-step, one record from each file per pair.
 * It is expected that the results are stored in `handler` for retrieval by the caller.
 *
 * @tparam Pointer_ Pointer to a class that serves as a source of input bytes.
 * The pointed-to class should satisfy the `byteme::Reader` interface; it may also be a concrete `byteme::Reader` subclass to enable devirtualization. 
 * Either a smart or raw pointer may be supplied depending on how the caller wants to manage the lifetime of the pointed-to object. 
 * @tparam Handler_ A class that implements a handler for paired-end data.
 *
 * @param input1 Pointer to a `byteme::Reader` object containing data from the first FASTQ file in the pair.
 * @param input2 Pointer to a `byteme::Reader` object containing data from the second FASTQ file in the pair.
 * @param handler Instance of the `Handler_` class. 
 * @param options Further options.
 *
 * An error is thrown if one file runs out of records before the other,
 * or if `ProcessPairedEndDataOptions::check_names = true` and the names of the mates differ.
 *
 * @section paired-handler-req Handler requirements
 * The `Handler_` class is expected to implement the following methods:
 * - `initialize()`: this should be a `const` method that returns a state object (denoted here as having type `State`, though the exact name may vary).
 *   The state object collects the results for one block of read pairs.
 * - `process(State& state, const std::pair<const char*, const char*>& name1, const std::pair<const char*, const char*>& seq1, const std::pair<const char*, const char*>& name2, const std::pair<const char*, const char*>& seq2)`: 
 *   this should be a `const` method that processes the paired reads in `seq1` and `seq2`, and stores its results in `state`.
 *   `name1` and `name2` will contain pointers to the start and one-past-the-end of the full header lines of the reads, see `FastqReader::get_header()`.
 *   `seq1` and `seq2` will contain pointers to the start and one-past-the-end of the read sequences.
 * - `reduce(State& state)`: this should merge the results from the `state` object into the `Handler_` instance.
 *   Blocks are reduced in the order in which they occur in the input files.
 */
template<class Pointer_, class Handler_>
void process_paired_end_data(Pointer_ input1, Pointer_ input2, Handler_& handler, const ProcessPairedEndDataOptions& options) {
    if (options.block_size <= 0) {
        throw std::runtime_error("block size should be positive");
    }

    FastqReader<Pointer_> fastq1(std::move(input1));
    FastqReader<Pointer_> fastq2(std::move(input2));
    const Handler_& conhandler = handler; 
    ChunkOfReads reads1, reads2;

    bool finished = false;
    while (!finished) {
        reads1.clear();
        reads2.clear();

        for (int b = 0; b < options.block_size; ++b) {
            bool okay1 = fastq1();
            bool okay2 = fastq2();

            if (okay1 != okay2) {
                auto shorter = (okay1 ? "second" : "first");
                throw std::runtime_error(
                    "different number of reads in paired FASTQ files (" + std::string(shorter) + 
                    " file ended after " + std::to_string(okay1 ? fastq2.get_record_count() : fastq1.get_record_count()) + " reads)"
                );
            }
            if (!okay1) {
                finished = true;
                break;
            }

            const auto& name1 = fastq1.get_name();
            const auto& name2 = fastq2.get_name();
            if (options.check_names && name1 != name2 && strip_mate_suffix(name1) != strip_mate_suffix(name2)) {
                throw std::runtime_error(
                    "mismatched read names '" + name1 + "' and '" + name2 + 
                    "' in paired FASTQ files (read " + std::to_string(fastq1.get_record_count()) + ")"
                );
            }

            reads1.add_read(fastq1.get_header(), fastq1.get_sequence());
            reads2.add_read(fastq2.get_header(), fastq2.get_sequence());
        }

        auto nreads = reads1.size();
        if (nreads == 0) {
            continue;
        }

        auto state = conhandler.initialize();
        for (size_t r = 0; r < nreads; ++r) {
            conhandler.process(state, reads1.get_header(r), reads1.get_sequence(r), reads2.get_header(r), reads2.get_sequence(r));
        }
        handler.reduce(state);
    }
}

/**
 * Overload of `process_paired_end_data()` with default options.
 *
 * @tparam Pointer_ Pointer to a `byteme::Reader`, see the other overload.
 * @tparam Handler_ A class that implements a handler for paired-end data.
 *
 * @param input1 Pointer to a `byteme::Reader` object containing data from the first FASTQ file in the pair.
 * @param input2 Pointer to a `byteme::Reader` object containing data from the second FASTQ file in the pair.
 * @param handler Instance of the `Handler_` class. 
 */
template<class Pointer_, class Handler_>
void process_paired_end_data(Pointer_ input1, Pointer_ input2, Handler_& handler) {
    process_paired_end_data(std::move(input1), std::move(input2), handler, ProcessPairedEndDataOptions());
}

}

#endif
