#ifndef ULTRABAR_REVERSE_COMPLEMENT_HPP
#define ULTRABAR_REVERSE_COMPLEMENT_HPP

#include <string>
#include "utils.hpp"

/**
 * @file reverse_complement.hpp
 * @brief Reverse-complement a read sequence.
 */

namespace ultrabar {

/**
 * @param[in] seq Pointer to a character array containing a nucleotide sequence.
 * @param len Length of the array pointed to by `seq`.
 * @param[out] output String to store the reverse complement.
 * This is cleared before any bases are added.
 *
 * Case is preserved for each base, see `complement_base()` for the handling of unknown characters.
 */
inline void reverse_complement(const char* seq, SeqLength len, std::string& output) {
    output.clear();
    output.reserve(len);
    for (SeqLength i = 0; i < len; ++i) {
        output.push_back(complement_base(seq[len - i - 1]));
    }
}

/**
 * @param seq A nucleotide sequence.
 * @return The reverse complement of `seq`.
 */
inline std::string reverse_complement(const std::string& seq) {
    std::string output;
    reverse_complement(seq.c_str(), seq.size(), output);
    return output;
}

}

#endif
