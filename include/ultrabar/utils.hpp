#ifndef ULTRABAR_UTILS_HPP
#define ULTRABAR_UTILS_HPP

#include <cstddef>
#include <cctype>
#include <string>

/**
 * @file utils.hpp
 * @brief Utilities for sequence handling.
 */

namespace ultrabar {

/**
 * Integer type for the sequence lengths.
 * This is used for barcodes, tags, templates and reads.
 */
typedef std::size_t SeqLength;

/**
 * Integer type to count reads.
 */
typedef unsigned long long Count;

/**
 * Complement a single base, preserving its case.
 * `N` is its own complement, and any other character is returned unchanged.
 *
 * @param b Base to complement.
 * @return The Watson-Crick complement of `b`.
 */
inline char complement_base(char b) {
    switch (b) {
        case 'A': return 'T';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'T': return 'A';
        case 'N': return 'N';
        case 'a': return 't';
        case 'c': return 'g';
        case 'g': return 'c';
        case 't': return 'a';
        case 'n': return 'n';
    }
    return b;
}

/**
 * @param start Pointer to the start of a FASTQ header line.
 * @param end Pointer to one-past-the-end of the header line.
 * @return Name of the read, i.e., the header up to the first whitespace without any leading `@`.
 */
inline std::string read_name_from_header(const char* start, const char* end) {
    if (start != end && *start == '@') {
        ++start;
    }
    auto stop = start;
    while (stop != end && !std::isspace(static_cast<unsigned char>(*stop))) {
        ++stop;
    }
    return std::string(start, stop);
}

/**
 * @cond
 */
inline std::string strip_mate_suffix(const std::string& name) {
    auto n = name.size();
    if (n >= 2 && name[n - 2] == '/' && (name[n - 1] == '1' || name[n - 1] == '2')) {
        return name.substr(0, n - 2);
    }
    return name;
}
/**
 * @endcond
 */

}

#endif
