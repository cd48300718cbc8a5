#ifndef ULTRABAR_FASTQ_READER_HPP
#define ULTRABAR_FASTQ_READER_HPP

#include <cctype>
#include <string>
#include <stdexcept>

#include "byteme/PerByte.hpp"

#include "utils.hpp"

/**
 * @file FastqReader.hpp
 *
 * @brief Defines the `FastqReader` class.
 */

namespace ultrabar {

/**
 * @brief Stream records from a FASTQ file.
 *
 * Each record consists of a name line starting with `@`, one or more sequence lines, a separator line starting with `+`, and the quality lines.
 * The name of each read is only considered up to the first whitespace, excluding the leading `@`;
 * the full header line is also available with its trailing whitespace removed.
 * Quality strings are checked for consistency with the sequence length but are otherwise ignored.
 * Both `\n` and `\r\n` line endings are accepted, and blank lines between records or at the end of the file are skipped.
 *
 * @tparam Pointer_ Pointer to a class that serves as a source of input bytes.
 * The pointed-to class should satisfy the `byteme::Reader` interface; it may also be a concrete `byteme::Reader` subclass to enable devirtualization.
 * Either a smart or raw pointer may be supplied depending on how the caller wants to manage the lifetime of the pointed-to object.
 */
template<typename Pointer_>
class FastqReader {
public:
    /**
     * @param p Pointer to a text stream.
     */
    FastqReader(Pointer_ p) : my_pb(std::move(p)) {
        my_has_more = my_pb.valid();
    }

    /**
     * Load the next record in the file.
     *
     * @return Whether a record was loaded.
     * If `true`, `get_name()` and `get_sequence()` may be used.
     * If `false`, the end of the file was reached.
     */
    bool operator()() {
        if (!my_has_more || !skip_blank_lines()) {
            return false;
        }

        auto record_start = my_line_count + 1;
        parse_name(record_start);
        parse_sequence();
        skip_line();
        parse_quality(record_start);

        ++my_record_count;
        return true;
    }

private:
    byteme::PerByteSerial<char, Pointer_> my_pb;
    std::string my_header, my_name, my_sequence;
    bool my_has_more;
    unsigned long long my_line_count = 0;
    Count my_record_count = 0;

    char next() {
        if (!my_pb.advance()) {
            throw std::runtime_error("premature end of the file at line " + std::to_string(my_line_count + 1));
        }
        return my_pb.get();
    }

    void skip_line() {
        while (next() != '\n') {}
        ++my_line_count;
    }

    bool skip_blank_lines() {
        while (true) {
            char c = my_pb.get();
            if (c != '\n' && c != '\r') {
                return true;
            }
            if (c == '\n') {
                ++my_line_count;
            }
            if (!my_pb.advance()) {
                my_has_more = false;
                return false;
            }
        }
    }

    void parse_name(unsigned long long record_start) {
        if (my_pb.get() != '@') {
            throw std::runtime_error("read name should start with '@' (line " + std::to_string(record_start) + ")");
        }

        my_header.clear();
        my_header.push_back('@');
        my_name.clear();

        char c = next();
        for (; !std::isspace(static_cast<unsigned char>(c)); c = next()) {
            my_name.push_back(c);
        }
        my_header += my_name;
        for (; c != '\n'; c = next()) {
            my_header.push_back(c);
        }
        ++my_line_count;

        while (std::isspace(static_cast<unsigned char>(my_header.back()))) {
            my_header.pop_back();
        }
    }

    // The sequence ends at the first line starting with '+', which is left as the current byte.
    void parse_sequence() {
        my_sequence.clear();
        char c = next();
        while (true) {
            if (c == '\n') {
                ++my_line_count;
                c = next();
                if (c == '+') {
                    return;
                }
            } else {
                if (c != '\r') {
                    my_sequence.push_back(c);
                }
                c = next();
            }
        }
    }

    // '@' is also a quality score, so the qualities only end at a newline once they are as long as the sequence.
    void parse_quality(unsigned long long record_start) {
        SeqLength needed = my_sequence.size(), observed = 0;
        my_has_more = false;

        while (my_pb.advance()) {
            char c = my_pb.get();
            if (c == '\r') {
                continue;
            }
            if (c != '\n') {
                ++observed;
                continue;
            }

            ++my_line_count;
            if (observed >= needed) {
                my_has_more = my_pb.advance();
                break;
            }
        }

        if (observed != needed) {
            throw std::runtime_error("non-equal lengths for quality and sequence strings for read '" + my_name + "' (line " + std::to_string(record_start) + ")");
        }
    }

public:
    /**
     * @return Sequence of the current read.
     * This should only be called if `operator()()` returned true.
     */
    const std::string& get_sequence() const {
        return my_sequence;
    }

    /**
     * @return Name of the current read.
     * This should only be called if `operator()()` returned true.
     */
    const std::string& get_name() const {
        return my_name;
    }

    /**
     * @return Header line of the current read, including the leading `@` but without trailing whitespace.
     * This should only be called if `operator()()` returned true.
     */
    const std::string& get_header() const {
        return my_header;
    }

    /**
     * @return Number of records loaded so far.
     */
    Count get_record_count() const {
        return my_record_count;
    }
};

}

#endif
