#ifndef ULTRABAR_TAG_REFERENCE_HPP
#define ULTRABAR_TAG_REFERENCE_HPP

#include <string>
#include <vector>
#include <unordered_set>
#include <stdexcept>

#include "csv_io.hpp"

/**
 * @file TagReference.hpp
 *
 * @brief Defines the `TagReference` class.
 */

namespace ultrabar {

/**
 * @brief Known guide sequences for the two positions of a dual-guide construct.
 *
 * A read is considered to be expected if its first tag is a known sequence for the first position and its second tag is a known sequence for the second position.
 * The sets are fixed at construction and cannot be modified afterwards.
 */
class TagReference {
public:
    /**
     * Default constructor, giving empty sets for both positions.
     */
    TagReference() = default;

    /**
     * @param first Known sequences for the first position.
     * @param second Known sequences for the second position.
     * Duplicates are silently ignored.
     */
    TagReference(const std::vector<std::string>& first, const std::vector<std::string>& second) : 
        my_first(first.begin(), first.end()),
        my_second(second.begin(), second.end())
    {}

public:
    /**
     * @param tag A tag sequence.
     * @return Whether `tag` is known for the first position.
     */
    bool has_first(const std::string& tag) const {
        return my_first.find(tag) != my_first.end();
    }

    /**
     * @param tag A tag sequence.
     * @return Whether `tag` is known for the second position.
     */
    bool has_second(const std::string& tag) const {
        return my_second.find(tag) != my_second.end();
    }

    /**
     * @param tag1 Tag sequence at the first position.
     * @param tag2 Tag sequence at the second position.
     * @return Whether the combination is expected.
     */
    bool is_expected(const std::string& tag1, const std::string& tag2) const {
        return has_first(tag1) && has_second(tag2);
    }

    /**
     * @return Number of known sequences for the first position.
     */
    size_t size_first() const {
        return my_first.size();
    }

    /**
     * @return Number of known sequences for the second position.
     */
    size_t size_second() const {
        return my_second.size();
    }

private:
    std::unordered_set<std::string> my_first, my_second;
};

/**
 * @brief Options for `load_tag_reference()`.
 */
struct LoadTagReferenceOptions {
    /**
     * Name of the column containing the position of each tag.
     */
    std::string position_column = "Position";

    /**
     * Name of the column containing the tag sequences.
     */
    std::string sequence_column = "gRNA_complete";

    /**
     * Value of the position column for tags at the first position.
     */
    std::string first_label = "G1";

    /**
     * Value of the position column for tags at the second position.
     */
    std::string second_label = "G2";
};

/**
 * Load reference tags from a CSV file with a header.
 * Rows with other values in the position column are ignored.
 *
 * @param path Path to a CSV file of reference tags.
 * @param options Further options.
 * @return The reference tags.
 */
inline TagReference load_tag_reference(const std::string& path, const LoadTagReferenceOptions& options) {
    std::vector<std::string> first, second;
    read_csv_file(path, { options.position_column, options.sequence_column }, [&](csv::CSVRow& row) -> void {
        auto pos = row[options.position_column].get<std::string>();
        if (pos == options.first_label) {
            first.push_back(row[options.sequence_column].get<std::string>());
        } else if (pos == options.second_label) {
            second.push_back(row[options.sequence_column].get<std::string>());
        }
    });
    return TagReference(first, second);
}

}

#endif
