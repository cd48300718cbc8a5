#ifndef ULTRABAR_ANCHOR_TEMPLATE_HPP
#define ULTRABAR_ANCHOR_TEMPLATE_HPP

#include <algorithm>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

#include "utils.hpp"

/**
 * @file AnchorTemplate.hpp
 *
 * @brief Defines the `AnchorTemplate` class.
 */

namespace ultrabar {

/**
 * @brief Search a read sequence for a template of constant anchors and bounded variable regions.
 *
 * The template sequence contains constant regions interspersed with one or more variable regions.
 * Each variable region is marked by a run of `-`, one per mandatory base, optionally followed by a run of `+`, one per optional base.
 * For example, `TAGTT----TATGG--++GTTTA` contains a variable region of exactly 4 bases and another variable region of 2 to 4 bases.
 *
 * The search reports the same match as a leftmost, greedy regular expression search,
 * i.e., the earliest start position on the read that admits a match is chosen, 
 * and at that position each variable region takes the longest length that allows the remainder of the template to match.
 * Constant regions are compared exactly, without any allowance for mismatches or case differences.
 * Variable regions accept any character.
 */
class AnchorTemplate {
public:
    /**
     * Default constructor.
     * This is only provided to enable composition, the resulting object should not be used until it is copy-assigned to a properly constructed instance.
     */
    AnchorTemplate() = default;

    /**
     * @param[in] template_seq Pointer to a character array containing the template.
     * @param template_length Length of the array pointed to by `template_seq`.
     */
    AnchorTemplate(const char* template_seq, SeqLength template_length) {
        SeqLength i = 0;
        while (i < template_length) {
            char b = template_seq[i];

            if (b == '+') {
                throw std::runtime_error("optional positions should follow mandatory positions in a variable region (template position " + std::to_string(i + 1) + ")");

            } else if (b == '-') {
                if (!my_segments.empty() && my_segments.back().variable) {
                    throw std::runtime_error("variable regions should be separated by a constant region (template position " + std::to_string(i + 1) + ")");
                }

                Segment current;
                current.variable = true;
                current.region = my_regions.size();
                while (i < template_length && template_seq[i] == '-') {
                    ++current.min_length;
                    ++i;
                }
                current.max_length = current.min_length;
                while (i < template_length && template_seq[i] == '+') {
                    ++current.max_length;
                    ++i;
                }

                my_regions.emplace_back(current.min_length, current.max_length);
                my_segments.push_back(std::move(current));

            } else {
                if (my_segments.empty() || my_segments.back().variable) {
                    my_segments.emplace_back();
                }
                auto& current = my_segments.back();
                current.constant.push_back(b);
                ++current.min_length;
                ++current.max_length;
                ++i;
            }
        }

        if (my_regions.empty()) {
            throw std::runtime_error("expected at least one variable region in the template");
        }

        // Minimum number of bases required to match everything after each segment.
        my_min_remaining.resize(my_segments.size() + 1);
        for (SeqLength s = my_segments.size(); s > 0; --s) {
            my_min_remaining[s - 1] = my_min_remaining[s] + my_segments[s - 1].min_length;
        }
    }

    /**
     * @param template_seq The template, see the other constructor.
     */
    AnchorTemplate(const std::string& template_seq) : AnchorTemplate(template_seq.c_str(), template_seq.size()) {}

public:
    /**
     * @brief Details on a match of the template to a read sequence.
     */
    struct Match {
        /**
         * Whether a match was found.
         * If `false`, the other members should be ignored.
         */
        bool found = false;

        /**
         * Position on the read of the start of the match.
         */
        SeqLength position = 0;

        /**
         * Position on the read that is one past the end of the match.
         */
        SeqLength end = 0;

        /**
         * Start and one-past-the-end positions on the read for each variable region, in the order in which they occur in the template.
         */
        std::vector<std::pair<SeqLength, SeqLength> > variable_regions;
    };

    /**
     * Search a read sequence for the first match to the template.
     *
     * @param[in] seq Pointer to an array containing the read sequence.
     * @param len Length of the read sequence.
     * @param[out] match Details of the match.
     * This may be re-used across calls to avoid reallocations.
     *
     * @return Whether a match was found, equal to `match.found`.
     */
    bool search(const char* seq, SeqLength len, Match& match) const {
        match.found = false;
        match.variable_regions.resize(my_regions.size());

        auto required = my_min_remaining.front();
        if (len < required) {
            return false;
        }

        SeqLength last_start = len - required;
        for (SeqLength start = 0; start <= last_start; ++start) {
            if (match_segment(seq, len, 0, start, match)) {
                match.found = true;
                match.position = start;
                return true;
            }
        }

        return false;
    }

    /**
     * @param[in] seq Pointer to an array containing the read sequence.
     * @param len Length of the read sequence.
     * @return Details of the first match to the template.
     */
    Match search(const char* seq, SeqLength len) const {
        Match output;
        search(seq, len, output);
        return output;
    }

    /**
     * @return Minimum and maximum length of each variable region, in the order in which they occur in the template.
     */
    const std::vector<std::pair<SeqLength, SeqLength> >& variable_region_lengths() const {
        return my_regions;
    }

    /**
     * @return Minimum length of a read sequence that can match the template.
     */
    SeqLength min_length() const {
        return my_min_remaining.empty() ? 0 : my_min_remaining.front();
    }

private:
    struct Segment {
        bool variable = false;
        std::string constant;
        SeqLength region = 0;
        SeqLength min_length = 0;
        SeqLength max_length = 0;
    };

    std::vector<Segment> my_segments;
    std::vector<std::pair<SeqLength, SeqLength> > my_regions;
    std::vector<SeqLength> my_min_remaining;

    bool match_segment(const char* seq, SeqLength len, SeqLength s, SeqLength pos, Match& match) const {
        if (s == my_segments.size()) {
            match.end = pos;
            return true;
        }

        const auto& seg = my_segments[s];
        auto leftover = len - pos;
        if (leftover < my_min_remaining[s]) {
            return false;
        }

        if (!seg.variable) {
            if (!std::equal(seg.constant.begin(), seg.constant.end(), seq + pos)) {
                return false;
            }
            return match_segment(seq, len, s + 1, pos + seg.constant.size(), match);
        }

        // Longest candidate first, to mimic a greedy quantifier.
        SeqLength upper = std::min(seg.max_length, leftover - my_min_remaining[s + 1]);
        for (SeqLength l = upper + 1; l > seg.min_length; ) {
            --l;
            match.variable_regions[seg.region] = std::make_pair(pos, pos + l);
            if (match_segment(seq, len, s + 1, pos + l, match)) {
                return true;
            }
        }

        return false;
    }
};

}

#endif
