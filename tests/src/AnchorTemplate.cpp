#include <gtest/gtest.h>
#include "ultrabar/AnchorTemplate.hpp"
#include "ultrabar/PairedReadExtractor.hpp"
#include <string>

static std::string region(const std::string& seq, const ultrabar::AnchorTemplate::Match& match, size_t r) {
    const auto& reg = match.variable_regions[r];
    return seq.substr(reg.first, reg.second - reg.first);
}

TEST(AnchorTemplate, Parsing) {
    ultrabar::AnchorTemplate tmp("AAAA----CGGC--+++TT");
    const auto& regions = tmp.variable_region_lengths();
    ASSERT_EQ(regions.size(), 2);
    EXPECT_EQ(regions[0].first, 4);
    EXPECT_EQ(regions[0].second, 4);
    EXPECT_EQ(regions[1].first, 2);
    EXPECT_EQ(regions[1].second, 5);
    EXPECT_EQ(tmp.min_length(), 16);

    // Variable regions at the edges are fine.
    ultrabar::AnchorTemplate edge("--AC-+");
    EXPECT_EQ(edge.variable_region_lengths().size(), 2);
    EXPECT_EQ(edge.min_length(), 5);
}

TEST(AnchorTemplate, ParsingErrors) {
    EXPECT_ANY_THROW({
        try {
            ultrabar::AnchorTemplate tmp("ACGT");
        } catch (std::exception& e) {
            EXPECT_TRUE(std::string(e.what()).find("at least one variable region") != std::string::npos);
            throw;
        }
    });

    EXPECT_ANY_THROW({
        try {
            ultrabar::AnchorTemplate tmp("AC+GT");
        } catch (std::exception& e) {
            EXPECT_TRUE(std::string(e.what()).find("optional positions") != std::string::npos);
            throw;
        }
    });

    EXPECT_ANY_THROW({
        try {
            ultrabar::AnchorTemplate tmp("AC--++--GT");
        } catch (std::exception& e) {
            EXPECT_TRUE(std::string(e.what()).find("separated by a constant region") != std::string::npos);
            throw;
        }
    });
}

TEST(AnchorTemplate, FixedLength) {
    ultrabar::AnchorTemplate tmp("AAAA----CGGC");

    std::string seq = "AAAATTTTCGGC";
    auto match = tmp.search(seq.c_str(), seq.size());
    ASSERT_TRUE(match.found);
    EXPECT_EQ(match.position, 0);
    EXPECT_EQ(match.end, 12);
    EXPECT_EQ(region(seq, match, 0), "TTTT");

    // Searching rather than matching from the start.
    seq = "cacacacAAAAAAAACGGCggg";
    match = tmp.search(seq.c_str(), seq.size());
    ASSERT_TRUE(match.found);
    EXPECT_EQ(match.position, 7);
    EXPECT_EQ(region(seq, match, 0), "AAAA");

    // No match.
    seq = "AAAATTTTCGGA";
    EXPECT_FALSE(tmp.search(seq.c_str(), seq.size()).found);
    seq = "AAAATTTCGGC";
    EXPECT_FALSE(tmp.search(seq.c_str(), seq.size()).found);
    seq = "";
    EXPECT_FALSE(tmp.search(seq.c_str(), seq.size()).found);
}

TEST(AnchorTemplate, CaseSensitive) {
    ultrabar::AnchorTemplate tmp("AAAA----CGGC");
    std::string seq = "aaaaTTTTcggc";
    EXPECT_FALSE(tmp.search(seq.c_str(), seq.size()).found);

    // Variable positions accept anything, though.
    seq = "AAAAnN.xCGGC";
    auto match = tmp.search(seq.c_str(), seq.size());
    ASSERT_TRUE(match.found);
    EXPECT_EQ(region(seq, match, 0), "nN.x");
}

TEST(AnchorTemplate, BoundedLength) {
    ultrabar::AnchorTemplate tmp("AC--++GT");

    for (size_t len = 1; len <= 6; ++len) {
        std::string var(len, 'T');
        std::string seq = "AC" + var + "GT";
        auto match = tmp.search(seq.c_str(), seq.size());
        if (len >= 2 && len <= 4) {
            ASSERT_TRUE(match.found);
            EXPECT_EQ(region(seq, match, 0), var);
        } else {
            EXPECT_FALSE(match.found);
        }
    }
}

TEST(AnchorTemplate, Greedy) {
    // Like a greedy regex: 'AC(.{2,4})GT' on 'ACGTGTGT' captures 'GTGT'.
    ultrabar::AnchorTemplate tmp("AC--++GT");
    std::string seq = "ACGTGTGT";
    auto match = tmp.search(seq.c_str(), seq.size());
    ASSERT_TRUE(match.found);
    EXPECT_EQ(match.position, 0);
    EXPECT_EQ(region(seq, match, 0), "GTGT");
    EXPECT_EQ(match.end, 8);

    // Backtracking when the longest option doesn't work.
    seq = "ACGTGTGA";
    match = tmp.search(seq.c_str(), seq.size());
    ASSERT_TRUE(match.found);
    EXPECT_EQ(region(seq, match, 0), "GT");
    EXPECT_EQ(match.end, 6);
}

TEST(AnchorTemplate, Leftmost) {
    // The earliest start wins, even if a later start would give a longer capture.
    ultrabar::AnchorTemplate tmp("AC-+GT");
    std::string seq = "ACAGTACAAGT";
    auto match = tmp.search(seq.c_str(), seq.size());
    ASSERT_TRUE(match.found);
    EXPECT_EQ(match.position, 0);
    EXPECT_EQ(region(seq, match, 0), "A");

    // Failing the first occurrence of the anchor moves onto the next one.
    seq = "ACAAAGTACTTGT";
    match = tmp.search(seq.c_str(), seq.size());
    ASSERT_TRUE(match.found);
    EXPECT_EQ(match.position, 7);
    EXPECT_EQ(region(seq, match, 0), "TT");
}

TEST(AnchorTemplate, MultipleRegions) {
    ultrabar::AnchorTemplate tmp(ultrabar::default_mate1_template());
    std::string barcode = "ACGTACGTACGTACGT";
    std::string tag = "CCCCCGGGGGAAAAATT"; // 17 bp.
    std::string seq = "NNNTAGTT" + barcode + "TATGG" + tag + "GTTTAcccc";

    ultrabar::AnchorTemplate::Match match;
    ASSERT_TRUE(tmp.search(seq.c_str(), seq.size(), match));
    EXPECT_EQ(match.position, 3);
    EXPECT_EQ(region(seq, match, 0), barcode);
    EXPECT_EQ(region(seq, match, 1), tag);

    // Re-using the match object.
    std::string other = "TAGTT" + barcode + "TATGG" + tag + "GTTTT";
    EXPECT_FALSE(tmp.search(other.c_str(), other.size(), match));
    EXPECT_FALSE(match.found);

    // Barcode is fixed length.
    std::string shorter = "TAGTT" + barcode.substr(1) + "TATGG" + tag + "GTTTA";
    EXPECT_FALSE(tmp.search(shorter.c_str(), shorter.size()).found);

    // Guide must be 16-21 bp.
    std::string longer = "TAGTT" + barcode + "TATGG" + tag + "AAAAA" + "GTTTA";
    EXPECT_FALSE(tmp.search(longer.c_str(), longer.size()).found);
}
