#include <gtest/gtest.h>
#include "ultrabar/FastqReader.hpp"
#include "byteme/RawBufferReader.hpp"
#include "byteme/RawFileReader.hpp"
#include "utils.h"
#include <fstream>

static byteme::RawBufferReader make_reader(const std::string& buffer) {
    return byteme::RawBufferReader(reinterpret_cast<const unsigned char*>(buffer.c_str()), buffer.size());
}

TEST(FastqReader, Single) {
    std::string buffer = "@FOO\nACGT\n+\n!!!!"; // no terminating newline.
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "FOO");
    EXPECT_EQ(fq.get_sequence(), "ACGT");
    EXPECT_EQ(fq.get_record_count(), 1);

    EXPECT_FALSE(fq());
    EXPECT_EQ(fq.get_record_count(), 1);
}

TEST(FastqReader, EmptyFile) {
    std::string buffer;
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);
    EXPECT_FALSE(fq());
    EXPECT_EQ(fq.get_record_count(), 0);
}

TEST(FastqReader, EmptySequence) {
    std::string buffer = "@FOO\n\n+\n";
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "FOO");
    EXPECT_EQ(fq.get_sequence(), "");
    EXPECT_FALSE(fq());
}

TEST(FastqReader, MultipleEntries) {
    std::string buffer = "@FOO 1:N:0:ATCACG\nACGT\n+\n!!!!\n@WHEE\nTGCA\n+WHEE\n@@@@\n";
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "FOO");
    EXPECT_EQ(fq.get_header(), "@FOO 1:N:0:ATCACG");
    EXPECT_EQ(fq.get_sequence(), "ACGT");

    // '@' in the quality string is not mistaken for a new record.
    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "WHEE");
    EXPECT_EQ(fq.get_header(), "@WHEE");
    EXPECT_EQ(fq.get_sequence(), "TGCA");
    EXPECT_EQ(fq.get_record_count(), 2);

    EXPECT_FALSE(fq());
}

TEST(FastqReader, MultiLineEntries) {
    std::string buffer = "@FOO\nA\nCG\nTGCA\n+\n!!\n!!\n!!!\n@ARG\nACACGGT\nC\n+\n@@@\n@\n@@@@";
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "FOO");
    EXPECT_EQ(fq.get_sequence(), "ACGTGCA");

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "ARG");
    EXPECT_EQ(fq.get_sequence(), "ACACGGTC");

    EXPECT_FALSE(fq());
}

TEST(FastqReader, WindowsLineEndings) {
    std::string buffer = "@FOO\r\nACGT\r\n+\r\n!!!!\r\n@BAR\r\nTT\r\n+\r\n!!\r\n";
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "FOO");
    EXPECT_EQ(fq.get_sequence(), "ACGT");

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "BAR");
    EXPECT_EQ(fq.get_sequence(), "TT");

    EXPECT_FALSE(fq());
}

TEST(FastqReader, HeaderWhitespace) {
    std::string buffer = "@FOO\tlane 1 \t\r\nACGT\n+\n!!!!\n@BAR \nTT\n+\n!!\n";
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "FOO");
    EXPECT_EQ(fq.get_header(), "@FOO\tlane 1");

    EXPECT_TRUE(fq());
    EXPECT_EQ(fq.get_name(), "BAR");
    EXPECT_EQ(fq.get_header(), "@BAR");

    EXPECT_FALSE(fq());
}

TEST(FastqReader, BlankLines) {
    {
        std::string buffer = "@FOO\nACGT\n+\n!!!!\n\n\n";
        auto reader = make_reader(buffer);
        ultrabar::FastqReader fq(&reader);
        EXPECT_TRUE(fq());
        EXPECT_EQ(fq.get_sequence(), "ACGT");
        EXPECT_FALSE(fq());
        EXPECT_EQ(fq.get_record_count(), 1);
    }

    {
        std::string buffer = "@FOO\r\nACGT\r\n+\r\n!!!!\r\n\r\n\r\n";
        auto reader = make_reader(buffer);
        ultrabar::FastqReader fq(&reader);
        EXPECT_TRUE(fq());
        EXPECT_FALSE(fq());
        EXPECT_EQ(fq.get_record_count(), 1);
    }

    // Also between records, and in a file with nothing else.
    {
        std::string buffer = "\n@FOO\nACGT\n+\n!!!!\n\n@BAR\nTT\n+\n!!\n\n";
        auto reader = make_reader(buffer);
        ultrabar::FastqReader fq(&reader);
        EXPECT_TRUE(fq());
        EXPECT_EQ(fq.get_name(), "FOO");
        EXPECT_TRUE(fq());
        EXPECT_EQ(fq.get_name(), "BAR");
        EXPECT_FALSE(fq());
    }

    {
        std::string buffer = "\n\n";
        auto reader = make_reader(buffer);
        ultrabar::FastqReader fq(&reader);
        EXPECT_FALSE(fq());
        EXPECT_EQ(fq.get_record_count(), 0);
    }
}

static void expect_error(const std::string& buffer, size_t skip, const std::vector<std::string>& fragments) {
    auto reader = make_reader(buffer);
    ultrabar::FastqReader fq(&reader);
    for (size_t s = 0; s < skip; ++s) {
        fq();
    }

    EXPECT_ANY_THROW({
        try {
            fq();
        } catch (std::exception& e) {
            std::string msg(e.what());
            for (const auto& f : fragments) {
                EXPECT_TRUE(msg.find(f) != std::string::npos) << msg;
            }
            throw;
        }
    });
}

TEST(FastqReader, Errors) {
    expect_error("FOO", 0, { "read name should start" });
    expect_error("@FOO\nAC\n+", 0, { "premature end" });
    expect_error("@FOO\nAC\n+\n!!\n@WHEE\nACGT\n+\n!!", 1, { "non-equal lengths", "WHEE", "line 5" });
    expect_error("@FOO\nAC\n+\n!!\n@WHEE\nACGT\n+\n!!!@@!!@\n", 1, { "non-equal lengths", "line 5" });
    expect_error("@FOO\nAC\n+\n!!\nWHEE", 1, { "should start", "line 5" });
}

class FastqReaderFileTest : public testing::TestWithParam<int> {};

TEST_P(FastqReaderFileTest, StressTest) {
    auto dir = fresh_directory("fastq_reader");
    auto path = (dir / "reads.fastq").string();
    {
        std::ofstream out(path);
        for (size_t i = 0; i < 1000; ++i) {
            out << "@" << "READ_" << i << " extra comments\n";
            out << "AAAAAAAAAAAAAAAaaaaaaaaaaaaaa\n";
            out << "CCCCCCCCCCCCCCCcccccccccccccc\n";
            out << "+" << "\n";
            for (int j = 0; j < 2; ++j) {
                out << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n";
            }
        }
    }

    byteme::RawFileReader reader(path.c_str(), [&]{
        byteme::RawFileReaderOptions ropt;
        ropt.buffer_size = GetParam();
        return ropt;
    }());
    ultrabar::FastqReader fq(&reader);

    std::string ref = "AAAAAAAAAAAAAAAaaaaaaaaaaaaaa";
    ref += "CCCCCCCCCCCCCCCcccccccccccccc";

    for (size_t i = 0; i < 1000; ++i) {
        EXPECT_TRUE(fq());
        EXPECT_EQ(fq.get_name(), "READ_" + std::to_string(i));
        EXPECT_EQ(fq.get_sequence(), ref);
    }

    EXPECT_FALSE(fq());
    EXPECT_EQ(fq.get_record_count(), 1000);
}

INSTANTIATE_TEST_SUITE_P(
    FastqReader,
    FastqReaderFileTest, 
    ::testing::Values(5, 10, 50, 1000)
);
