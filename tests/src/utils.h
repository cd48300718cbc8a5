#ifndef UTILS_H
#define UTILS_H

#include <vector>
#include <string>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>

inline std::string convert_to_fastq(const std::vector<std::string>& reads, std::string prefix = "READ") {
    std::string output;

    for (size_t i = 0; i < reads.size(); ++i) {
        output += "@" + prefix + std::to_string(i+1) + "\n";
        output += reads[i] + "\n";
        output += "+\n" + std::string(reads[i].size(), '!') + "\n";
    }

    return output;
}

inline std::pair<const char*, const char*> bounds(const std::string& s) {
    return std::make_pair(s.c_str(), s.c_str() + s.size());
}

// Fresh directory under the system temporary directory.
inline std::filesystem::path fresh_directory(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("ultrabar_test_" + name);
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
    return path;
}

inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << contents;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Builds a first read matching the default template.
inline std::string make_read1(const std::string& barcode, const std::string& tag1, const std::string& prefix = "", const std::string& suffix = "") {
    return prefix + "TAGTT" + barcode + "TATGG" + tag1 + "GTTTA" + suffix;
}

// Builds the reverse complement of a second read matching the default template.
inline std::string make_read2_rc(const std::string& tag2, const std::string& prefix = "", const std::string& suffix = "") {
    return prefix + "TGTTG" + tag2 + "GTTTG" + suffix;
}

#endif
