#ifndef ULTRABAR_MERGE_HPP
#define ULTRABAR_MERGE_HPP

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "ExtractedRecord.hpp"
#include "csv_io.hpp"
#include "utils.hpp"

/**
 * @file merge.hpp
 *
 * @brief Join clustering output with the extracted records of a sample.
 */

namespace ultrabar {

/**
 * @brief Cluster reported by the barcode clustering tool.
 */
struct ClusterEntry {
    std::string cluster_id;

    /**
     * Consensus sequence of the cluster.
     */
    std::string center;
};

/**
 * @brief Unique barcode reported by the barcode clustering tool.
 */
struct BarcodeEntry {
    std::string barcode;
    std::string cluster_id;
};

/**
 * @brief Barcode and read name, as passed to the barcode clustering tool.
 */
struct BartenderPair {
    std::string barcode;
    std::string read_id;
};

/**
 * @brief Cluster center assigned to a raw barcode.
 */
struct CenterAssignment {
    std::string barcode;
    std::string center;
};

/**
 * @brief Read with its raw barcode and, if available, the center of the barcode's cluster.
 */
struct AssignedPair {
    std::string barcode;
    std::string read_id;
    std::optional<std::string> center;
};

/**
 * @brief Fully annotated read.
 */
struct UnifiedRow {
    std::string read_id;

    /**
     * Raw barcode sequence.
     */
    std::string barcode;

    /**
     * Center of the barcode's cluster, if the barcode was assigned to a cluster.
     */
    std::optional<std::string> center;

    std::string tag1;
    std::string tag2;
    std::string combination;
    std::string sample_id;
};

/**
 * @brief Row counts for the joins, to track the rows lost in inner joins.
 *
 * Reports for different partitions of the same sample can be added together.
 */
struct JoinReport {
    /**
     * Number of barcode entries whose cluster was not present in the cluster table.
     */
    Count barcodes_without_cluster = 0;

    /**
     * Number of barcode/read pairs with no cluster center for their barcode.
     * These are still retained by the join.
     */
    Count pairs_without_center = 0;

    /**
     * Number of barcode/read pairs with no extracted record for their read and barcode.
     */
    Count pairs_without_record = 0;

    /**
     * Number of barcode/read pairs that went into the reference join.
     */
    Count pairs_in = 0;

    /**
     * Number of annotated reads produced by the reference join.
     */
    Count rows_out = 0;

    JoinReport& operator+=(const JoinReport& other) {
        barcodes_without_cluster += other.barcodes_without_cluster;
        pairs_without_center += other.pairs_without_center;
        pairs_without_record += other.pairs_without_record;
        pairs_in += other.pairs_in;
        rows_out += other.rows_out;
        return *this;
    }
};

/**
 * Inner join of the barcode entries to the clusters on the cluster identifier.
 * Each barcode entry yields one assignment per cluster entry with the same identifier, in the order of `barcodes`.
 * Barcode entries with no matching cluster are dropped and counted in `JoinReport::barcodes_without_cluster`.
 *
 * @param barcodes Unique barcodes from the clustering tool.
 * @param clusters Clusters from the clustering tool.
 * @param[out] report Report to be updated with the number of dropped entries.
 *
 * @return Cluster centers for each barcode.
 */
inline std::vector<CenterAssignment> inner_join_clusters(const std::vector<BarcodeEntry>& barcodes, const std::vector<ClusterEntry>& clusters, JoinReport& report) {
    std::unordered_map<std::string, std::vector<const ClusterEntry*> > by_id;
    for (const auto& c : clusters) {
        by_id[c.cluster_id].push_back(&c);
    }

    std::vector<CenterAssignment> output;
    output.reserve(barcodes.size());
    for (const auto& b : barcodes) {
        auto it = by_id.find(b.cluster_id);
        if (it == by_id.end()) {
            ++report.barcodes_without_cluster;
            continue;
        }
        for (auto cptr : it->second) {
            output.push_back(CenterAssignment{ b.barcode, cptr->center });
        }
    }

    return output;
}

/**
 * Right join of the cluster assignments onto the barcode/read pairs on the raw barcode.
 * Every pair is retained, in the order of `pairs`: 
 * a pair yields one output per assignment for its barcode, or a single output without a center if its barcode has no assignment.
 * The latter are counted in `JoinReport::pairs_without_center`.
 *
 * @param assignments Cluster centers for each barcode, from `inner_join_clusters()`.
 * @param pairs Barcode/read pairs passed to the clustering tool.
 * @param[out] report Report to be updated with the number of pairs without a center.
 *
 * @return Reads with their raw barcodes and cluster centers.
 */
inline std::vector<AssignedPair> right_join_bartender(const std::vector<CenterAssignment>& assignments, const std::vector<BartenderPair>& pairs, JoinReport& report) {
    std::unordered_map<std::string, std::vector<const std::string*> > by_barcode;
    for (const auto& a : assignments) {
        by_barcode[a.barcode].push_back(&(a.center));
    }

    std::vector<AssignedPair> output;
    output.reserve(pairs.size());
    for (const auto& p : pairs) {
        auto it = by_barcode.find(p.barcode);
        if (it == by_barcode.end()) {
            ++report.pairs_without_center;
            output.push_back(AssignedPair{ p.barcode, p.read_id, std::nullopt });
            continue;
        }
        for (auto center : it->second) {
            output.push_back(AssignedPair{ p.barcode, p.read_id, *center });
        }
    }

    return output;
}

/**
 * Inner join of the assigned reads to the extracted records on the read name and raw barcode.
 * Each assigned read yields one row per matching record, in the order of `assigned`.
 * Assigned reads without a matching record are dropped and counted in `JoinReport::pairs_without_record`.
 *
 * @param assigned Reads with their raw barcodes and cluster centers, from `right_join_bartender()`.
 * @param records Extracted records for the sample.
 * @param[out] report Report to be updated with the number of input, dropped and output rows.
 *
 * @return Fully annotated reads.
 */
inline std::vector<UnifiedRow> inner_join_reference(const std::vector<AssignedPair>& assigned, const std::vector<ExtractedRecord>& records, JoinReport& report) {
    // '\n' cannot occur in a read name or barcode that survived the line-based formats.
    auto make_key = [](const std::string& read_id, const std::string& barcode) -> std::string {
        std::string key;
        key.reserve(read_id.size() + barcode.size() + 1);
        key += read_id;
        key += '\n';
        key += barcode;
        return key;
    };

    std::unordered_map<std::string, std::vector<const ExtractedRecord*> > by_key;
    for (const auto& r : records) {
        by_key[make_key(r.read_id, r.barcode)].push_back(&r);
    }

    std::vector<UnifiedRow> output;
    output.reserve(assigned.size());
    report.pairs_in += assigned.size();

    for (const auto& a : assigned) {
        auto it = by_key.find(make_key(a.read_id, a.barcode));
        if (it == by_key.end()) {
            ++report.pairs_without_record;
            continue;
        }

        for (auto rptr : it->second) {
            UnifiedRow current;
            current.read_id = a.read_id;
            current.barcode = a.barcode;
            current.center = a.center;
            current.tag1 = rptr->tag1;
            current.tag2 = rptr->tag2;
            current.combination = rptr->combination;
            current.sample_id = rptr->sample_id;
            output.push_back(std::move(current));
        }
    }

    report.rows_out += output.size();
    return output;
}

/**
 * @param path Path to a cluster file from the clustering tool, with the `Cluster.ID` and `Center` columns.
 * @return Clusters in the file.
 */
inline std::vector<ClusterEntry> load_cluster_entries(const std::string& path) {
    std::vector<ClusterEntry> output;
    read_csv_file(path, { "Cluster.ID", "Center" }, [&](csv::CSVRow& row) -> void {
        output.push_back(ClusterEntry{ row["Cluster.ID"].get<std::string>(), row["Center"].get<std::string>() });
    });
    return output;
}

/**
 * @param path Path to a barcode file from the clustering tool, with the `Unique.reads`, `Cluster.ID` and `Frequency` columns.
 * The per-barcode frequencies are not used as reads are counted after the joins.
 * @return Unique barcodes in the file.
 */
inline std::vector<BarcodeEntry> load_barcode_entries(const std::string& path) {
    std::vector<BarcodeEntry> output;
    read_csv_file(path, { "Unique.reads", "Cluster.ID", "Frequency" }, [&](csv::CSVRow& row) -> void {
        output.push_back(BarcodeEntry{ row["Unique.reads"].get<std::string>(), row["Cluster.ID"].get<std::string>() });
    });
    return output;
}

/**
 * @param path Path to a headerless file of barcodes and read names, as written by `write_extraction()`.
 * @return Barcode/read pairs in the file.
 */
inline std::vector<BartenderPair> load_bartender_pairs(const std::string& path) {
    std::vector<BartenderPair> output;
    read_headerless_csv_file(path, { "barcode", "read_id" }, [&](csv::CSVRow& row) -> void {
        output.push_back(BartenderPair{ row["barcode"].get<std::string>(), row["read_id"].get<std::string>() });
    });
    return output;
}

/**
 * @brief Paths to the files for one combination of guides.
 */
struct PartitionFiles {
    std::string cluster_file;
    std::string barcode_file;
    std::string bartender_file;
};

/**
 * Find the cluster files for all combinations in a sample, i.e., files named `*_cluster.csv` inside any `Clonal_barcode` directory below `sample_dir`.
 * For each cluster file `<stem>_cluster.csv`, the barcode file is `<stem>_barcode.csv` and the barcode/read pairs are in `<stem>.bartender`, all in the same directory.
 *
 * @param sample_dir Path to the directory for a sample.
 * @return Files for each combination, sorted by the path to the cluster file.
 */
inline std::vector<PartitionFiles> find_partition_files(const std::string& sample_dir) {
    static const std::string suffix = "_cluster.csv";
    std::vector<PartitionFiles> output;

    for (const auto& entry : std::filesystem::recursive_directory_iterator(sample_dir)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        const auto& path = entry.path();
        if (path.parent_path().filename() != "Clonal_barcode") {
            continue;
        }

        auto name = path.filename().string();
        if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }

        auto stem = name.substr(0, name.size() - suffix.size());
        auto dir = path.parent_path();
        output.push_back(PartitionFiles{ 
            path.string(), 
            (dir / (stem + "_barcode.csv")).string(),
            (dir / (stem + ".bartender")).string()
        });
    }

    std::sort(output.begin(), output.end(), [](const PartitionFiles& left, const PartitionFiles& right) -> bool {
        return left.cluster_file < right.cluster_file;
    });
    return output;
}

/**
 * Assign cluster centers to the reads for one combination of guides,
 * by joining the barcode entries to the clusters with `inner_join_clusters()` and then onto the barcode/read pairs with `right_join_bartender()`.
 *
 * @param files Paths to the files for the combination.
 * @param[out] report Report to be updated with the join counts.
 *
 * @return Reads with their raw barcodes and cluster centers.
 */
inline std::vector<AssignedPair> merge_partition(const PartitionFiles& files, JoinReport& report) {
    auto barcodes = load_barcode_entries(files.barcode_file);
    auto clusters = load_cluster_entries(files.cluster_file);
    auto pairs = load_bartender_pairs(files.bartender_file);
    auto assignments = inner_join_clusters(barcodes, clusters, report);
    return right_join_bartender(assignments, pairs, report);
}

/**
 * Annotate all reads in a sample.
 * The assigned reads from `merge_partition()` for all combinations are concatenated,
 * and then joined to the extracted records in `<sample_dir>/Intermediate_df.csv` with `inner_join_reference()`.
 *
 * @param sample_dir Path to the directory for a sample.
 * @param[out] report Report to be updated with the join counts.
 *
 * @return Fully annotated reads.
 */
inline std::vector<UnifiedRow> merge_sample(const std::string& sample_dir, JoinReport& report) {
    auto partitions = find_partition_files(sample_dir);
    if (partitions.empty()) {
        throw std::runtime_error("no cluster files found in '" + sample_dir + "'");
    }

    std::vector<AssignedPair> combined;
    for (const auto& p : partitions) {
        auto current = merge_partition(p, report);
        spdlog::debug("Merged {} reads from '{}'", current.size(), p.cluster_file);
        combined.insert(combined.end(), std::make_move_iterator(current.begin()), std::make_move_iterator(current.end()));
    }

    auto records = load_extracted_records((std::filesystem::path(sample_dir) / "Intermediate_df.csv").string());
    return inner_join_reference(combined, records, report);
}

}

#endif
