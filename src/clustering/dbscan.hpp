// File: src/clustering/dbscan.hpp
#pragma once

#include "core/feature_vector.hpp"
#include <map>
#include <string>
#include <vector>

namespace recur {

/// Group of feature-matrix rows sharing a cluster label
struct ClusterGroup {
    int label{-1};
    std::vector<size_t> rows;   // Ascending row indices
};

/// DbscanClusterer - density-based clustering over feature rows
///
/// A row is a core point when at least min_samples rows, itself included,
/// lie within Euclidean distance eps. Clusters grow from core points to
/// every density-reachable row. Rows reached by no core point are noise.
///
/// Rows are visited in index order and neighbours are expanded in index
/// order, so the same matrix and parameters always give the same labels.
/// Labels are numbered from 0 in discovery order.
class DbscanClusterer {
public:
    static constexpr int kNoise = -1;

    struct Config {
        /// Neighbourhood radius; must be set by the caller
        double eps{0.0};

        /// Minimum neighbourhood size (including the point) for a core point
        size_t min_samples{3};
    };

    /// @throws std::invalid_argument if eps <= 0 or min_samples == 0
    explicit DbscanClusterer(const Config& config);

    /// Label every row of the matrix
    std::vector<int> Cluster(const FeatureMatrix& matrix) const;

    /// Label raw rows; all rows must share one dimension
    /// @throws std::invalid_argument on mismatched row lengths
    std::vector<int> Cluster(const std::vector<FeatureVector>& rows) const;

    /// Collect labelled rows into clusters, ordered by label; noise is omitted
    static std::vector<ClusterGroup> GroupClusters(const std::vector<int>& labels);

    const Config& GetConfig() const { return config_; }

private:
    std::vector<size_t> RegionQuery(const std::vector<FeatureVector>& rows,
                                    size_t index) const;

    Config config_;
};

} // namespace recur
