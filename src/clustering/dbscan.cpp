// File: src/clustering/dbscan.cpp
#include "clustering/dbscan.hpp"
#include <deque>
#include <stdexcept>

namespace recur {

DbscanClusterer::DbscanClusterer(const Config& config) : config_(config) {
    if (!(config_.eps > 0.0)) {
        throw std::invalid_argument("DBSCAN eps must be > 0");
    }
    if (config_.min_samples == 0) {
        throw std::invalid_argument("DBSCAN min_samples must be >= 1");
    }
}

std::vector<int> DbscanClusterer::Cluster(const FeatureMatrix& matrix) const {
    return Cluster(matrix.AllRows());
}

std::vector<size_t> DbscanClusterer::RegionQuery(const std::vector<FeatureVector>& rows,
                                                 size_t index) const {
    std::vector<size_t> neighbors;
    const FeatureVector& point = rows[index];
    for (size_t j = 0; j < rows.size(); ++j) {
        if (point.EuclideanDistance(rows[j]) <= config_.eps) {
            neighbors.push_back(j);
        }
    }
    return neighbors;
}

std::vector<int> DbscanClusterer::Cluster(const std::vector<FeatureVector>& rows) const {
    const size_t n = rows.size();
    std::vector<int> labels(n, kNoise);
    if (n == 0) {
        return labels;
    }

    const size_t dimension = rows.front().Dimension();
    for (size_t i = 1; i < n; ++i) {
        if (rows[i].Dimension() != dimension) {
            throw std::invalid_argument(
                "row " + std::to_string(i) + " has dimension " +
                std::to_string(rows[i].Dimension()) + ", expected " +
                std::to_string(dimension));
        }
    }

    // Neighbourhoods and core flags up front so expansion order cannot
    // influence which points are core
    std::vector<std::vector<size_t>> neighborhoods(n);
    std::vector<bool> is_core(n, false);
    for (size_t i = 0; i < n; ++i) {
        neighborhoods[i] = RegionQuery(rows, i);
        is_core[i] = neighborhoods[i].size() >= config_.min_samples;
    }

    int next_label = 0;
    for (size_t i = 0; i < n; ++i) {
        if (labels[i] != kNoise || !is_core[i]) {
            continue;
        }

        // Expand cluster breadth-first from this core point
        int label = next_label++;
        labels[i] = label;
        std::deque<size_t> frontier{i};
        while (!frontier.empty()) {
            size_t current = frontier.front();
            frontier.pop_front();
            if (!is_core[current]) {
                continue;
            }
            for (size_t neighbor : neighborhoods[current]) {
                if (labels[neighbor] == kNoise) {
                    labels[neighbor] = label;
                    frontier.push_back(neighbor);
                }
            }
        }
    }
    return labels;
}

std::vector<ClusterGroup> DbscanClusterer::GroupClusters(const std::vector<int>& labels) {
    std::map<int, std::vector<size_t>> grouped;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] != kNoise) {
            grouped[labels[i]].push_back(i);
        }
    }

    std::vector<ClusterGroup> clusters;
    clusters.reserve(grouped.size());
    for (auto& [label, rows] : grouped) {
        clusters.push_back(ClusterGroup{label, std::move(rows)});
    }
    return clusters;
}

} // namespace recur
