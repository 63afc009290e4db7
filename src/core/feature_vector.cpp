// File: src/core/feature_vector.cpp
#include "core/feature_vector.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace recur {

// ============================================================================
// FeatureVector Implementation
// ============================================================================

FeatureVector::FeatureVector(size_t dimension) : data_(dimension, 0.0f) {}

FeatureVector::FeatureVector(const StorageType& data) : data_(data) {}

FeatureVector::FeatureVector(StorageType&& data) : data_(std::move(data)) {}

float FeatureVector::Norm() const {
    float sum_sq = 0.0f;
    for (float val : data_) {
        sum_sq += val * val;
    }
    return std::sqrt(sum_sq);
}

FeatureVector FeatureVector::Normalized() const {
    float norm = Norm();
    if (norm == 0.0f) {
        return FeatureVector(data_.size());
    }

    FeatureVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] / norm;
    }
    return result;
}

float FeatureVector::EuclideanDistance(const FeatureVector& other) const {
    if (Dimension() != other.Dimension()) {
        throw std::invalid_argument("FeatureVector dimensions must match for distance");
    }

    float sum_sq_diff = 0.0f;
    for (size_t i = 0; i < data_.size(); ++i) {
        float diff = data_[i] - other.data_[i];
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff);
}

FeatureVector FeatureVector::operator+(const FeatureVector& other) const {
    if (Dimension() != other.Dimension()) {
        throw std::invalid_argument("FeatureVector dimensions must match for addition");
    }

    FeatureVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] + other.data_[i];
    }
    return result;
}

FeatureVector FeatureVector::operator*(float scalar) const {
    FeatureVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] * scalar;
    }
    return result;
}

void FeatureVector::Append(const FeatureVector& other) {
    data_.insert(data_.end(), other.data_.begin(), other.data_.end());
}

bool FeatureVector::operator==(const FeatureVector& other) const {
    if (Dimension() != other.Dimension()) {
        return false;
    }

    for (size_t i = 0; i < data_.size(); ++i) {
        if (std::abs(data_[i] - other.data_[i]) > 1e-6f) {
            return false;
        }
    }
    return true;
}

void FeatureVector::Serialize(std::ostream& out) const {
    uint64_t dim = data_.size();
    out.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
    out.write(reinterpret_cast<const char*>(data_.data()), dim * sizeof(ValueType));
}

FeatureVector FeatureVector::Deserialize(std::istream& in) {
    uint64_t dim = 0;
    in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
    if (dim > UINT64_MAX / sizeof(ValueType)) {
        throw std::runtime_error("Feature vector dimension out of range");
    }
    RequireReadable(in, dim * sizeof(ValueType));

    FeatureVector result(static_cast<size_t>(dim));
    in.read(reinterpret_cast<char*>(result.data_.data()), dim * sizeof(ValueType));
    return result;
}

std::string FeatureVector::ToString(size_t max_elements) const {
    if (data_.empty()) {
        return "FeatureVector[]";
    }

    std::ostringstream oss;
    oss << "FeatureVector[" << data_.size() << "](";

    size_t count = std::min(max_elements, data_.size());
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) oss << ", ";
        oss << std::fixed << std::setprecision(4) << data_[i];
    }

    if (data_.size() > max_elements) {
        oss << ", ...";
    }
    oss << ")";

    return oss.str();
}

// ============================================================================
// FeatureMode
// ============================================================================

size_t FeatureWidth(FeatureMode mode) {
    return mode == FeatureMode::ACCOUNT_AWARE ? kAccountAwareFeatureWidth
                                              : kBaseFeatureWidth;
}

const char* ToString(FeatureMode mode) {
    switch (mode) {
        case FeatureMode::BASE: return "BASE";
        case FeatureMode::ACCOUNT_AWARE: return "ACCOUNT_AWARE";
        default: return "UNKNOWN";
    }
}

FeatureMode ParseFeatureMode(const std::string& str) {
    if (str == "BASE") return FeatureMode::BASE;
    if (str == "ACCOUNT_AWARE") return FeatureMode::ACCOUNT_AWARE;
    throw std::invalid_argument("Unknown FeatureMode: " + str);
}

// ============================================================================
// FeatureMatrix Implementation
// ============================================================================

FeatureMatrix::FeatureMatrix(FeatureMode mode) : mode_(mode) {}

FeatureMatrix::FeatureMatrix(FeatureMode mode, std::vector<FeatureVector> rows)
    : mode_(mode) {
    rows_.reserve(rows.size());
    for (auto& row : rows) {
        AppendRow(std::move(row));
    }
}

void FeatureMatrix::AppendRow(FeatureVector row) {
    if (row.Dimension() != Cols()) {
        throw std::invalid_argument(
            "Feature row has " + std::to_string(row.Dimension()) +
            " columns, expected " + std::to_string(Cols()) +
            " for mode " + ToString(mode_));
    }
    rows_.push_back(std::move(row));
}

FeatureVector FeatureMatrix::Centroid(const std::vector<size_t>& indices) const {
    if (indices.empty()) {
        throw std::invalid_argument("Centroid requires at least one row");
    }

    FeatureVector sum(Cols());
    for (size_t index : indices) {
        sum = sum + Row(index);
    }
    return sum * (1.0f / static_cast<float>(indices.size()));
}

} // namespace recur
