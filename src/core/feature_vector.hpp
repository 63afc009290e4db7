// File: src/core/feature_vector.hpp
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace recur {

// FeatureVector: Numerical representation of a single transaction
class FeatureVector {
public:
    using ValueType = float;
    using StorageType = std::vector<ValueType>;

    // Constructors
    FeatureVector() = default;
    explicit FeatureVector(size_t dimension);
    explicit FeatureVector(const StorageType& data);
    explicit FeatureVector(StorageType&& data);

    // Get dimension
    size_t Dimension() const { return data_.size(); }

    // Element access
    ValueType operator[](size_t index) const { return data_[index]; }
    ValueType& operator[](size_t index) { return data_[index]; }

    // Get raw data
    const StorageType& Data() const { return data_; }
    StorageType& Data() { return data_; }

    // Compute L2 norm
    float Norm() const;

    // Normalize to unit length (zero vector stays zero)
    FeatureVector Normalized() const;

    // Euclidean distance
    // @throws std::invalid_argument on dimension mismatch
    float EuclideanDistance(const FeatureVector& other) const;

    // Vector operations
    FeatureVector operator+(const FeatureVector& other) const;
    FeatureVector operator*(float scalar) const;

    // Append another vector's values to the end of this one
    void Append(const FeatureVector& other);

    // Equality comparison
    bool operator==(const FeatureVector& other) const;
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }

    // Serialization
    void Serialize(std::ostream& out) const;
    static FeatureVector Deserialize(std::istream& in);

    // String representation
    std::string ToString(size_t max_elements = 10) const;

private:
    StorageType data_;
};

/// Rows produced by a single feature extractor, one per transaction
using FeatureBlock = std::vector<FeatureVector>;

// FeatureMode: Which feature layout a vector follows
enum class FeatureMode : uint8_t {
    BASE = 0,           // temporal + amount + description
    ACCOUNT_AWARE = 1,  // base + account context
};

constexpr size_t kBaseFeatureWidth = 67;
constexpr size_t kAccountAwareFeatureWidth = 91;

/// Number of columns a row must have in the given mode
size_t FeatureWidth(FeatureMode mode);

const char* ToString(FeatureMode mode);
FeatureMode ParseFeatureMode(const std::string& str);

/// Row-major feature matrix that always knows its layout.
///
/// Every row is checked against the width of the declared mode, so a matrix
/// can never hold a vector of the wrong length.
class FeatureMatrix {
public:
    explicit FeatureMatrix(FeatureMode mode);

    /// @throws std::invalid_argument if any row has the wrong width
    FeatureMatrix(FeatureMode mode, std::vector<FeatureVector> rows);

    /// @throws std::invalid_argument if the row has the wrong width
    void AppendRow(FeatureVector row);

    FeatureMode Mode() const { return mode_; }
    size_t Rows() const { return rows_.size(); }
    size_t Cols() const { return FeatureWidth(mode_); }
    bool Empty() const { return rows_.empty(); }

    const FeatureVector& Row(size_t index) const { return rows_.at(index); }
    const std::vector<FeatureVector>& AllRows() const { return rows_; }

    /// Mean of the selected rows
    /// @throws std::invalid_argument if indices is empty or out of range
    FeatureVector Centroid(const std::vector<size_t>& indices) const;

private:
    FeatureMode mode_;
    std::vector<FeatureVector> rows_;
};

} // namespace recur
