// File: src/features/feature_extractor.hpp
#pragma once

#include "core/feature_vector.hpp"
#include "core/transaction.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace recur {

/// Compile-time check for the feature extractor capability.
///
/// A type is a feature extractor when it provides
///   size_t FeatureSize() const;
///   FeatureBlock ExtractBatch(const std::vector<Transaction>&);
/// No common base class is required.
template <typename T, typename = void>
struct IsFeatureExtractor : std::false_type {};

template <typename T>
struct IsFeatureExtractor<T, std::void_t<
    decltype(std::declval<const T&>().FeatureSize()),
    decltype(std::declval<T&>().ExtractBatch(
        std::declval<const std::vector<Transaction>&>()))>>
    : std::integral_constant<bool,
        std::is_convertible<decltype(std::declval<const T&>().FeatureSize()),
                            size_t>::value &&
        std::is_same<decltype(std::declval<T&>().ExtractBatch(
                         std::declval<const std::vector<Transaction>&>())),
                     FeatureBlock>::value> {};

/// Type-erased handle on any feature extractor.
///
/// Output is checked: one row per transaction, each FeatureSize() wide.
class FeatureExtractorSlot {
public:
    template <typename Extractor>
    static FeatureExtractorSlot Wrap(std::string name,
                                     std::shared_ptr<Extractor> extractor) {
        static_assert(IsFeatureExtractor<Extractor>::value,
                      "type does not provide FeatureSize() and ExtractBatch()");
        if (!extractor) {
            throw std::invalid_argument("Feature extractor '" + name + "' is null");
        }
        size_t size = extractor->FeatureSize();
        return FeatureExtractorSlot(
            std::move(name), size,
            [extractor](const std::vector<Transaction>& transactions) {
                return extractor->ExtractBatch(transactions);
            });
    }

    const std::string& Name() const { return name_; }
    size_t FeatureSize() const { return feature_size_; }

    /// @throws std::logic_error if the extractor breaks its declared shape
    FeatureBlock ExtractBatch(const std::vector<Transaction>& transactions) const;

private:
    using ExtractFn = std::function<FeatureBlock(const std::vector<Transaction>&)>;

    FeatureExtractorSlot(std::string name, size_t feature_size, ExtractFn extract)
        : name_(std::move(name)), feature_size_(feature_size), extract_(std::move(extract)) {}

    std::string name_;
    size_t feature_size_;
    ExtractFn extract_;
};

} // namespace recur
