// File: src/detection/detection_service.cpp
#include "detection/detection_service.hpp"
#include "clustering/dbscan.hpp"
#include "detection/batch_partitioner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace recur {

DetectionService::DetectionService(const Config& config,
                                   std::shared_ptr<const HolidayCalendar> holidays,
                                   ConfidenceAdjustmentTable adjustments)
    : config_(config),
      holidays_(holidays),
      features_(holidays),
      merchant_(config.merchant),
      scorer_(config.confidence, std::move(adjustments)),
      temporal_criteria_(FrequencyAnalyzer(config.frequency),
                         TemporalPatternAnalyzer(config.temporal, holidays)),
      clock_(&NowMillis) {
    if (!holidays_) {
        throw std::invalid_argument("DetectionService requires a holiday calendar");
    }
    if (!(config_.eps > 0.0)) {
        throw std::invalid_argument("eps must be set to a positive value");
    }
    if (config_.min_samples_ratio < 0.0 || config_.min_samples_ratio > 1.0) {
        throw std::invalid_argument("min_samples_ratio must be in [0, 1]");
    }
    if (config_.min_cluster_size == 0) {
        throw std::invalid_argument("min_cluster_size must be positive");
    }
    if (config_.min_occurrences == 0) {
        throw std::invalid_argument("min_occurrences must be positive");
    }
    if (config_.min_confidence < 0.0 || config_.min_confidence > 1.0) {
        throw std::invalid_argument("min_confidence must be in [0, 1]");
    }
    if (config_.max_batch_size == 0) {
        throw std::invalid_argument("max_batch_size must be positive");
    }
}

void DetectionService::SetClock(Clock clock) {
    if (!clock) {
        throw std::invalid_argument("Clock must not be empty");
    }
    clock_ = std::move(clock);
}

size_t DetectionService::MinSamples(size_t row_count) const {
    size_t scaled = static_cast<size_t>(
        std::floor(static_cast<double>(row_count) * config_.min_samples_ratio));
    return std::max(config_.min_cluster_size, scaled);
}

DetectionResult DetectionService::Detect(const std::string& user_id,
                                         const std::vector<Transaction>& transactions,
                                         const AccountsMap* accounts) const {
    DetectionResult result;
    result.stats.transactions_in = transactions.size();

    const AccountsMap* context = config_.use_account_features ? accounts : nullptr;
    result.stats.feature_mode = context ? FeatureMode::ACCOUNT_AWARE : FeatureMode::BASE;

    if (transactions.size() < config_.min_occurrences) {
        spdlog::info("User {}: {} transactions, need at least {} for detection",
                     user_id, transactions.size(), config_.min_occurrences);
        return result;
    }

    spdlog::info("Detecting recurring patterns for user {} ({} transactions, {} mode)",
                 user_id, transactions.size(), ToString(result.stats.feature_mode));

    BatchPartitioner partitioner(config_.max_batch_size);
    BatchPlan plan = partitioner.Partition(transactions);
    for (auto& warning : plan.warnings) {
        spdlog::warn("{}", warning);
        result.warnings.push_back(std::move(warning));
    }

    result.stats.batches = plan.batches.size();
    for (const auto& batch : plan.batches) {
        DetectBatch(user_id, batch.transactions, context, result);
    }

    std::stable_sort(result.patterns.begin(), result.patterns.end(),
                     [](const RecurringChargePattern& a, const RecurringChargePattern& b) {
                         return a.GetFirstOccurrence() < b.GetFirstOccurrence();
                     });
    result.stats.patterns_detected = result.patterns.size();

    spdlog::info("User {}: {} clusters, {} noise points, {} patterns detected",
                 user_id, result.stats.clusters_found, result.stats.noise_points,
                 result.stats.patterns_detected);
    return result;
}

void DetectionService::DetectBatch(const std::string& user_id,
                                   const std::vector<Transaction>& transactions,
                                   const AccountsMap* accounts,
                                   DetectionResult& result) const {
    FeatureBatch batch = features_.ExtractBatch(transactions, accounts);
    for (auto& warning : batch.warnings) {
        result.warnings.push_back(std::move(warning));
    }

    const size_t rows = batch.matrix.Rows();
    result.stats.transactions_used += rows;
    if (rows < config_.min_occurrences) {
        spdlog::debug("Batch of {} usable rows is below min_occurrences", rows);
        return;
    }

    DbscanClusterer::Config cluster_config;
    cluster_config.eps = config_.eps;
    cluster_config.min_samples = MinSamples(rows);
    DbscanClusterer clusterer(cluster_config);

    std::vector<int> labels = clusterer.Cluster(batch.matrix);
    result.stats.noise_points += static_cast<size_t>(
        std::count(labels.begin(), labels.end(), DbscanClusterer::kNoise));

    std::vector<ClusterGroup> groups = DbscanClusterer::GroupClusters(labels);
    result.stats.clusters_found += groups.size();

    spdlog::debug("DBSCAN eps={} min_samples={}: {} clusters over {} rows",
                  cluster_config.eps, cluster_config.min_samples, groups.size(), rows);

    for (const auto& group : groups) {
        if (group.rows.size() < config_.min_occurrences) {
            ++result.stats.clusters_too_small;
            continue;
        }

        std::vector<Transaction> members;
        members.reserve(group.rows.size());
        for (size_t row : group.rows) {
            members.push_back(transactions[batch.source_indices[row]]);
        }

        RecurringChargePattern pattern;
        if (AnalyzeCluster(user_id, std::move(members), batch.matrix, group.rows,
                           group.label, accounts, pattern)) {
            result.patterns.push_back(std::move(pattern));
        } else {
            ++result.stats.clusters_low_confidence;
        }
    }
}

bool DetectionService::AnalyzeCluster(const std::string& user_id,
                                      std::vector<Transaction> members,
                                      const FeatureMatrix& matrix,
                                      const std::vector<size_t>& rows,
                                      int cluster_label,
                                      const AccountsMap* accounts,
                                      RecurringChargePattern& out) const {
    std::stable_sort(members.begin(), members.end(),
                     [](const Transaction& a, const Transaction& b) { return a.date < b.date; });

    TemporalAnalysis temporal = temporal_criteria_.Analyze(members);
    std::string merchant_pattern = merchant_.ExtractPattern(members);

    ConfidenceBreakdown confidence = scorer_.Score(members, temporal.consistency,
                                                   temporal.frequency, merchant_pattern,
                                                   accounts);
    if (confidence.final_score < config_.min_confidence) {
        spdlog::debug("Cluster {} ({}) rejected: confidence {:.2f} < {:.2f}",
                      cluster_label, merchant_pattern, confidence.final_score,
                      config_.min_confidence);
        return false;
    }

    std::vector<std::string> descriptions;
    std::vector<double> amounts;
    std::vector<std::string> ids;
    descriptions.reserve(members.size());
    amounts.reserve(members.size());
    ids.reserve(members.size());
    for (const auto& tx : members) {
        descriptions.push_back(tx.description);
        amounts.push_back(std::fabs(tx.amount));
        ids.push_back(tx.id);
    }

    MerchantCriteria merchant = MerchantCriteriaBuilder::Analyze(descriptions).ToCriteria();
    if (merchant.pattern.size() < merchant_.GetConfig().min_pattern_length) {
        merchant.pattern = merchant_pattern;
        merchant.match_type = MatchType::CONTAINS;
        merchant.exclusions.clear();
    }

    RecurringChargePattern pattern(PatternID::Generate(), user_id, std::move(ids));
    pattern.SetMerchantCriteria(merchant);
    pattern.SetAmountCriteria(AmountCriteriaBuilder::Analyze(amounts).ToCriteria());
    pattern.SetTemporalCriteria(temporal.ToCriteria());
    pattern.SetConfidence(confidence.final_score);
    pattern.SetTransactionCount(members.size());
    pattern.SetOccurrenceRange(members.front().date, members.back().date);
    pattern.SetFeatureVector(matrix.Centroid(rows), matrix.Mode());
    pattern.SetClusterID(cluster_label);

    const EpochMillis now = clock_();
    pattern.SetCreatedAt(now);
    pattern.Touch(now);

    spdlog::info("Detected {} {} pattern '{}' ({} occurrences, confidence {:.2f})",
                 ToString(temporal.frequency), ToString(temporal.pattern_type),
                 merchant.pattern, members.size(), confidence.final_score);

    out = std::move(pattern);
    return true;
}

} // namespace recur
