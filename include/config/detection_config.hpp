// File: include/config/detection_config.hpp
//
// YAML configuration for the recurring charge detection engine
// Loads clustering, scoring and calendar settings from YAML files

#ifndef RECUR_DETECTION_CONFIG_HPP
#define RECUR_DETECTION_CONFIG_HPP

#include "analysis/frequency_analyzer.hpp"
#include "calendar/holiday_calendar.hpp"
#include "detection/detection_service.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recur {

/// Configuration structure for recurring charge detection
struct DetectionConfig {
    // === DBSCAN Settings ===
    struct Clustering {
        /// Neighbourhood radius; must be provided, there is no default
        std::optional<double> eps;
        double min_samples_ratio = 0.01;
        size_t min_cluster_size = 3;
        size_t max_batch_size = 5000;
    } clustering;

    // === Confidence Scoring ===
    struct Confidence {
        double interval_weight = 0.30;
        double amount_weight = 0.20;
        double sample_size_weight = 0.20;
        double temporal_weight = 0.30;
        size_t saturation_count = 12;
        double min_confidence = 0.6;
    } confidence;

    // === Frequency Buckets ===
    // YAML form: one "name: [min, max]" entry per bucket, in days
    struct Frequency {
        std::vector<FrequencyWindow> windows = DefaultFrequencyWindows();
    } frequency;

    // === Temporal Shapes ===
    struct Temporal {
        double consistency_threshold = 0.70;
        double weekday_threshold = 0.70;
        double day_threshold = 0.60;
        size_t min_weekday_samples = 3;
        std::string holiday_calendar = "US";   // US or NONE
    } temporal;

    // === Detection Run ===
    struct Detection {
        size_t min_occurrences = 3;
        bool use_account_features = true;
    } detection;

    // === Logging ===
    struct Logging {
        std::string level = "info";   // trace, debug, info, warn, error, critical, off
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return DetectionConfig if successful, std::nullopt on error
    static std::optional<DetectionConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return DetectionConfig if successful, std::nullopt on error
    static std::optional<DetectionConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration (eps still unset)
    static DetectionConfig Default();

    // === Component Configs ===

    /// @throws std::invalid_argument if the configuration is invalid
    DetectionService::Config ToDetectionServiceConfig() const;

    /// @throws std::invalid_argument for an unknown calendar name
    std::shared_ptr<const HolidayCalendar> CreateHolidays() const;

    /// Set the global spdlog level from logging.level
    void ApplyLogging() const;
};

} // namespace recur

#endif // RECUR_DETECTION_CONFIG_HPP
