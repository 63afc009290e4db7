// File: src/config/detection_config.cpp
//
// YAML configuration implementation for recurring charge detection

#include "config/detection_config.hpp"
#include <spdlog/spdlog.h>
#include <yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace recur {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// std::stoul accepts a leading minus and wraps it around
static size_t ParseCount(const std::string& value) {
    const size_t first = value.find_first_not_of(" \t");
    if (first != std::string::npos && value[first] == '-') {
        throw std::invalid_argument("count must not be negative: " + value);
    }
    return std::stoul(value);
}

static std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

static void ApplyScalar(DetectionConfig& config, const std::string& section,
                        const std::string& key, const std::string& value) {
    if (section == "clustering") {
        if (key == "eps") config.clustering.eps = std::stod(value);
        else if (key == "min_samples_ratio") config.clustering.min_samples_ratio = std::stod(value);
        else if (key == "min_cluster_size") config.clustering.min_cluster_size = ParseCount(value);
        else if (key == "max_batch_size") config.clustering.max_batch_size = ParseCount(value);
    }
    else if (section == "confidence") {
        if (key == "interval_weight") config.confidence.interval_weight = std::stod(value);
        else if (key == "amount_weight") config.confidence.amount_weight = std::stod(value);
        else if (key == "sample_size_weight") config.confidence.sample_size_weight = std::stod(value);
        else if (key == "temporal_weight") config.confidence.temporal_weight = std::stod(value);
        else if (key == "saturation_count") config.confidence.saturation_count = ParseCount(value);
        else if (key == "min_confidence") config.confidence.min_confidence = std::stod(value);
    }
    else if (section == "temporal") {
        if (key == "consistency_threshold") config.temporal.consistency_threshold = std::stod(value);
        else if (key == "weekday_threshold") config.temporal.weekday_threshold = std::stod(value);
        else if (key == "day_threshold") config.temporal.day_threshold = std::stod(value);
        else if (key == "min_weekday_samples") config.temporal.min_weekday_samples = ParseCount(value);
        else if (key == "holiday_calendar") config.temporal.holiday_calendar = ToUpper(value);
    }
    else if (section == "detection") {
        if (key == "min_occurrences") config.detection.min_occurrences = ParseCount(value);
        else if (key == "use_account_features") config.detection.use_account_features = ParseBool(value);
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = ToLower(value);
    }
    else {
        spdlog::warn("Ignoring unknown configuration key {}.{}", section, key);
    }
}

static void ApplyWindow(DetectionConfig& config, const std::string& key,
                        const std::vector<std::string>& values) {
    if (values.size() != 2) {
        throw std::invalid_argument("frequency." + key + " needs [min, max]");
    }
    RecurrenceFrequency frequency = ParseRecurrenceFrequency(ToUpper(key));
    FrequencyWindow window{frequency, std::stod(values[0]), std::stod(values[1])};

    auto& windows = config.frequency.windows;
    auto it = std::find_if(windows.begin(), windows.end(),
                           [frequency](const FrequencyWindow& w) { return w.frequency == frequency; });
    if (it != windows.end()) {
        *it = window;
    } else {
        windows.push_back(window);
    }
}

std::optional<DetectionConfig> DetectionConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file: {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<DetectionConfig> DetectionConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        spdlog::error("Failed to initialize YAML parser");
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    DetectionConfig config = Default();
    std::string current_section;
    std::string current_key;
    std::vector<std::string> sequence;
    bool in_sequence = false;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            spdlog::error("YAML parse error at line {}: {}", parser.problem_mark.line + 1,
                          parser.problem ? parser.problem : "unknown");
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        try {
            switch (event.type) {
                case YAML_MAPPING_START_EVENT:
                    depth++;
                    break;

                case YAML_MAPPING_END_EVENT:
                    depth--;
                    if (depth == 1) {
                        current_section.clear();
                    }
                    break;

                case YAML_SEQUENCE_START_EVENT:
                    in_sequence = true;
                    sequence.clear();
                    break;

                case YAML_SEQUENCE_END_EVENT:
                    in_sequence = false;
                    if (current_section == "frequency" && !current_key.empty()) {
                        ApplyWindow(config, current_key, sequence);
                    }
                    current_key.clear();
                    break;

                case YAML_SCALAR_EVENT: {
                    std::string value = GetScalarValue(&event);

                    if (in_sequence) {
                        sequence.push_back(value);
                    } else if (depth == 1) {
                        // Top-level key (section name)
                        current_section = value;
                    } else if (depth == 2) {
                        if (current_key.empty()) {
                            current_key = value;
                        } else {
                            ApplyScalar(config, current_section, current_key, value);
                            current_key.clear();
                        }
                    }
                    break;
                }

                case YAML_STREAM_END_EVENT:
                case YAML_DOCUMENT_END_EVENT:
                    done = true;
                    break;

                default:
                    break;
            }
        } catch (const std::exception& e) {
            spdlog::error("Invalid configuration value for {}.{}: {}",
                          current_section, current_key, e.what());
            yaml_event_delete(&event);
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        spdlog::error("Configuration validation failed:");
        for (const auto& error : config.GetValidationErrors()) {
            spdlog::error("  - {}", error);
        }
        return std::nullopt;
    }

    return config;
}

bool DetectionConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open file for writing: {}", filepath);
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string DetectionConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# Recurring charge detection configuration\n\n";

    ss << "clustering:\n";
    if (clustering.eps) {
        ss << "  eps: " << *clustering.eps << "\n";
    }
    ss << "  min_samples_ratio: " << clustering.min_samples_ratio << "\n";
    ss << "  min_cluster_size: " << clustering.min_cluster_size << "\n";
    ss << "  max_batch_size: " << clustering.max_batch_size << "\n\n";

    ss << "confidence:\n";
    ss << "  interval_weight: " << confidence.interval_weight << "\n";
    ss << "  amount_weight: " << confidence.amount_weight << "\n";
    ss << "  sample_size_weight: " << confidence.sample_size_weight << "\n";
    ss << "  temporal_weight: " << confidence.temporal_weight << "\n";
    ss << "  saturation_count: " << confidence.saturation_count << "\n";
    ss << "  min_confidence: " << confidence.min_confidence << "\n\n";

    ss << "frequency:\n";
    for (const auto& window : frequency.windows) {
        ss << "  " << ToLower(ToString(window.frequency)) << ": ["
           << window.min_days << ", " << window.max_days << "]\n";
    }
    ss << "\n";

    ss << "temporal:\n";
    ss << "  consistency_threshold: " << temporal.consistency_threshold << "\n";
    ss << "  weekday_threshold: " << temporal.weekday_threshold << "\n";
    ss << "  day_threshold: " << temporal.day_threshold << "\n";
    ss << "  min_weekday_samples: " << temporal.min_weekday_samples << "\n";
    ss << "  holiday_calendar: \"" << temporal.holiday_calendar << "\"\n\n";

    ss << "detection:\n";
    ss << "  min_occurrences: " << detection.min_occurrences << "\n";
    ss << "  use_account_features: " << (detection.use_account_features ? "true" : "false") << "\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n";

    return ss.str();
}

bool DetectionConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> DetectionConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Clustering
    if (!clustering.eps) {
        errors.push_back("clustering.eps is required");
    } else if (!(*clustering.eps > 0.0)) {
        errors.push_back("clustering.eps must be greater than 0");
    }
    if (clustering.min_samples_ratio < 0.0 || clustering.min_samples_ratio > 1.0) {
        errors.push_back("clustering.min_samples_ratio must be between 0.0 and 1.0");
    }
    if (clustering.min_cluster_size == 0) {
        errors.push_back("clustering.min_cluster_size must be greater than 0");
    }
    if (clustering.max_batch_size == 0) {
        errors.push_back("clustering.max_batch_size must be greater than 0");
    }

    // Confidence
    ConfidenceWeights weights{confidence.interval_weight, confidence.amount_weight,
                              confidence.sample_size_weight, confidence.temporal_weight};
    if (!weights.IsValid()) {
        errors.push_back("confidence weights must be non-negative and sum to 1.0");
    }
    if (confidence.saturation_count == 0) {
        errors.push_back("confidence.saturation_count must be greater than 0");
    }
    if (confidence.min_confidence < 0.0 || confidence.min_confidence > 1.0) {
        errors.push_back("confidence.min_confidence must be between 0.0 and 1.0");
    }

    // Frequency windows
    for (const auto& window : frequency.windows) {
        if (window.min_days < 0.0 || window.max_days <= window.min_days) {
            errors.push_back(std::string("frequency window for ") + ToString(window.frequency) +
                             " must satisfy 0 <= min < max");
        }
    }

    // Temporal thresholds
    auto check_share = [&errors](double value, const char* name) {
        if (value <= 0.0 || value > 1.0) {
            errors.push_back(std::string("temporal.") + name + " must be in (0.0, 1.0]");
        }
    };
    check_share(temporal.consistency_threshold, "consistency_threshold");
    check_share(temporal.weekday_threshold, "weekday_threshold");
    check_share(temporal.day_threshold, "day_threshold");
    if (temporal.holiday_calendar != "US" && temporal.holiday_calendar != "NONE") {
        errors.push_back("temporal.holiday_calendar must be one of: US, NONE");
    }

    // Detection
    if (detection.min_occurrences == 0) {
        errors.push_back("detection.min_occurrences must be greater than 0");
    }

    // Logging
    if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off") {
        errors.push_back("logging.level must be one of: trace, debug, info, warn, error, critical, off");
    }

    return errors;
}

DetectionConfig DetectionConfig::Default() {
    return DetectionConfig{};  // Uses default member initializers
}

DetectionService::Config DetectionConfig::ToDetectionServiceConfig() const {
    std::vector<std::string> errors = GetValidationErrors();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid detection configuration: " + errors.front());
    }

    DetectionService::Config config;
    config.eps = *clustering.eps;
    config.min_samples_ratio = clustering.min_samples_ratio;
    config.min_cluster_size = clustering.min_cluster_size;
    config.max_batch_size = clustering.max_batch_size;

    config.min_occurrences = detection.min_occurrences;
    config.use_account_features = detection.use_account_features;

    config.min_confidence = confidence.min_confidence;
    config.confidence.weights = ConfidenceWeights{confidence.interval_weight,
                                                  confidence.amount_weight,
                                                  confidence.sample_size_weight,
                                                  confidence.temporal_weight};
    config.confidence.saturation_count = confidence.saturation_count;

    config.frequency.windows = frequency.windows;

    config.temporal.consistency_threshold = temporal.consistency_threshold;
    config.temporal.weekday_threshold = temporal.weekday_threshold;
    config.temporal.day_threshold = temporal.day_threshold;
    config.temporal.min_weekday_samples = temporal.min_weekday_samples;
    return config;
}

std::shared_ptr<const HolidayCalendar> DetectionConfig::CreateHolidays() const {
    return CreateHolidayCalendar(temporal.holiday_calendar);
}

void DetectionConfig::ApplyLogging() const {
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

} // namespace recur
