#pragma once

#include "provider/corpus.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sem {

enum class AnomalyType {
    CONTENT_OUTLIER,
    LENGTH_ANOMALY,
    TOPIC_MISMATCH,
    STYLE_DEVIATION,
    TEMPORAL_ANOMALY
};

inline std::string anomaly_type_to_string(AnomalyType type) {
    switch (type) {
        case AnomalyType::CONTENT_OUTLIER: return "content_outlier";
        case AnomalyType::LENGTH_ANOMALY: return "length_anomaly";
        case AnomalyType::TOPIC_MISMATCH: return "topic_mismatch";
        case AnomalyType::STYLE_DEVIATION: return "style_deviation";
        case AnomalyType::TEMPORAL_ANOMALY: return "temporal_anomaly";
        default: return "content_outlier";
    }
}

struct AnomalyResult {
    std::string document_id;
    std::string title;
    double anomaly_score = 0.0;          // Largest deviation, in standard deviations
    AnomalyType anomaly_type = AnomalyType::CONTENT_OUTLIER;
    std::string explanation;

    nlohmann::json to_json() const {
        return {
            {"document_id", document_id},
            {"title", title},
            {"anomaly_score", anomaly_score},
            {"anomaly_type", anomaly_type_to_string(anomaly_type)},
            {"explanation", explanation}
        };
    }
};

/**
 * @brief Detection thresholds
 *
 * Each min_*_std bounds the spread a feature's baseline may have from below,
 * in that feature's own unit, so differences smaller than it never count
 * as deviations.
 */
struct AnomalyConfig {
    double significance_floor = 2.0;     // Deviation must be strictly above this
    double min_length_std = 1.0;         // Characters
    double min_distance_std = 0.01;      // Cosine distance from the corpus centroid
    double min_topic_std = 0.01;         // Mean cosine similarity to topic centroids
    double min_style_std = 0.5;          // Characters per word
    double min_temporal_std_days = 1.0;  // Creation time, in days
};

/**
 * @brief Population mean and standard deviation of one feature
 */
struct FeatureBaseline {
    double mean = 0.0;
    double std_dev = 0.0;
    size_t samples = 0;

    static FeatureBaseline from_values(const std::vector<double>& values);

    double z_score(double value, double std_floor) const;
};

/**
 * @brief Scores documents against corpus baselines
 *
 * Features, each turned into a z-score against the documents that have it:
 * - content length (both directions) -> LengthAnomaly
 * - cosine distance from the corpus centroid (only farther than usual) -> ContentOutlier
 * - mean similarity to the centroids of the document's topics (only lower
 *   than usual) -> TopicMismatch
 * - characters per word (both directions) -> StyleDeviation
 * - creation time (both directions) -> TemporalAnomaly
 *
 * A document is reported with the type of its largest deviation when that
 * deviation is strictly above the significance floor; otherwise it yields
 * nothing. A feature needs at least two samples to have a baseline.
 */
class AnomalyDetector {
public:
    AnomalyDetector() = default;
    explicit AnomalyDetector(const AnomalyConfig& config) : config_(config) {}

    /**
     * @brief Detect anomalies, highest score first
     * @param category_id Restrict the corpus (and its baselines) to one category
     */
    std::vector<AnomalyResult> detect(const CorpusSnapshot& corpus,
                                      std::optional<int> category_id = std::nullopt) const;

private:
    AnomalyConfig config_;
};

} // namespace sem
