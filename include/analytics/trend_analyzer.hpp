#pragma once

#include "core/document.hpp"
#include "core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sem {

enum class TrendDirection {
    UP,
    DOWN,
    STABLE
};

inline std::string trend_direction_to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::UP: return "up";
        case TrendDirection::DOWN: return "down";
        case TrendDirection::STABLE: return "stable";
        default: return "stable";
    }
}

enum class TrendGranularity {
    DAY,
    WEEK,
    MONTH      // Fixed 30-day buckets
};

inline std::string trend_granularity_to_string(TrendGranularity granularity) {
    switch (granularity) {
        case TrendGranularity::DAY: return "day";
        case TrendGranularity::WEEK: return "week";
        case TrendGranularity::MONTH: return "month";
        default: return "day";
    }
}

/**
 * @brief Bucket size implied by a window: <=14 days by day, <=90 by week,
 * anything longer by 30-day month
 */
TrendGranularity granularity_for_window(int days);

int bucket_length_days(TrendGranularity granularity);

/**
 * @brief (last - first) / max(first, 1); 0 for fewer than two buckets
 */
double growth_rate(const std::vector<long long>& bucket_counts);

/**
 * @brief Stable when |growth| <= stable_band, otherwise Up or Down
 */
TrendDirection classify_growth(double growth, double stable_band);

struct TrendingTopic {
    std::string topic;
    long long count = 0;
    double growth_rate = 0.0;
    TrendDirection trend_direction = TrendDirection::STABLE;
    std::vector<long long> bucket_counts;

    nlohmann::json to_json() const;
};

struct TrendingKeyword {
    std::string keyword;
    long long count = 0;
    double growth_rate = 0.0;
    std::vector<long long> bucket_counts;

    nlohmann::json to_json() const;
};

struct TimeSeriesPoint {
    Timestamp timestamp{};     // Bucket start
    double value = 0.0;

    nlohmann::json to_json() const {
        return {{"timestamp", format_iso8601(timestamp)}, {"value", value}};
    }
};

struct TrendAnalysis {
    Timestamp period_start{};
    Timestamp period_end{};
    TrendGranularity granularity = TrendGranularity::DAY;
    std::vector<TrendingTopic> trending_topics;
    std::vector<TrendingKeyword> trending_keywords;
    std::vector<TimeSeriesPoint> document_volume;

    nlohmann::json to_json() const;
};

struct TrendConfig {
    double stable_band = 0.1;
    size_t max_trending = 20;
    int max_days = 3650;       // Longest window a request may ask for
};

/**
 * @brief Buckets document creation times over a trailing window and ranks
 * topics and keywords by growth
 *
 * The window is [now - days, now]; buckets start at the window start and the
 * last one is cut off at now. Each label counts once per document. Keywords
 * are tags together with technologies.
 */
class TrendAnalyzer {
public:
    TrendAnalyzer() = default;
    explicit TrendAnalyzer(const TrendConfig& config) : config_(config) {}

    /**
     * @throws ValidationError if days is outside [1, max_days]
     */
    TrendAnalysis analyze(const std::vector<const DocumentRecord*>& documents,
                          int days,
                          Timestamp now) const;

private:
    TrendConfig config_;
};

} // namespace sem
