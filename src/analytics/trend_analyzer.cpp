#include "analytics/trend_analyzer.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace sem {

TrendGranularity granularity_for_window(int days) {
    if (days <= 14) return TrendGranularity::DAY;
    if (days <= 90) return TrendGranularity::WEEK;
    return TrendGranularity::MONTH;
}

int bucket_length_days(TrendGranularity granularity) {
    switch (granularity) {
        case TrendGranularity::DAY: return 1;
        case TrendGranularity::WEEK: return 7;
        case TrendGranularity::MONTH: return 30;
        default: return 1;
    }
}

double growth_rate(const std::vector<long long>& bucket_counts) {
    if (bucket_counts.size() < 2) {
        return 0.0;
    }
    double first = static_cast<double>(bucket_counts.front());
    double last = static_cast<double>(bucket_counts.back());
    return (last - first) / std::max(first, 1.0);
}

TrendDirection classify_growth(double growth, double stable_band) {
    if (std::fabs(growth) <= stable_band) return TrendDirection::STABLE;
    return growth > 0.0 ? TrendDirection::UP : TrendDirection::DOWN;
}

// ==========================================
// Serialization
// ==========================================

nlohmann::json TrendingTopic::to_json() const {
    return {
        {"topic", topic},
        {"count", count},
        {"growth_rate", growth_rate},
        {"trend_direction", trend_direction_to_string(trend_direction)},
        {"bucket_counts", bucket_counts}
    };
}

nlohmann::json TrendingKeyword::to_json() const {
    return {
        {"keyword", keyword},
        {"count", count},
        {"growth_rate", growth_rate},
        {"bucket_counts", bucket_counts}
    };
}

nlohmann::json TrendAnalysis::to_json() const {
    nlohmann::json j;
    j["period_start"] = format_iso8601(period_start);
    j["period_end"] = format_iso8601(period_end);
    j["granularity"] = trend_granularity_to_string(granularity);

    j["trending_topics"] = nlohmann::json::array();
    for (const auto& t : trending_topics) {
        j["trending_topics"].push_back(t.to_json());
    }
    j["trending_keywords"] = nlohmann::json::array();
    for (const auto& k : trending_keywords) {
        j["trending_keywords"].push_back(k.to_json());
    }
    j["document_volume"] = nlohmann::json::array();
    for (const auto& p : document_volume) {
        j["document_volume"].push_back(p.to_json());
    }
    return j;
}

// ==========================================
// TrendAnalyzer
// ==========================================

namespace {

struct LabelSeries {
    std::string label;                   // First spelling seen
    std::vector<long long> buckets;
    long long total = 0;
};

void count_labels(std::map<std::string, LabelSeries>& series,
                  const std::vector<const std::vector<std::string>*>& label_lists,
                  size_t bucket,
                  size_t num_buckets) {
    std::set<std::string> seen;
    for (const auto* labels : label_lists) {
        for (const auto& raw : *labels) {
            std::string label = trim_copy(raw);
            std::string slug = normalize_label(label);
            if (slug.empty() || !seen.insert(slug).second) continue;

            auto it = series.find(slug);
            if (it == series.end()) {
                it = series.emplace(slug, LabelSeries{label, std::vector<long long>(num_buckets, 0), 0}).first;
            }
            it->second.buckets[bucket]++;
            it->second.total++;
        }
    }
}

// Growth descending, then count descending, then name
template <typename T, typename NameMember>
void rank_trending(std::vector<T>& items, size_t limit, NameMember name) {
    std::sort(items.begin(), items.end(), [name](const T& a, const T& b) {
        if (a.growth_rate != b.growth_rate) return a.growth_rate > b.growth_rate;
        if (a.count != b.count) return a.count > b.count;
        return a.*name < b.*name;
    });
    if (items.size() > limit) {
        items.resize(limit);
    }
}

} // anonymous namespace

TrendAnalysis TrendAnalyzer::analyze(const std::vector<const DocumentRecord*>& documents,
                                     int days,
                                     Timestamp now) const {
    if (days < 1) {
        throw ValidationError("days must be at least 1, got " + std::to_string(days));
    }
    if (days > config_.max_days) {
        throw ValidationError("days must be at most " + std::to_string(config_.max_days) +
                              ", got " + std::to_string(days));
    }

    TrendAnalysis analysis;
    analysis.period_end = now;
    analysis.period_start = days_before(now, days);
    analysis.granularity = granularity_for_window(days);

    const int bucket_days = bucket_length_days(analysis.granularity);
    const size_t num_buckets = static_cast<size_t>((days + bucket_days - 1) / bucket_days);
    const auto bucket_span = std::chrono::hours(24 * bucket_days);

    std::vector<long long> volume(num_buckets, 0);
    std::map<std::string, LabelSeries> topics;
    std::map<std::string, LabelSeries> keywords;

    for (const auto* doc : documents) {
        if (doc->created_at < analysis.period_start || doc->created_at > analysis.period_end) {
            continue;
        }

        auto offset = doc->created_at - analysis.period_start;
        size_t bucket = static_cast<size_t>(offset / bucket_span);
        bucket = std::min(bucket, num_buckets - 1);

        volume[bucket]++;
        count_labels(topics, {&doc->topics}, bucket, num_buckets);
        count_labels(keywords, {&doc->tags, &doc->technologies}, bucket, num_buckets);
    }

    for (size_t i = 0; i < num_buckets; ++i) {
        TimeSeriesPoint point;
        point.timestamp = analysis.period_start + bucket_span * static_cast<int>(i);
        point.value = static_cast<double>(volume[i]);
        analysis.document_volume.push_back(point);
    }

    for (const auto& [slug, s] : topics) {
        TrendingTopic topic;
        topic.topic = s.label;
        topic.count = s.total;
        topic.growth_rate = growth_rate(s.buckets);
        topic.trend_direction = classify_growth(topic.growth_rate, config_.stable_band);
        topic.bucket_counts = s.buckets;
        analysis.trending_topics.push_back(std::move(topic));
    }

    for (const auto& [slug, s] : keywords) {
        TrendingKeyword keyword;
        keyword.keyword = s.label;
        keyword.count = s.total;
        keyword.growth_rate = growth_rate(s.buckets);
        keyword.bucket_counts = s.buckets;
        analysis.trending_keywords.push_back(std::move(keyword));
    }

    rank_trending(analysis.trending_topics, config_.max_trending, &TrendingTopic::topic);
    rank_trending(analysis.trending_keywords, config_.max_trending, &TrendingKeyword::keyword);

    return analysis;
}

} // namespace sem
