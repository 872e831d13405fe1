#include "analytics/anomaly_detector.hpp"
#include "math/vector_math.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace sem {

FeatureBaseline FeatureBaseline::from_values(const std::vector<double>& values) {
    FeatureBaseline b;
    b.samples = values.size();
    if (values.empty()) {
        return b;
    }

    double sum = 0.0;
    for (double v : values) sum += v;
    b.mean = sum / values.size();

    double sq = 0.0;
    for (double v : values) sq += (v - b.mean) * (v - b.mean);
    b.std_dev = std::sqrt(sq / values.size());
    return b;
}

double FeatureBaseline::z_score(double value, double std_floor) const {
    return (value - mean) / std::max(std_dev, std_floor);
}

namespace {

// Which side of the mean counts as anomalous
enum class Direction {
    BOTH,
    HIGH,
    LOW
};

struct Feature {
    AnomalyType type;
    Direction direction;
    double std_floor;
    std::map<std::string, double> values;    // document id -> value
    FeatureBaseline baseline;
};

std::string fmt(double value, int precision = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string explain(const Feature& feature, double value, double deviation) {
    const auto& b = feature.baseline;
    std::string sigmas = fmt(deviation, 1) + " standard deviations";

    switch (feature.type) {
        case AnomalyType::LENGTH_ANOMALY:
            return "Content length of " + fmt(value, 0) + " characters is " + sigmas +
                   " from the corpus mean of " + fmt(b.mean, 1);
        case AnomalyType::CONTENT_OUTLIER:
            return "Embedding is far from the corpus centroid (cosine distance " + fmt(value, 3) +
                   " vs mean " + fmt(b.mean, 3) + ", " + sigmas + ")";
        case AnomalyType::TOPIC_MISMATCH:
            return "Content is weakly aligned with its assigned topics (similarity " + fmt(value, 3) +
                   " vs mean " + fmt(b.mean, 3) + ", " + sigmas + ")";
        case AnomalyType::STYLE_DEVIATION:
            return "Average word length of " + fmt(value) + " characters is " + sigmas +
                   " from the corpus mean of " + fmt(b.mean);
        case AnomalyType::TEMPORAL_ANOMALY:
            return "Creation time is " + sigmas + " from the corpus mean creation time";
        default:
            return sigmas + " from the corpus baseline";
    }
}

} // anonymous namespace

std::vector<AnomalyResult> AnomalyDetector::detect(const CorpusSnapshot& corpus,
                                                   std::optional<int> category_id) const {
    auto documents = corpus.documents(category_id);

    // Order of this list decides ties between equal deviations
    std::vector<Feature> features = {
        {AnomalyType::LENGTH_ANOMALY, Direction::BOTH, config_.min_length_std, {}, {}},
        {AnomalyType::CONTENT_OUTLIER, Direction::HIGH, config_.min_distance_std, {}, {}},
        {AnomalyType::TOPIC_MISMATCH, Direction::LOW, config_.min_topic_std, {}, {}},
        {AnomalyType::STYLE_DEVIATION, Direction::BOTH, config_.min_style_std, {}, {}},
        {AnomalyType::TEMPORAL_ANOMALY, Direction::BOTH, config_.min_temporal_std_days, {}, {}},
    };
    Feature& length = features[0];
    Feature& content = features[1];
    Feature& topic = features[2];
    Feature& style = features[3];
    Feature& temporal = features[4];

    std::vector<std::string> embedded_ids;
    std::vector<std::vector<float>> embedded;

    for (const auto* doc : documents) {
        length.values[doc->id] = static_cast<double>(doc->content_length);
        temporal.values[doc->id] = to_epoch_seconds(doc->created_at) / 86400.0;
        if (doc->word_count > 0 && doc->content_length > 0) {
            style.values[doc->id] = static_cast<double>(doc->content_length) / doc->word_count;
        }
        if (const auto* vec = corpus.embedding_for(doc->id)) {
            embedded_ids.push_back(doc->id);
            embedded.push_back(*vec);
        }
    }

    if (embedded.size() >= 2) {
        auto corpus_centroid = vector_math::centroid(embedded);
        for (size_t i = 0; i < embedded.size(); ++i) {
            content.values[embedded_ids[i]] = vector_math::cosine_distance(embedded[i], corpus_centroid);
        }

        // Topic slug -> members among embedded documents
        std::map<std::string, std::vector<size_t>> topic_members;
        std::map<std::string, std::set<std::string>> doc_topics;
        for (size_t i = 0; i < embedded.size(); ++i) {
            const auto* doc = corpus.find(embedded_ids[i]);
            for (const auto& raw : doc->topics) {
                std::string slug = normalize_label(raw);
                if (slug.empty() || !doc_topics[doc->id].insert(slug).second) continue;
                topic_members[slug].push_back(i);
            }
        }

        std::map<std::string, std::vector<float>> topic_centroids;
        for (const auto& [slug, members] : topic_members) {
            topic_centroids[slug] = vector_math::centroid(embedded, members);
        }

        for (size_t i = 0; i < embedded.size(); ++i) {
            auto it = doc_topics.find(embedded_ids[i]);
            if (it == doc_topics.end() || it->second.empty()) continue;

            double sum = 0.0;
            for (const auto& slug : it->second) {
                sum += vector_math::cosine_similarity(embedded[i], topic_centroids[slug]);
            }
            topic.values[embedded_ids[i]] = sum / it->second.size();
        }
    }

    for (auto& feature : features) {
        std::vector<double> values;
        values.reserve(feature.values.size());
        for (const auto& [id, v] : feature.values) values.push_back(v);
        feature.baseline = FeatureBaseline::from_values(values);
    }

    std::vector<AnomalyResult> results;
    for (const auto* doc : documents) {
        const Feature* best = nullptr;
        double best_deviation = 0.0;
        double best_value = 0.0;

        for (const auto& feature : features) {
            if (feature.baseline.samples < 2) continue;
            auto it = feature.values.find(doc->id);
            if (it == feature.values.end()) continue;

            double z = feature.baseline.z_score(it->second, feature.std_floor);
            double deviation = 0.0;
            switch (feature.direction) {
                case Direction::BOTH: deviation = std::fabs(z); break;
                case Direction::HIGH: deviation = z; break;
                case Direction::LOW: deviation = -z; break;
            }

            if (deviation > best_deviation) {
                best = &feature;
                best_deviation = deviation;
                best_value = it->second;
            }
        }

        if (!best || best_deviation <= config_.significance_floor) {
            continue;
        }

        AnomalyResult result;
        result.document_id = doc->id;
        result.title = doc->title;
        result.anomaly_score = best_deviation;
        result.anomaly_type = best->type;
        result.explanation = explain(*best, best_value, best_deviation);
        results.push_back(std::move(result));
    }

    std::sort(results.begin(), results.end(), [](const AnomalyResult& a, const AnomalyResult& b) {
        if (a.anomaly_score != b.anomaly_score) return a.anomaly_score > b.anomaly_score;
        return a.document_id < b.document_id;
    });
    return results;
}

} // namespace sem
