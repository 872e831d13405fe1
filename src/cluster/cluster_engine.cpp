#include "cluster/cluster_engine.hpp"
#include "math/vector_math.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <random>
#include <set>

namespace sem {

ClusteringAlgorithm string_to_clustering_algorithm(const std::string& s) {
    std::string name = to_lower_copy(trim_copy(s));
    if (name == "kmeans" || name == "k-means" || name == "k_means") return ClusteringAlgorithm::KMEANS;
    if (name == "dbscan") return ClusteringAlgorithm::DBSCAN;
    if (name == "hierarchical" || name == "agglomerative") return ClusteringAlgorithm::HIERARCHICAL;
    if (name == "spectral") return ClusteringAlgorithm::SPECTRAL;
    throw ValidationError("Unknown clustering algorithm: " + s);
}

// ==========================================
// Serialization
// ==========================================

nlohmann::json Cluster::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["size"] = member_document_ids.size();
    j["member_document_ids"] = member_document_ids;
    j["keywords"] = keywords;
    j["centroid"] = centroid;
    return j;
}

nlohmann::json ClusteringResult::to_json() const {
    nlohmann::json j;
    j["algorithm"] = clustering_algorithm_to_string(algorithm);
    j["iterations"] = iterations;
    j["metrics"] = metrics.to_json();

    j["clusters"] = nlohmann::json::array();
    for (const auto& c : clusters) {
        j["clusters"].push_back(c.to_json());
    }

    j["assignments"] = nlohmann::json::array();
    for (const auto& a : assignments) {
        j["assignments"].push_back(a.to_json());
    }
    return j;
}

// ==========================================
// ClusterEngine
// ==========================================

ClusteringResult ClusterEngine::run(const std::vector<ClusterInput>& documents,
                                    int k,
                                    ClusteringAlgorithm algorithm) const {
    const int n = static_cast<int>(documents.size());

    if (n < config_.min_documents) {
        throw ValidationError("insufficient documents to cluster: need at least " +
                              std::to_string(config_.min_documents) + ", got " + std::to_string(n));
    }
    if (k <= 0 || k > n) {
        throw ValidationError("num_clusters must be between 1 and the document count (" +
                              std::to_string(n) + "), got " + std::to_string(k));
    }
    if (algorithm != ClusteringAlgorithm::KMEANS) {
        throw ValidationError("clustering algorithm '" + clustering_algorithm_to_string(algorithm) +
                              "' is not implemented");
    }

    const size_t dim = documents.front().vector.size();
    if (dim == 0) {
        throw ValidationError("Embedding for document '" + documents.front().document_id + "' is empty");
    }
    for (const auto& doc : documents) {
        if (doc.vector.size() != dim) {
            throw DimensionMismatchError(dim, doc.vector.size());
        }
    }

    return run_kmeans(documents, k);
}

std::vector<std::vector<float>> ClusterEngine::seed_centroids(
    const std::vector<std::vector<float>>& vectors, int k) const {

    // k-means++ under cosine distance. Draws use raw mt19937 output so the
    // sequence is identical across standard library implementations.
    std::mt19937 rng(config_.seed);
    const size_t n = vectors.size();
    auto uniform = [&rng]() {
        return static_cast<double>(rng()) / (static_cast<double>(std::mt19937::max()) + 1.0);
    };

    std::vector<size_t> chosen;
    std::vector<bool> taken(n, false);

    size_t first = static_cast<size_t>(uniform() * static_cast<double>(n));
    chosen.push_back(std::min(first, n - 1));
    taken[chosen.back()] = true;

    std::vector<double> closest(n, std::numeric_limits<double>::max());

    while (static_cast<int>(chosen.size()) < k) {
        const auto& last = vectors[chosen.back()];
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double d = vector_math::cosine_distance(vectors[i], last);
            closest[i] = std::min(closest[i], d * d);
            if (!taken[i]) total += closest[i];
        }

        size_t pick = n;
        if (total > 0.0) {
            double target = uniform() * total;
            double acc = 0.0;
            for (size_t i = 0; i < n; ++i) {
                if (taken[i]) continue;
                acc += closest[i];
                pick = i;
                if (acc > target) break;
            }
        } else {
            // Every remaining point coincides with a centre; take the first free one
            for (size_t i = 0; i < n; ++i) {
                if (!taken[i]) { pick = i; break; }
            }
        }

        if (pick == n) {
            throw InternalError("k-means seeding ran out of candidate points");
        }
        chosen.push_back(pick);
        taken[pick] = true;
    }

    std::vector<std::vector<float>> centroids;
    centroids.reserve(chosen.size());
    for (size_t idx : chosen) {
        centroids.push_back(vectors[idx]);
    }
    return centroids;
}

ClusteringResult ClusterEngine::run_kmeans(std::vector<ClusterInput> documents, int k) const {
    std::sort(documents.begin(), documents.end(),
              [](const ClusterInput& a, const ClusterInput& b) { return a.document_id < b.document_id; });

    const size_t n = documents.size();
    std::vector<std::vector<float>> vectors;
    vectors.reserve(n);
    for (const auto& doc : documents) {
        vectors.push_back(doc.vector);
    }

    report("seeding", 0, config_.max_iterations);
    std::vector<std::vector<float>> centroids = seed_centroids(vectors, k);
    std::vector<int> labels(n, -1);

    auto members_of = [&labels, n](int cluster) {
        std::vector<size_t> members;
        for (size_t i = 0; i < n; ++i) {
            if (labels[i] == cluster) members.push_back(i);
        }
        return members;
    };

    int iterations = 0;
    for (int iter = 1; iter <= config_.max_iterations; ++iter) {
        iterations = iter;
        bool changed = false;

        // Assignment step: highest cosine similarity wins, lowest id on ties
        for (size_t i = 0; i < n; ++i) {
            int best = 0;
            double best_sim = -std::numeric_limits<double>::max();
            for (int c = 0; c < k; ++c) {
                double sim = vector_math::cosine_similarity(vectors[i], centroids[c]);
                if (sim > best_sim) {
                    best_sim = sim;
                    best = c;
                }
            }
            if (labels[i] != best) {
                labels[i] = best;
                changed = true;
            }
        }

        // Refill empty clusters with the point farthest from its own centroid
        std::vector<size_t> sizes(k, 0);
        for (int label : labels) sizes[label]++;

        for (int c = 0; c < k; ++c) {
            if (sizes[c] > 0) continue;

            size_t worst = n;
            double worst_sim = std::numeric_limits<double>::max();
            for (size_t i = 0; i < n; ++i) {
                if (sizes[labels[i]] < 2) continue;
                double sim = vector_math::cosine_similarity(vectors[i], centroids[labels[i]]);
                if (sim < worst_sim) {
                    worst_sim = sim;
                    worst = i;
                }
            }
            if (worst == n) {
                throw InternalError("k-means produced an empty cluster that could not be refilled");
            }

            sizes[labels[worst]]--;
            labels[worst] = c;
            sizes[c] = 1;
            changed = true;
        }

        // Update step
        for (int c = 0; c < k; ++c) {
            centroids[c] = vector_math::centroid(vectors, members_of(c));
        }

        report("kmeans", iter, config_.max_iterations);

        if (!changed) break;
    }

    ClusteringResult result;
    result.algorithm = ClusteringAlgorithm::KMEANS;
    result.iterations = iterations;

    double inertia = 0.0;
    result.assignments.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const auto& centre = centroids[labels[i]];
        inertia += vector_math::squared_distance(vectors[i], centre);

        ClusterAssignment a;
        a.document_id = documents[i].document_id;
        a.cluster_id = labels[i];
        a.similarity = vector_math::cosine_similarity(vectors[i], centre);
        result.assignments.push_back(a);
    }

    for (int c = 0; c < k; ++c) {
        auto members = members_of(c);

        Cluster cluster;
        cluster.id = c;
        cluster.centroid = centroids[c];
        for (size_t idx : members) {
            cluster.member_document_ids.push_back(documents[idx].document_id);
        }
        cluster.keywords = top_keywords(documents, members);

        cluster.name = "Cluster " + std::to_string(c + 1);
        for (size_t i = 0; i < cluster.keywords.size() && i < 2; ++i) {
            cluster.name += (i == 0 ? ": " : ", ") + cluster.keywords[i];
        }
        result.clusters.push_back(std::move(cluster));
    }

    result.metrics.inertia = inertia;
    result.metrics.silhouette_score = silhouette_score(vectors, labels, k);
    result.metrics.num_clusters = k;
    result.metrics.total_documents = static_cast<int>(n);

    report("kmeans", config_.max_iterations, config_.max_iterations);
    return result;
}

std::vector<std::string> ClusterEngine::top_keywords(const std::vector<ClusterInput>& documents,
                                                     const std::vector<size_t>& members) const {
    std::map<std::string, int> counts;
    for (size_t idx : members) {
        // Count each label once per document
        std::set<std::string> seen;
        for (const auto& label : documents[idx].labels) {
            std::string kw = to_lower_copy(trim_copy(label));
            if (kw.empty() || !seen.insert(kw).second) continue;
            counts[kw]++;
        }
    }

    std::vector<std::pair<std::string, int>> ranked(counts.begin(), counts.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    std::vector<std::string> keywords;
    for (const auto& [kw, count] : ranked) {
        if (keywords.size() >= config_.keywords_per_cluster) break;
        keywords.push_back(kw);
    }
    return keywords;
}

// ==========================================
// Silhouette
// ==========================================

double silhouette_score(const std::vector<std::vector<float>>& vectors,
                        const std::vector<int>& labels,
                        int k) {
    const size_t n = vectors.size();
    if (n != labels.size()) {
        throw InternalError("silhouette_score: label count does not match vector count");
    }

    std::vector<size_t> sizes(std::max(k, 0), 0);
    for (int label : labels) {
        if (label < 0 || label >= k) {
            throw InternalError("silhouette_score: label out of range");
        }
        sizes[label]++;
    }

    int non_empty = 0;
    for (size_t s : sizes) {
        if (s > 0) non_empty++;
    }
    if (non_empty < 2) {
        return 0.0;
    }

    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (sizes[labels[i]] < 2) {
            continue;  // singleton contributes 0
        }

        std::vector<double> dist_sum(k, 0.0);
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            dist_sum[labels[j]] += vector_math::cosine_distance(vectors[i], vectors[j]);
        }

        double a = dist_sum[labels[i]] / static_cast<double>(sizes[labels[i]] - 1);
        double b = std::numeric_limits<double>::max();
        for (int c = 0; c < k; ++c) {
            if (c == labels[i] || sizes[c] == 0) continue;
            b = std::min(b, dist_sum[c] / static_cast<double>(sizes[c]));
        }

        double denom = std::max(a, b);
        if (denom > 0.0) {
            total += (b - a) / denom;
        }
    }

    return total / static_cast<double>(n);
}

} // namespace sem
