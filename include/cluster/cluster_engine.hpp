#pragma once

#include "core/document.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sem {

// Clustering algorithm tags
enum class ClusteringAlgorithm {
    KMEANS,
    DBSCAN,
    HIERARCHICAL,
    SPECTRAL
};

inline std::string clustering_algorithm_to_string(ClusteringAlgorithm algo) {
    switch (algo) {
        case ClusteringAlgorithm::KMEANS: return "kmeans";
        case ClusteringAlgorithm::DBSCAN: return "dbscan";
        case ClusteringAlgorithm::HIERARCHICAL: return "hierarchical";
        case ClusteringAlgorithm::SPECTRAL: return "spectral";
        default: return "kmeans";
    }
}

/**
 * @brief Parse an algorithm name ("kmeans", "k-means", "dbscan", ...)
 * @throws ValidationError for unknown names
 */
ClusteringAlgorithm string_to_clustering_algorithm(const std::string& s);

// Progress callback
using ClusterProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

struct ClusterEngineConfig {
    int max_iterations = 100;
    int min_documents = 3;               // Fewer documents is a validation error
    uint32_t seed = 42;                  // k-means++ seeding
    size_t keywords_per_cluster = 5;
};

/**
 * @brief Input row for clustering: a document id, its embedding and the
 * labels used to name the cluster it lands in
 */
struct ClusterInput {
    std::string document_id;
    std::vector<float> vector;
    std::vector<std::string> labels;     // Topics + technologies
};

struct Cluster {
    int id = 0;
    std::string name;                    // "Cluster 1: rust, tokio"
    std::vector<float> centroid;
    std::vector<std::string> member_document_ids;  // Sorted
    std::vector<std::string> keywords;

    nlohmann::json to_json() const;
};

struct ClusterAssignment {
    std::string document_id;
    int cluster_id = 0;
    double similarity = 0.0;             // Cosine to assigned centroid

    nlohmann::json to_json() const {
        return {{"document_id", document_id}, {"cluster_id", cluster_id}, {"similarity", similarity}};
    }
};

struct ClusteringMetrics {
    double silhouette_score = 0.0;
    double inertia = 0.0;
    int num_clusters = 0;
    int total_documents = 0;

    nlohmann::json to_json() const {
        return {
            {"silhouette_score", silhouette_score},
            {"inertia", inertia},
            {"num_clusters", num_clusters},
            {"total_documents", total_documents}
        };
    }
};

struct ClusteringResult {
    ClusteringAlgorithm algorithm = ClusteringAlgorithm::KMEANS;
    std::vector<Cluster> clusters;
    std::vector<ClusterAssignment> assignments;   // Ordered by document id
    ClusteringMetrics metrics;
    int iterations = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Partitions a document set into k groups
 *
 * Only k-means is implemented. The other algorithm tags are accepted so that
 * they can be stored on a job, but running them raises a ValidationError.
 * Results are deterministic for a given input and seed.
 */
class ClusterEngine {
public:
    ClusterEngine() = default;
    explicit ClusterEngine(const ClusterEngineConfig& config) : config_(config) {}

    void set_config(const ClusterEngineConfig& config) { config_ = config; }
    const ClusterEngineConfig& get_config() const { return config_; }

    void set_progress_callback(ClusterProgressCallback cb) { progress_cb_ = std::move(cb); }

    /**
     * @brief Run clustering
     * @throws ValidationError on bad k, too few documents or an unimplemented algorithm
     * @throws DimensionMismatchError when input vectors differ in length
     */
    ClusteringResult run(const std::vector<ClusterInput>& documents,
                         int k,
                         ClusteringAlgorithm algorithm = ClusteringAlgorithm::KMEANS) const;

private:
    ClusteringResult run_kmeans(std::vector<ClusterInput> documents, int k) const;

    std::vector<std::vector<float>> seed_centroids(const std::vector<std::vector<float>>& vectors,
                                                   int k) const;

    std::vector<std::string> top_keywords(const std::vector<ClusterInput>& documents,
                                          const std::vector<size_t>& members) const;

    void report(const std::string& stage, int current, int total) const {
        if (progress_cb_) progress_cb_(stage, current, total);
    }

    ClusterEngineConfig config_;
    ClusterProgressCallback progress_cb_;
};

/**
 * @brief Mean silhouette coefficient under cosine distance
 *
 * Returns 0.0 when fewer than two non-empty clusters exist. Points in a
 * singleton cluster contribute 0.
 *
 * @param labels Cluster id per vector, in [0, k)
 */
double silhouette_score(const std::vector<std::vector<float>>& vectors,
                        const std::vector<int>& labels,
                        int k);

} // namespace sem
