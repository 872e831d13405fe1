#pragma once

#include "analytics/anomaly_detector.hpp"
#include "analytics/trend_analyzer.hpp"
#include "cluster/cluster_engine.hpp"
#include "expertise/expertise_aggregator.hpp"
#include "provider/embedding_provider.hpp"
#include <cstdint>
#include <string>

namespace sem {

// ============================================================================
// Engine Configuration
// ============================================================================

struct GraphSettings {
    double default_threshold = 0.5;         ///< Similarity edge threshold
    int default_max_edges = 5;              ///< Similarity edges per document
    int max_edges_hard_cap = 20;            ///< Upper bound accepted for max_edges
    int default_max_documents = 100;        ///< Documents per build
};

struct ClusteringSettings {
    int default_num_clusters = 5;           ///< k when the request leaves it out
    int max_iterations = 100;               ///< k-means iteration bound
    int min_documents = 3;                  ///< Fewer is a validation error
    uint32_t seed = 42;                     ///< k-means++ seed
    size_t keywords_per_cluster = 5;

    ClusterEngineConfig engine_config() const {
        ClusterEngineConfig c;
        c.max_iterations = max_iterations;
        c.min_documents = min_documents;
        c.seed = seed;
        c.keywords_per_cluster = keywords_per_cluster;
        return c;
    }
};

struct SimilaritySettings {
    int default_limit = 10;
    int max_limit = 50;                     ///< Requested limits are clamped to [1, max_limit]
    double default_min_similarity = 0.5;
};

/**
 * @brief Configuration for the analytics engine and CLI
 *
 * JSON layout mirrors the struct: one object per section
 * ("graph", "clustering", "similarity", "expertise", "trend", "anomaly",
 * "embedding") plus a top-level "verbose" flag. Missing keys keep defaults.
 */
struct EngineConfig {
    GraphSettings graph;
    ClusteringSettings clustering;
    SimilaritySettings similarity;
    ExpertiseConfig expertise;
    TrendConfig trend;
    AnomalyConfig anomaly;
    EmbeddingConfig embedding;
    bool verbose = false;                   ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     */
    static EngineConfig from_json_file(const std::string& path);

    static EngineConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    /**
     * @brief Save configuration to JSON file (API key redacted)
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Load config from a file, falling back to .semantica.json in the
 * working directory or its parent, then to the environment
 */
EngineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace sem
