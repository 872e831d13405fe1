#include "engine/engine_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>
#include <vector>

using json = nlohmann::json;

namespace sem {

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    if (j.contains("graph")) {
        const auto& g = j["graph"];
        config.graph.default_threshold = g.value("default_threshold", config.graph.default_threshold);
        config.graph.default_max_edges = g.value("default_max_edges", config.graph.default_max_edges);
        config.graph.max_edges_hard_cap = g.value("max_edges_hard_cap", config.graph.max_edges_hard_cap);
        config.graph.default_max_documents = g.value("default_max_documents", config.graph.default_max_documents);
    }

    if (j.contains("clustering")) {
        const auto& c = j["clustering"];
        config.clustering.default_num_clusters = c.value("default_num_clusters", config.clustering.default_num_clusters);
        config.clustering.max_iterations = c.value("max_iterations", config.clustering.max_iterations);
        config.clustering.min_documents = c.value("min_documents", config.clustering.min_documents);
        config.clustering.seed = c.value("seed", config.clustering.seed);
        config.clustering.keywords_per_cluster = c.value("keywords_per_cluster", config.clustering.keywords_per_cluster);
    }

    if (j.contains("similarity")) {
        const auto& s = j["similarity"];
        config.similarity.default_limit = s.value("default_limit", config.similarity.default_limit);
        config.similarity.max_limit = s.value("max_limit", config.similarity.max_limit);
        config.similarity.default_min_similarity = s.value("default_min_similarity", config.similarity.default_min_similarity);
    }

    if (j.contains("expertise")) {
        const auto& e = j["expertise"];
        config.expertise.max_areas_per_member = e.value("max_areas_per_member", config.expertise.max_areas_per_member);
        config.expertise.top_areas = e.value("top_areas", config.expertise.top_areas);
        if (e.contains("person_edge_min_level")) {
            config.expertise.person_edge_min_level =
                string_to_expertise_level(e["person_edge_min_level"].get<std::string>());
        }
    }

    if (j.contains("trend")) {
        const auto& t = j["trend"];
        config.trend.stable_band = t.value("stable_band", config.trend.stable_band);
        config.trend.max_trending = t.value("max_trending", config.trend.max_trending);
        config.trend.max_days = t.value("max_days", config.trend.max_days);
    }

    if (j.contains("anomaly")) {
        const auto& a = j["anomaly"];
        config.anomaly.significance_floor = a.value("significance_floor", config.anomaly.significance_floor);
        config.anomaly.min_length_std = a.value("min_length_std", config.anomaly.min_length_std);
        config.anomaly.min_distance_std = a.value("min_distance_std", config.anomaly.min_distance_std);
        config.anomaly.min_topic_std = a.value("min_topic_std", config.anomaly.min_topic_std);
        config.anomaly.min_style_std = a.value("min_style_std", config.anomaly.min_style_std);
        config.anomaly.min_temporal_std_days = a.value("min_temporal_std_days", config.anomaly.min_temporal_std_days);
    }

    // Embedding section - also accept the short flat form (provider, api_key, model)
    const json& em = j.contains("embedding") ? j["embedding"] : j;
    config.embedding.provider = em.value("provider", config.embedding.provider);
    config.embedding.api_key = em.value("api_key", config.embedding.api_key);
    config.embedding.model = em.value("model", config.embedding.model);
    config.embedding.api_base_url = em.value("api_base_url", config.embedding.api_base_url);
    config.embedding.dimension = em.value("dimension", config.embedding.dimension);
    config.embedding.timeout_seconds = em.value("timeout_seconds", config.embedding.timeout_seconds);
    config.embedding.max_retries = em.value("max_retries", config.embedding.max_retries);

    config.verbose = j.value("verbose", config.verbose);
    config.embedding.verbose = config.verbose;

    return config;
}

json EngineConfig::to_json() const {
    json j;

    j["graph"] = {
        {"default_threshold", graph.default_threshold},
        {"default_max_edges", graph.default_max_edges},
        {"max_edges_hard_cap", graph.max_edges_hard_cap},
        {"default_max_documents", graph.default_max_documents}
    };

    j["clustering"] = {
        {"default_num_clusters", clustering.default_num_clusters},
        {"max_iterations", clustering.max_iterations},
        {"min_documents", clustering.min_documents},
        {"seed", clustering.seed},
        {"keywords_per_cluster", clustering.keywords_per_cluster}
    };

    j["similarity"] = {
        {"default_limit", similarity.default_limit},
        {"max_limit", similarity.max_limit},
        {"default_min_similarity", similarity.default_min_similarity}
    };

    j["expertise"] = {
        {"max_areas_per_member", expertise.max_areas_per_member},
        {"top_areas", expertise.top_areas},
        {"person_edge_min_level", expertise_level_to_string(expertise.person_edge_min_level)}
    };

    j["trend"] = {
        {"stable_band", trend.stable_band},
        {"max_trending", trend.max_trending},
        {"max_days", trend.max_days}
    };

    j["anomaly"] = {
        {"significance_floor", anomaly.significance_floor},
        {"min_length_std", anomaly.min_length_std},
        {"min_distance_std", anomaly.min_distance_std},
        {"min_topic_std", anomaly.min_topic_std},
        {"min_style_std", anomaly.min_style_std},
        {"min_temporal_std_days", anomaly.min_temporal_std_days}
    };

    j["embedding"] = {
        {"provider", embedding.provider},
        {"api_key", embedding.api_key.empty() ? "" : "***REDACTED***"},
        {"model", embedding.model},
        {"api_base_url", embedding.api_base_url},
        {"dimension", embedding.dimension},
        {"timeout_seconds", embedding.timeout_seconds},
        {"max_retries", embedding.max_retries}
    };

    j["verbose"] = verbose;
    return j;
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    const char* provider = std::getenv("SEM_EMBEDDING_PROVIDER");
    if (provider) config.embedding.provider = provider;

    const char* api_key = std::getenv("SEM_EMBEDDING_API_KEY");
    if (!api_key) api_key = std::getenv("OPENAI_API_KEY");
    if (api_key) config.embedding.api_key = api_key;

    const char* model = std::getenv("SEM_EMBEDDING_MODEL");
    if (model) config.embedding.model = model;

    const char* base_url = std::getenv("SEM_EMBEDDING_BASE_URL");
    if (base_url) config.embedding.api_base_url = base_url;

    const char* verbose = std::getenv("SEM_VERBOSE");
    if (verbose) {
        std::string v = verbose;
        config.verbose = (v == "1" || v == "true" || v == "yes");
        config.embedding.verbose = config.verbose;
    }

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (graph.default_threshold < 0.0 || graph.default_threshold > 1.0) {
        error_message = "Graph threshold must be between 0.0 and 1.0";
        return false;
    }

    if (graph.max_edges_hard_cap < 1 || graph.max_edges_hard_cap > 20) {
        error_message = "max_edges_hard_cap must be between 1 and 20";
        return false;
    }

    if (graph.default_max_edges <= 0 || graph.default_max_edges > graph.max_edges_hard_cap) {
        error_message = "default_max_edges must be within (0, max_edges_hard_cap]";
        return false;
    }

    if (graph.default_max_documents < 1) {
        error_message = "default_max_documents must be at least 1";
        return false;
    }

    if (clustering.min_documents < 1) {
        error_message = "Clustering min_documents must be at least 1";
        return false;
    }

    if (clustering.max_iterations < 1) {
        error_message = "Clustering max_iterations must be at least 1";
        return false;
    }

    if (clustering.default_num_clusters < 1) {
        error_message = "default_num_clusters must be at least 1";
        return false;
    }

    if (similarity.max_limit < 1 || similarity.default_limit < 1) {
        error_message = "Similarity limits must be at least 1";
        return false;
    }

    if (similarity.default_min_similarity < -1.0 || similarity.default_min_similarity > 1.0) {
        error_message = "Similarity min_similarity must be between -1.0 and 1.0";
        return false;
    }

    if (trend.max_days < 1 || trend.max_days > 36500) {
        error_message = "Trend max_days must be between 1 and 36500";
        return false;
    }

    if (trend.stable_band < 0.0) {
        error_message = "Trend stable_band must not be negative";
        return false;
    }

    if (anomaly.significance_floor <= 0.0) {
        error_message = "Anomaly significance_floor must be positive";
        return false;
    }

    if (anomaly.min_length_std <= 0.0 || anomaly.min_distance_std <= 0.0 || anomaly.min_topic_std <= 0.0 ||
        anomaly.min_style_std <= 0.0 || anomaly.min_temporal_std_days <= 0.0) {
        error_message = "Anomaly minimum spreads must be positive";
        return false;
    }

    return true;
}

// ============================================================================
// Utility Functions
// ============================================================================

EngineConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }
    paths_to_try.push_back(".semantica.json");
    paths_to_try.push_back("../.semantica.json");

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            if (path == config_path) {
                std::cerr << "Warning: config file not found: " << path << "\n";
            }
            continue;
        }
        try {
            return EngineConfig::from_json_file(path);
        } catch (const std::exception& e) {
            std::cerr << "Warning: ignoring config file " << path << ": " << e.what() << "\n";
        }
    }

    // Fallback to environment
    return EngineConfig::from_environment();
}

} // namespace sem
