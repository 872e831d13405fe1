#include <gtest/gtest.h>
#include "engine/engine_config.hpp"
#include <cstdio>

using namespace sem;

// ==========================================
// Defaults / Parsing Tests
// ==========================================

TEST(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_DOUBLE_EQ(config.graph.default_threshold, 0.5);
    EXPECT_EQ(config.graph.default_max_edges, 5);
    EXPECT_EQ(config.graph.max_edges_hard_cap, 20);
    EXPECT_EQ(config.clustering.default_num_clusters, 5);
    EXPECT_EQ(config.clustering.seed, 42u);
    EXPECT_EQ(config.similarity.default_limit, 10);
    EXPECT_DOUBLE_EQ(config.trend.stable_band, 0.1);
    EXPECT_DOUBLE_EQ(config.anomaly.significance_floor, 2.0);
    EXPECT_EQ(config.expertise.person_edge_min_level, ExpertiseLevel::INTERMEDIATE);
    EXPECT_FALSE(config.verbose);

    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
}

TEST(EngineConfigTest, FromJsonSections) {
    nlohmann::json j = {
        {"graph", {{"default_threshold", 0.7}, {"default_max_edges", 3}}},
        {"clustering", {{"default_num_clusters", 4}, {"seed", 7}}},
        {"similarity", {{"max_limit", 25}}},
        {"expertise", {{"person_edge_min_level", "advanced"}}},
        {"embedding", {{"model", "custom-embed"}, {"dimension", 384}}},
        {"verbose", true}
    };

    EngineConfig config = EngineConfig::from_json(j);
    EXPECT_DOUBLE_EQ(config.graph.default_threshold, 0.7);
    EXPECT_EQ(config.graph.default_max_edges, 3);
    EXPECT_EQ(config.graph.default_max_documents, 100);
    EXPECT_EQ(config.clustering.default_num_clusters, 4);
    EXPECT_EQ(config.clustering.seed, 7u);
    EXPECT_EQ(config.similarity.max_limit, 25);
    EXPECT_EQ(config.expertise.person_edge_min_level, ExpertiseLevel::ADVANCED);
    EXPECT_EQ(config.embedding.model, "custom-embed");
    EXPECT_EQ(config.embedding.dimension, 384);
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.embedding.verbose);
}

TEST(EngineConfigTest, FlatEmbeddingForm) {
    EngineConfig config = EngineConfig::from_json({{"provider", "openai"}, {"api_key", "sk-flat"}});
    EXPECT_EQ(config.embedding.api_key, "sk-flat");
}

TEST(EngineConfigTest, ApiKeyRedacted) {
    EngineConfig config;
    config.embedding.api_key = "sk-secret";
    auto j = config.to_json();
    EXPECT_EQ(j["embedding"]["api_key"], "***REDACTED***");
    EXPECT_EQ(j.dump().find("sk-secret"), std::string::npos);
}

// ==========================================
// Validation Tests
// ==========================================

TEST(EngineConfigTest, ValidateRejectsOutOfRange) {
    std::string error;

    EngineConfig config;
    config.graph.default_threshold = 1.5;
    EXPECT_FALSE(config.validate(error));
    EXPECT_FALSE(error.empty());

    config = EngineConfig();
    config.graph.max_edges_hard_cap = 21;
    EXPECT_FALSE(config.validate(error));

    config = EngineConfig();
    config.graph.default_max_edges = 0;
    EXPECT_FALSE(config.validate(error));

    config = EngineConfig();
    config.clustering.min_documents = 0;
    EXPECT_FALSE(config.validate(error));

    config = EngineConfig();
    config.similarity.default_min_similarity = -2.0;
    EXPECT_FALSE(config.validate(error));

    config = EngineConfig();
    config.anomaly.significance_floor = 0.0;
    EXPECT_FALSE(config.validate(error));

    config = EngineConfig();
    config.trend.max_days = 0;
    EXPECT_FALSE(config.validate(error));
    config.trend.max_days = 36501;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("max_days"), std::string::npos);

    config = EngineConfig();
    config.anomaly.min_temporal_std_days = 0.0;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("minimum spreads"), std::string::npos);
}

TEST(EngineConfigTest, AnomalySpreadFloorsFromJson) {
    nlohmann::json j = {
        {"trend", {{"max_days", 365}}},
        {"anomaly", {{"min_style_std", 0.25}, {"min_temporal_std_days", 7.0}}}
    };

    EngineConfig config = EngineConfig::from_json(j);
    EXPECT_EQ(config.trend.max_days, 365);
    EXPECT_DOUBLE_EQ(config.anomaly.min_style_std, 0.25);
    EXPECT_DOUBLE_EQ(config.anomaly.min_temporal_std_days, 7.0);
    EXPECT_DOUBLE_EQ(config.anomaly.min_distance_std, 0.01);

    auto out = config.to_json();
    EXPECT_EQ(out["trend"]["max_days"], 365);
    EXPECT_DOUBLE_EQ(out["anomaly"]["min_temporal_std_days"].get<double>(), 7.0);
    EXPECT_TRUE(out["anomaly"].contains("min_topic_std"));
}

// ==========================================
// File Tests
// ==========================================

TEST(EngineConfigTest, FileRoundTrip) {
    const std::string path = "test_engine_config.json";
    EngineConfig config;
    config.graph.default_max_edges = 7;
    config.trend.max_trending = 3;
    config.to_json_file(path);

    EngineConfig loaded = EngineConfig::from_json_file(path);
    EXPECT_EQ(loaded.graph.default_max_edges, 7);
    EXPECT_EQ(loaded.trend.max_trending, 3);

    EngineConfig fallback = load_config_with_fallback(path);
    EXPECT_EQ(fallback.graph.default_max_edges, 7);
    std::remove(path.c_str());

    EXPECT_THROW(EngineConfig::from_json_file("does/not/exist.json"), std::runtime_error);
}
