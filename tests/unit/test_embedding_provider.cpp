#include <gtest/gtest.h>
#include "provider/embedding_provider.hpp"
#include "core/errors.hpp"

using namespace sem;

// ==========================================
// Response Parsing Tests
// ==========================================

TEST(EmbeddingResponseTest, OrderedByIndex) {
    std::string body = R"({
        "object": "list",
        "data": [
            {"object": "embedding", "index": 1, "embedding": [0.0, 1.0]},
            {"object": "embedding", "index": 0, "embedding": [1.0, 0.0]}
        ],
        "model": "text-embedding-3-small"
    })";

    auto vectors = parse_embedding_response(body, 2, 2);
    ASSERT_EQ(vectors.size(), 2);
    EXPECT_FLOAT_EQ(vectors[0][0], 1.0f);
    EXPECT_FLOAT_EQ(vectors[1][1], 1.0f);
}

TEST(EmbeddingResponseTest, MissingIndexUsesPosition) {
    std::string body = R"({"data": [{"embedding": [0.5, 0.5, 0.5]}]})";
    auto vectors = parse_embedding_response(body, 1, 0);
    ASSERT_EQ(vectors.size(), 1);
    EXPECT_EQ(vectors[0].size(), 3);
}

TEST(EmbeddingResponseTest, RejectsBadBodies) {
    EXPECT_THROW(parse_embedding_response("not json", 1, 0), ExternalServiceError);
    EXPECT_THROW(parse_embedding_response(R"({"error": {"message": "bad key"}})", 1, 0), ExternalServiceError);
    EXPECT_THROW(parse_embedding_response(R"({"object": "list"})", 1, 0), ExternalServiceError);
    // Count mismatch
    EXPECT_THROW(parse_embedding_response(R"({"data": []})", 1, 0), ExternalServiceError);
    // Dimension mismatch
    EXPECT_THROW(parse_embedding_response(R"({"data": [{"embedding": [1.0]}]})", 1, 2), ExternalServiceError);
    // Duplicate index
    EXPECT_THROW(parse_embedding_response(
        R"({"data": [{"index": 0, "embedding": [1.0]}, {"index": 0, "embedding": [2.0]}]})", 2, 0),
        ExternalServiceError);
    // Index that is not a non-negative integer
    EXPECT_THROW(parse_embedding_response(R"({"data": [{"index": "0", "embedding": [1.0]}]})", 1, 0),
                 ExternalServiceError);
    EXPECT_THROW(parse_embedding_response(R"({"data": [{"index": -1, "embedding": [1.0]}]})", 1, 0),
                 ExternalServiceError);
    EXPECT_THROW(parse_embedding_response(R"({"data": [{"index": 0.5, "embedding": [1.0]}]})", 1, 0),
                 ExternalServiceError);
    // Non-numeric values
    EXPECT_THROW(parse_embedding_response(R"({"data": [{"embedding": ["a"]}]})", 1, 0), ExternalServiceError);
}

// ==========================================
// Factory Tests
// ==========================================

TEST(EmbeddingProviderFactoryTest, CreatesOpenAI) {
    EmbeddingConfig config;
    config.api_key = "sk-test";
    config.dimension = 8;

    auto provider = EmbeddingProviderFactory::create("OPENAI", config);
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->get_provider_name(), "OpenAI");
    EXPECT_TRUE(provider->is_configured());
    EXPECT_EQ(provider->dimension(), 8);
    EXPECT_EQ(provider->get_model(), "text-embedding-3-small");
}

TEST(EmbeddingProviderFactoryTest, UnconfiguredWithoutKey) {
    auto provider = EmbeddingProviderFactory::create("openai", EmbeddingConfig());
    EXPECT_FALSE(provider->is_configured());
}

TEST(EmbeddingProviderFactoryTest, RejectsUnknownName) {
    EXPECT_THROW(EmbeddingProviderFactory::create("word2vec", EmbeddingConfig()), std::invalid_argument);
    EXPECT_THROW(EmbeddingProviderFactory::create("\xC3\x89mbed", EmbeddingConfig()), std::invalid_argument);
}
