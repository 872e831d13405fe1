#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sem {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for an embedding provider
 */
struct EmbeddingConfig {
    std::string provider = "openai";                    ///< Provider name
    std::string api_key;                                ///< API key for authentication
    std::string model = "text-embedding-3-small";      ///< Model name/ID
    std::string api_base_url = "https://api.openai.com/v1";  ///< Base URL for API
    size_t dimension = 1536;                            ///< Expected vector length
    int timeout_seconds = 60;                           ///< Request timeout
    int max_retries = 3;                                ///< Attempts per request
    bool verbose = false;                               ///< Log retries to stderr
};

// ============================================================================
// Embedding Provider Interface
// ============================================================================

/**
 * @brief Abstract base class for embedding providers
 *
 * Produces one fixed-length vector per text. Used at ingestion time to fill
 * the embedding store; the analytics engine itself only reads stored vectors.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embed a single text
     * @throws ExternalServiceError when the provider is unreachable or
     *         returns a malformed or wrong-length response
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /**
     * @brief Embed several texts; result order matches input order
     */
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);

    virtual std::string get_provider_name() const = 0;

    std::string get_model() const { return config_.model; }

    size_t dimension() const { return config_.dimension; }

    virtual bool is_configured() const = 0;

    void set_config(const EmbeddingConfig& config) { config_ = config; }

    EmbeddingConfig get_config() const { return config_; }

protected:
    EmbeddingConfig config_;
};

// ============================================================================
// OpenAI-compatible Provider
// ============================================================================

/**
 * @brief Provider for any endpoint speaking the OpenAI /embeddings protocol
 */
class OpenAIEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OpenAIEmbeddingProvider(const EmbeddingConfig& config);

    std::vector<float> embed(const std::string& text) override;

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;

    std::string get_provider_name() const override { return "OpenAI"; }

    bool is_configured() const override { return !config_.api_key.empty(); }

private:
    /**
     * @brief POST a payload, retrying transport failures up to max_retries
     */
    std::string post_with_retry(const std::string& payload);

    std::string build_payload(const std::vector<std::string>& texts) const;
};

// ============================================================================
// Factory
// ============================================================================

class EmbeddingProviderFactory {
public:
    /**
     * @brief Create provider from name ("openai")
     * @throws std::invalid_argument for unknown names
     */
    static std::unique_ptr<EmbeddingProvider> create(
        const std::string& provider_name,
        const EmbeddingConfig& config
    );

    /**
     * @brief Create provider from environment variables
     *
     * Looks for:
     * - SEM_EMBEDDING_PROVIDER (default openai)
     * - SEM_EMBEDDING_API_KEY or OPENAI_API_KEY
     * - SEM_EMBEDDING_MODEL (optional)
     * - SEM_EMBEDDING_BASE_URL (optional)
     *
     * @return Provider, or nullptr if no API key is set
     */
    static std::unique_ptr<EmbeddingProvider> create_from_env();
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Parse an /embeddings response body
 *
 * Vectors are returned ordered by their "index" field.
 *
 * @param expected_count Number of inputs sent
 * @param expected_dimension Required vector length (0 = do not check)
 * @throws ExternalServiceError on malformed bodies, API errors or length mismatches
 */
std::vector<std::vector<float>> parse_embedding_response(
    const std::string& response_json,
    size_t expected_count,
    size_t expected_dimension
);

std::string get_api_key_from_env(const std::string& env_var_name);

} // namespace sem
