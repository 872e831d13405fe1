#include "provider/embedding_provider.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace sem {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Make HTTP POST request with CURL
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ExternalServiceError("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw ExternalServiceError("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw ExternalServiceError(
            "HTTP request failed with code " + std::to_string(http_code) +
            ": " + response
        );
    }

    return response;
}

} // anonymous namespace

// ============================================================================
// EmbeddingProvider Base Class
// ============================================================================

std::vector<std::vector<float>> EmbeddingProvider::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> results;
    results.reserve(texts.size());
    for (const auto& text : texts) {
        results.push_back(embed(text));
    }
    return results;
}

// ============================================================================
// OpenAIEmbeddingProvider
// ============================================================================

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(const EmbeddingConfig& config) {
    config_ = config;
}

std::string OpenAIEmbeddingProvider::build_payload(const std::vector<std::string>& texts) const {
    json payload;
    payload["model"] = config_.model;
    payload["input"] = texts;
    payload["encoding_format"] = "float";
    return payload.dump();
}

std::string OpenAIEmbeddingProvider::post_with_retry(const std::string& payload) {
    if (!is_configured()) {
        throw ExternalServiceError("Embedding provider is not configured (missing API key)");
    }

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + config_.api_key
    };
    const std::string url = config_.api_base_url + "/embeddings";
    const int max_attempts = std::max(1, config_.max_retries);

    for (int attempt = 1; ; ++attempt) {
        try {
            return http_post(url, payload, headers, config_.timeout_seconds);
        } catch (const ExternalServiceError& e) {
            if (attempt >= max_attempts) {
                throw ExternalServiceError(
                    "Embedding request failed after " + std::to_string(attempt) +
                    " attempts: " + e.what());
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempt << " failed for OpenAI embeddings: "
                          << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::seconds(static_cast<int>(std::pow(2, attempt - 1)))
            );
        }
    }
}

std::vector<float> OpenAIEmbeddingProvider::embed(const std::string& text) {
    auto vectors = embed_batch({text});
    return std::move(vectors.front());
}

std::vector<std::vector<float>> OpenAIEmbeddingProvider::embed_batch(const std::vector<std::string>& texts) {
    if (texts.empty()) {
        return {};
    }

    std::string response = post_with_retry(build_payload(texts));
    return parse_embedding_response(response, texts.size(), config_.dimension);
}

// ============================================================================
// EmbeddingProviderFactory
// ============================================================================

std::unique_ptr<EmbeddingProvider> EmbeddingProviderFactory::create(
    const std::string& provider_name,
    const EmbeddingConfig& config
) {
    std::string name = to_lower_copy(provider_name);

    if (name == "openai" || name == "openai-compatible") {
        return std::make_unique<OpenAIEmbeddingProvider>(config);
    }

    throw std::invalid_argument("Unknown embedding provider name: " + provider_name);
}

std::unique_ptr<EmbeddingProvider> EmbeddingProviderFactory::create_from_env() {
    EmbeddingConfig config;

    const char* provider = std::getenv("SEM_EMBEDDING_PROVIDER");
    if (provider) config.provider = provider;

    config.api_key = get_api_key_from_env("SEM_EMBEDDING_API_KEY");
    if (config.api_key.empty()) {
        config.api_key = get_api_key_from_env("OPENAI_API_KEY");
    }
    if (config.api_key.empty()) {
        return nullptr;
    }

    const char* model = std::getenv("SEM_EMBEDDING_MODEL");
    if (model) config.model = model;

    const char* base_url = std::getenv("SEM_EMBEDDING_BASE_URL");
    if (base_url) config.api_base_url = base_url;

    return create(config.provider, config);
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::vector<float>> parse_embedding_response(
    const std::string& response_json,
    size_t expected_count,
    size_t expected_dimension
) {
    json j;
    try {
        j = json::parse(response_json);
    } catch (const json::parse_error& e) {
        throw ExternalServiceError(std::string("Malformed embedding response: ") + e.what());
    }

    if (j.contains("error")) {
        throw ExternalServiceError("Embedding API error: " + j["error"].dump());
    }
    if (!j.contains("data") || !j["data"].is_array()) {
        throw ExternalServiceError("Embedding response has no 'data' array");
    }

    const auto& data = j["data"];
    if (data.size() != expected_count) {
        throw ExternalServiceError(
            "Embedding response returned " + std::to_string(data.size()) +
            " vectors for " + std::to_string(expected_count) + " inputs");
    }

    std::vector<std::vector<float>> vectors(expected_count);
    std::vector<bool> filled(expected_count, false);

    for (size_t i = 0; i < data.size(); ++i) {
        const auto& item = data[i];
        if (!item.contains("embedding") || !item["embedding"].is_array()) {
            throw ExternalServiceError("Embedding response item has no 'embedding' array");
        }

        size_t index = i;
        if (item.contains("index")) {
            if (!item["index"].is_number_unsigned()) {
                throw ExternalServiceError("Embedding response item has a non-integer index: " +
                                           item["index"].dump());
            }
            index = item["index"].get<size_t>();
        }
        if (index >= expected_count || filled[index]) {
            throw ExternalServiceError("Embedding response has invalid index " + std::to_string(index));
        }

        std::vector<float> vec;
        try {
            vec = item["embedding"].get<std::vector<float>>();
        } catch (const json::exception& e) {
            throw ExternalServiceError(std::string("Embedding values are not numeric: ") + e.what());
        }

        if (expected_dimension > 0 && vec.size() != expected_dimension) {
            throw ExternalServiceError(
                "Embedding has " + std::to_string(vec.size()) +
                " dimensions, expected " + std::to_string(expected_dimension));
        }

        vectors[index] = std::move(vec);
        filled[index] = true;
    }

    return vectors;
}

std::string get_api_key_from_env(const std::string& env_var_name) {
    const char* value = std::getenv(env_var_name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace sem
