#pragma once

#include "core/document.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sem {

/**
 * @brief Persisted document embeddings, one vector per document
 *
 * Writing a vector for an existing document overwrites it (re-embedding).
 * Every stored vector shares one dimensionality.
 */
class EmbeddingStore {
public:
    /**
     * @brief Insert or overwrite the embedding for a document
     * @throws DimensionMismatchError when the length differs from the store's
     */
    void put(const DocumentEmbedding& embedding);

    const DocumentEmbedding* get(const std::string& document_id) const;

    bool has(const std::string& document_id) const;

    bool remove(const std::string& document_id);

    /**
     * @brief All rows ordered by document id
     */
    std::vector<DocumentEmbedding> all() const;

    size_t size() const { return rows_.size(); }
    size_t dimension() const { return dimension_; }
    bool empty() const { return rows_.empty(); }

private:
    std::map<std::string, DocumentEmbedding> rows_;
    size_t dimension_ = 0;
};

/**
 * @brief Read-only view of documents + embeddings that a request runs against
 */
class CorpusSnapshot {
public:
    CorpusSnapshot() = default;

    /**
     * @brief Add a document; replaces any previous record with the same id
     */
    void add_document(const DocumentRecord& doc);

    /**
     * @brief Add a document together with its embedding
     */
    void add_document(const DocumentRecord& doc, const std::vector<float>& embedding);

    void set_embedding(const std::string& document_id, const std::vector<float>& embedding);

    const DocumentRecord* find(const std::string& document_id) const;

    const std::vector<float>* embedding_for(const std::string& document_id) const;

    /**
     * @brief Documents in insertion order, optionally filtered by category
     */
    std::vector<const DocumentRecord*> documents(std::optional<int> category_id = std::nullopt) const;

    const EmbeddingStore& embeddings() const { return embeddings_; }

    size_t num_documents() const { return documents_.size(); }
    size_t num_embeddings() const { return embeddings_.size(); }

    nlohmann::json to_json() const;
    static CorpusSnapshot from_json(const nlohmann::json& j);

    void save_to_json(const std::string& filename) const;
    static CorpusSnapshot load_from_json(const std::string& filename);

private:
    std::vector<DocumentRecord> documents_;
    std::map<std::string, size_t> index_;
    EmbeddingStore embeddings_;
};

// ============================================================================
// Metadata provider
// ============================================================================

/**
 * @brief Source of per-document understanding metadata
 *
 * Implementations surface failures (unreachable source, malformed payload)
 * as ExternalServiceError; the engine never retries them.
 */
class DocumentMetadataProvider {
public:
    virtual ~DocumentMetadataProvider() = default;

    virtual CorpusSnapshot load_snapshot() = 0;

    virtual std::string get_provider_name() const = 0;
};

/**
 * @brief Loads a snapshot from a corpus JSON file
 *
 * File format:
 * {
 *   "documents": [
 *     { "id": "...", "title": "...", "topics": [...], "technologies": [...],
 *       "author": {"user_id": 1, "username": "..."}, "created_at": "2024-01-01T00:00:00Z",
 *       "embedding": [0.1, 0.2, ...] }
 *   ]
 * }
 */
class JsonCorpusProvider : public DocumentMetadataProvider {
public:
    explicit JsonCorpusProvider(const std::string& path) : path_(path) {}

    CorpusSnapshot load_snapshot() override;

    std::string get_provider_name() const override { return "json-file"; }

private:
    std::string path_;
};

} // namespace sem
