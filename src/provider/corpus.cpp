#include "provider/corpus.hpp"
#include "core/errors.hpp"
#include <fstream>

namespace sem {

// ==========================================
// EmbeddingStore
// ==========================================

void EmbeddingStore::put(const DocumentEmbedding& embedding) {
    if (embedding.vector.empty()) {
        throw ValidationError("Embedding for document '" + embedding.document_id + "' is empty");
    }

    bool replacing_only_row = rows_.size() == 1 && rows_.count(embedding.document_id) == 1;
    if (rows_.empty() || replacing_only_row) {
        dimension_ = embedding.vector.size();
    } else if (embedding.vector.size() != dimension_) {
        throw DimensionMismatchError(dimension_, embedding.vector.size());
    }

    rows_[embedding.document_id] = embedding;
}

const DocumentEmbedding* EmbeddingStore::get(const std::string& document_id) const {
    auto it = rows_.find(document_id);
    return it != rows_.end() ? &it->second : nullptr;
}

bool EmbeddingStore::has(const std::string& document_id) const {
    return rows_.find(document_id) != rows_.end();
}

bool EmbeddingStore::remove(const std::string& document_id) {
    bool removed = rows_.erase(document_id) > 0;
    if (rows_.empty()) {
        dimension_ = 0;
    }
    return removed;
}

std::vector<DocumentEmbedding> EmbeddingStore::all() const {
    std::vector<DocumentEmbedding> out;
    out.reserve(rows_.size());
    for (const auto& [id, row] : rows_) {
        out.push_back(row);
    }
    return out;
}

// ==========================================
// CorpusSnapshot
// ==========================================

void CorpusSnapshot::add_document(const DocumentRecord& doc) {
    auto it = index_.find(doc.id);
    if (it != index_.end()) {
        documents_[it->second] = doc;
        return;
    }
    index_[doc.id] = documents_.size();
    documents_.push_back(doc);
}

void CorpusSnapshot::add_document(const DocumentRecord& doc, const std::vector<float>& embedding) {
    add_document(doc);
    set_embedding(doc.id, embedding);
}

void CorpusSnapshot::set_embedding(const std::string& document_id, const std::vector<float>& embedding) {
    DocumentEmbedding row;
    row.document_id = document_id;
    row.vector = embedding;
    row.created_at = Clock::now();
    embeddings_.put(row);
}

const DocumentRecord* CorpusSnapshot::find(const std::string& document_id) const {
    auto it = index_.find(document_id);
    return it != index_.end() ? &documents_[it->second] : nullptr;
}

const std::vector<float>* CorpusSnapshot::embedding_for(const std::string& document_id) const {
    const auto* row = embeddings_.get(document_id);
    return row ? &row->vector : nullptr;
}

std::vector<const DocumentRecord*> CorpusSnapshot::documents(std::optional<int> category_id) const {
    std::vector<const DocumentRecord*> out;
    out.reserve(documents_.size());
    for (const auto& doc : documents_) {
        if (category_id.has_value() && doc.category_id != category_id) continue;
        out.push_back(&doc);
    }
    return out;
}

nlohmann::json CorpusSnapshot::to_json() const {
    nlohmann::json docs = nlohmann::json::array();
    for (const auto& doc : documents_) {
        nlohmann::json j = doc.to_json();
        if (const auto* row = embeddings_.get(doc.id)) {
            j["embedding"] = row->vector;
            j["embedded_at"] = format_iso8601(row->created_at);
        }
        docs.push_back(j);
    }
    return {{"documents", docs}};
}

CorpusSnapshot CorpusSnapshot::from_json(const nlohmann::json& j) {
    if (!j.contains("documents") || !j["documents"].is_array()) {
        throw ValidationError("Corpus JSON must contain a 'documents' array");
    }

    CorpusSnapshot snapshot;
    for (const auto& dj : j["documents"]) {
        DocumentRecord doc = DocumentRecord::from_json(dj);
        snapshot.add_document(doc);

        if (dj.contains("embedding") && dj["embedding"].is_array() && !dj["embedding"].empty()) {
            DocumentEmbedding row;
            row.document_id = doc.id;
            row.vector = dj["embedding"].get<std::vector<float>>();
            row.created_at = dj.contains("embedded_at")
                ? parse_iso8601(dj["embedded_at"].get<std::string>())
                : doc.updated_at;
            snapshot.embeddings_.put(row);
        }
    }
    return snapshot;
}

void CorpusSnapshot::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

CorpusSnapshot CorpusSnapshot::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

// ==========================================
// JsonCorpusProvider
// ==========================================

CorpusSnapshot JsonCorpusProvider::load_snapshot() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw ExternalServiceError("Metadata source unreachable: cannot open " + path_);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ExternalServiceError("Malformed corpus file " + path_ + ": " + e.what());
    }

    try {
        return CorpusSnapshot::from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw ExternalServiceError("Malformed document record in " + path_ + ": " + e.what());
    } catch (const ValidationError& e) {
        throw ExternalServiceError("Invalid corpus file " + path_ + ": " + e.what());
    }
}

} // namespace sem
