#include "similarity/similarity_index.hpp"
#include "math/vector_math.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace sem {

namespace {

std::vector<SimilarityHit> rank_hits(std::vector<SimilarityHit> hits, size_t limit) {
    std::sort(hits.begin(), hits.end(), ranks_before);
    if (hits.size() > limit) {
        hits.resize(limit);
    }
    return hits;
}

} // anonymous namespace

// ==========================================
// BruteForceSimilarityIndex
// ==========================================

void BruteForceSimilarityIndex::add(const std::string& id, const std::vector<float>& vector) {
    if (vectors_.empty()) {
        dimension_ = vector.size();
    } else if (vector.size() != dimension_) {
        throw DimensionMismatchError(dimension_, vector.size());
    }
    vectors_[id] = vector;
}

const std::vector<float>* BruteForceSimilarityIndex::get(const std::string& id) const {
    auto it = vectors_.find(id);
    return it != vectors_.end() ? &it->second : nullptr;
}

std::vector<SimilarityHit> BruteForceSimilarityIndex::top_similar(
    const std::vector<float>& query,
    size_t limit,
    double min_similarity,
    const std::string& exclude_id
) const {
    if (limit == 0 || vectors_.empty()) {
        return {};
    }
    if (query.size() != dimension_) {
        throw DimensionMismatchError(dimension_, query.size());
    }

    std::vector<SimilarityHit> hits;
    for (const auto& [id, vec] : vectors_) {
        if (!exclude_id.empty() && id == exclude_id) continue;

        double sim = vector_math::cosine_similarity(query, vec);
        if (sim >= min_similarity) {
            hits.push_back({id, sim});
        }
    }

    return rank_hits(std::move(hits), limit);
}

// ==========================================
// Free function
// ==========================================

std::vector<SimilarityHit> top_similar(
    const std::vector<float>& query,
    const std::map<std::string, std::vector<float>>& corpus,
    size_t limit,
    double min_similarity
) {
    if (limit == 0) {
        return {};
    }

    std::vector<SimilarityHit> hits;
    for (const auto& [id, vec] : corpus) {
        double sim = vector_math::cosine_similarity(query, vec);
        if (sim >= min_similarity) {
            hits.push_back({id, sim});
        }
    }

    return rank_hits(std::move(hits), limit);
}

} // namespace sem
