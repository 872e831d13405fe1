#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sem {

/**
 * @brief One ranked match returned by a similarity query
 */
struct SimilarityHit {
    std::string id;
    double similarity = 0.0;

    nlohmann::json to_json() const {
        return {{"id", id}, {"similarity", similarity}};
    }
};

/**
 * @brief Ordering used by every ranked result: similarity descending,
 * then id ascending so equal scores come out deterministically
 */
inline bool ranks_before(const SimilarityHit& a, const SimilarityHit& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.id < b.id;
}

/**
 * @brief Nearest-neighbour lookup over a fixed corpus of embeddings
 *
 * Results depend only on (query, corpus, limit, min_similarity), so an
 * approximate index can replace the brute-force one without touching callers.
 */
class SimilarityIndex {
public:
    virtual ~SimilarityIndex() = default;

    /**
     * @brief Add or replace the vector stored under @p id
     * @throws DimensionMismatchError if the length differs from earlier vectors
     */
    virtual void add(const std::string& id, const std::vector<float>& vector) = 0;

    /**
     * @brief Top matches for @p query
     * @param limit Maximum number of hits; fewer are returned when fewer qualify
     * @param min_similarity Hits below this value are dropped
     * @param exclude_id Optional id to skip (typically the query document itself)
     */
    virtual std::vector<SimilarityHit> top_similar(
        const std::vector<float>& query,
        size_t limit,
        double min_similarity,
        const std::string& exclude_id = ""
    ) const = 0;

    virtual const std::vector<float>* get(const std::string& id) const = 0;

    virtual size_t size() const = 0;

    virtual size_t dimension() const = 0;
};

/**
 * @brief O(n) scan against every stored vector
 */
class BruteForceSimilarityIndex : public SimilarityIndex {
public:
    BruteForceSimilarityIndex() = default;

    void add(const std::string& id, const std::vector<float>& vector) override;

    std::vector<SimilarityHit> top_similar(
        const std::vector<float>& query,
        size_t limit,
        double min_similarity,
        const std::string& exclude_id = ""
    ) const override;

    const std::vector<float>* get(const std::string& id) const override;

    size_t size() const override { return vectors_.size(); }

    size_t dimension() const override { return dimension_; }

private:
    std::map<std::string, std::vector<float>> vectors_;
    size_t dimension_ = 0;
};

/**
 * @brief Stateless form of the ranking query over an id -> vector corpus
 */
std::vector<SimilarityHit> top_similar(
    const std::vector<float>& query,
    const std::map<std::string, std::vector<float>>& corpus,
    size_t limit,
    double min_similarity
);

} // namespace sem
