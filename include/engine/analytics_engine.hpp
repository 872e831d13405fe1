#pragma once

#include "engine/engine_config.hpp"
#include "analytics/anomaly_detector.hpp"
#include "analytics/trend_analyzer.hpp"
#include "cluster/clustering_jobs.hpp"
#include "expertise/expertise_aggregator.hpp"
#include "graph/graph_builder.hpp"
#include "provider/corpus.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sem {

/**
 * @brief Which documents a clustering run covers
 *
 * Both filters are optional and combine: category first, then the explicit
 * id list. Documents without an embedding are left out.
 */
struct DocumentsScope {
    std::optional<int> category_id;
    std::vector<std::string> document_ids;
};

struct DocumentSimilarity {
    std::string document_id;
    std::string title;
    double similarity_score = 0.0;
    std::vector<std::string> shared_keywords;

    nlohmann::json to_json() const {
        return {
            {"document_id", document_id},
            {"title", title},
            {"similarity_score", similarity_score},
            {"shared_keywords", shared_keywords}
        };
    }
};

// Progress callback
using EngineProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief Request/response entry point over a corpus snapshot
 *
 * Every synchronous request reads the snapshot current at call time and
 * either returns a complete result or throws an EngineError. Clustering is
 * asynchronous: start_clustering returns a PENDING job and the result is
 * polled by job id.
 */
class AnalyticsEngine {
public:
    explicit AnalyticsEngine(std::shared_ptr<const CorpusSnapshot> corpus,
                             const EngineConfig& config = EngineConfig());

    /**
     * @brief Build an engine over a snapshot loaded from a metadata provider
     * @throws ExternalServiceError when the provider fails
     */
    static std::unique_ptr<AnalyticsEngine> from_provider(DocumentMetadataProvider& provider,
                                                          const EngineConfig& config = EngineConfig());

    /**
     * @brief Swap in a new snapshot; requests already running keep the old one
     */
    void set_corpus(std::shared_ptr<const CorpusSnapshot> corpus);

    std::shared_ptr<const CorpusSnapshot> corpus() const;

    const EngineConfig& get_config() const { return config_; }

    void set_progress_callback(EngineProgressCallback cb) { progress_cb_ = std::move(cb); }

    // ==========================================
    // Requests
    // ==========================================

    /**
     * @brief Build the knowledge graph; Person nodes are merged when include_people is set
     * @throws ValidationError for out-of-range query parameters
     */
    KnowledgeGraph build_graph(const KnowledgeGraphQuery& query) const;

    /**
     * @brief Query populated with the configured defaults
     */
    KnowledgeGraphQuery default_graph_query() const;

    TeamExpertiseMap build_team_expertise_map() const;

    /**
     * @brief Submit a clustering run over a snapshot of the scoped documents
     * @param num_clusters k; the configured default when empty
     * @throws NotFoundError if the scope names an unknown document id
     */
    ClusteringJob start_clustering(const DocumentsScope& scope,
                                   std::optional<int> num_clusters,
                                   ClusteringAlgorithm algorithm = ClusteringAlgorithm::KMEANS);

    /**
     * @brief Result of a completed job, std::nullopt while it is still running or failed
     * @throws NotFoundError for unknown job ids
     */
    std::optional<ClusteringResult> get_clustering_result(const std::string& job_id) const;

    ClusteringJob get_clustering_job(const std::string& job_id) const;

    std::vector<ClusteringJob> list_clustering_jobs() const;

    /**
     * @brief Block until the job is COMPLETED or FAILED
     */
    ClusteringJob wait_for_clustering_job(const std::string& job_id) const;

    /**
     * @brief Documents most similar to @p document_id, excluding itself
     *
     * limit defaults to the configured value and is clamped to [1, max_limit].
     *
     * @throws NotFoundError if the document is unknown or has no embedding
     * @throws ValidationError if min_similarity is outside [-1, 1]
     */
    std::vector<DocumentSimilarity> find_similar_documents(const std::string& document_id,
                                                           std::optional<int> limit = std::nullopt,
                                                           std::optional<double> min_similarity = std::nullopt) const;

    /**
     * @brief Trend report over the trailing @p days, ending at @p now (default: current time)
     */
    TrendAnalysis get_trend_analysis(int days, std::optional<Timestamp> now = std::nullopt) const;

    std::vector<AnomalyResult> detect_anomalies(std::optional<int> category_id = std::nullopt) const;

private:
    void log(const std::string& message) const;

    EngineConfig config_;
    EngineProgressCallback progress_cb_;

    mutable std::mutex corpus_mutex_;
    std::shared_ptr<const CorpusSnapshot> corpus_;

    std::unique_ptr<ClusteringJobRegistry> jobs_;
};

} // namespace sem
