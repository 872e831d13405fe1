#include "engine/analytics_engine.hpp"
#include "similarity/similarity_index.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace sem {

namespace {

// Topics then technologies, trimmed, first spelling per normalized label
std::vector<std::pair<std::string, std::string>> keyword_labels(const DocumentRecord& doc) {
    std::vector<std::pair<std::string, std::string>> out;
    std::set<std::string> seen;
    for (const auto* list : {&doc.topics, &doc.technologies}) {
        for (const auto& raw : *list) {
            std::string label = trim_copy(raw);
            std::string slug = normalize_label(label);
            if (slug.empty() || !seen.insert(slug).second) continue;
            out.emplace_back(slug, label);
        }
    }
    return out;
}

std::vector<std::string> shared_keywords(const DocumentRecord& query, const DocumentRecord& other) {
    std::set<std::string> other_slugs;
    for (const auto& [slug, label] : keyword_labels(other)) {
        other_slugs.insert(slug);
    }

    std::vector<std::string> shared;
    for (const auto& [slug, label] : keyword_labels(query)) {
        if (other_slugs.count(slug)) shared.push_back(label);
    }
    return shared;
}

} // anonymous namespace

AnalyticsEngine::AnalyticsEngine(std::shared_ptr<const CorpusSnapshot> corpus, const EngineConfig& config)
    : config_(config),
      corpus_(corpus ? std::move(corpus) : std::make_shared<const CorpusSnapshot>()),
      jobs_(std::make_unique<ClusteringJobRegistry>(config.clustering.engine_config(), config.verbose)) {}

std::unique_ptr<AnalyticsEngine> AnalyticsEngine::from_provider(DocumentMetadataProvider& provider,
                                                                const EngineConfig& config) {
    auto snapshot = std::make_shared<const CorpusSnapshot>(provider.load_snapshot());
    if (config.verbose) {
        std::cerr << "Loaded " << snapshot->num_documents() << " documents ("
                  << snapshot->num_embeddings() << " embedded) from "
                  << provider.get_provider_name() << "\n";
    }
    return std::make_unique<AnalyticsEngine>(snapshot, config);
}

void AnalyticsEngine::set_corpus(std::shared_ptr<const CorpusSnapshot> corpus) {
    std::lock_guard<std::mutex> lock(corpus_mutex_);
    corpus_ = corpus ? std::move(corpus) : std::make_shared<const CorpusSnapshot>();
}

std::shared_ptr<const CorpusSnapshot> AnalyticsEngine::corpus() const {
    std::lock_guard<std::mutex> lock(corpus_mutex_);
    return corpus_;
}

void AnalyticsEngine::log(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << message << std::endl;
    }
}

// ==========================================
// Graph
// ==========================================

KnowledgeGraphQuery AnalyticsEngine::default_graph_query() const {
    KnowledgeGraphQuery query;
    query.threshold = config_.graph.default_threshold;
    query.max_edges = config_.graph.default_max_edges;
    query.max_documents = config_.graph.default_max_documents;
    return query;
}

KnowledgeGraph AnalyticsEngine::build_graph(const KnowledgeGraphQuery& query) const {
    auto snapshot = corpus();

    GraphBuilder builder(config_.graph.max_edges_hard_cap);
    if (progress_cb_) {
        builder.set_progress_callback(progress_cb_);
    }
    KnowledgeGraph graph = builder.build(*snapshot, query);

    if (query.include_people) {
        ExpertiseAggregator aggregator(config_.expertise);
        aggregator.merge_into_graph(graph, aggregator.aggregate(snapshot->documents()));
    }

    std::string error;
    if (!graph.validate(error)) {
        throw InternalError("Knowledge graph failed validation: " + error);
    }

    log("[graph] " + std::to_string(graph.num_nodes()) + " nodes, " +
        std::to_string(graph.num_edges()) + " edges");
    return graph;
}

// ==========================================
// Expertise
// ==========================================

TeamExpertiseMap AnalyticsEngine::build_team_expertise_map() const {
    auto snapshot = corpus();
    ExpertiseAggregator aggregator(config_.expertise);
    return aggregator.aggregate(snapshot->documents());
}

// ==========================================
// Clustering
// ==========================================

ClusteringJob AnalyticsEngine::start_clustering(const DocumentsScope& scope,
                                                std::optional<int> num_clusters,
                                                ClusteringAlgorithm algorithm) {
    auto snapshot = corpus();

    std::vector<const DocumentRecord*> documents;
    if (scope.document_ids.empty()) {
        documents = snapshot->documents(scope.category_id);
    } else {
        for (const auto& id : scope.document_ids) {
            const auto* doc = snapshot->find(id);
            if (!doc) {
                throw NotFoundError("Document not found: " + id);
            }
            if (scope.category_id && doc->category_id != scope.category_id) continue;
            documents.push_back(doc);
        }
    }

    std::vector<ClusterInput> inputs;
    std::set<std::string> added;
    for (const auto* doc : documents) {
        const auto* vec = snapshot->embedding_for(doc->id);
        if (!vec || !added.insert(doc->id).second) continue;

        ClusterInput input;
        input.document_id = doc->id;
        input.vector = *vec;
        input.labels = doc->topics;
        input.labels.insert(input.labels.end(), doc->technologies.begin(), doc->technologies.end());
        inputs.push_back(std::move(input));
    }

    int k = num_clusters.value_or(config_.clustering.default_num_clusters);
    return jobs_->submit(std::move(inputs), k, algorithm);
}

std::optional<ClusteringResult> AnalyticsEngine::get_clustering_result(const std::string& job_id) const {
    return jobs_->get_result(job_id);
}

ClusteringJob AnalyticsEngine::get_clustering_job(const std::string& job_id) const {
    return jobs_->get_job(job_id);
}

std::vector<ClusteringJob> AnalyticsEngine::list_clustering_jobs() const {
    return jobs_->list_jobs();
}

ClusteringJob AnalyticsEngine::wait_for_clustering_job(const std::string& job_id) const {
    return jobs_->wait(job_id);
}

// ==========================================
// Similarity
// ==========================================

std::vector<DocumentSimilarity> AnalyticsEngine::find_similar_documents(
    const std::string& document_id,
    std::optional<int> limit,
    std::optional<double> min_similarity) const {

    int n = std::clamp(limit.value_or(config_.similarity.default_limit), 1, config_.similarity.max_limit);
    double min_sim = min_similarity.value_or(config_.similarity.default_min_similarity);
    if (!(min_sim >= -1.0 && min_sim <= 1.0)) {
        throw ValidationError("min_similarity must be within [-1, 1], got " + std::to_string(min_sim));
    }

    auto snapshot = corpus();
    const auto* query_doc = snapshot->find(document_id);
    if (!query_doc) {
        throw NotFoundError("Document not found: " + document_id);
    }
    const auto* query_vec = snapshot->embedding_for(document_id);
    if (!query_vec) {
        throw NotFoundError("No embedding stored for document: " + document_id);
    }

    BruteForceSimilarityIndex index;
    for (const auto* doc : snapshot->documents()) {
        if (const auto* vec = snapshot->embedding_for(doc->id)) {
            index.add(doc->id, *vec);
        }
    }

    std::vector<DocumentSimilarity> results;
    for (const auto& hit : index.top_similar(*query_vec, static_cast<size_t>(n), min_sim, document_id)) {
        const auto* doc = snapshot->find(hit.id);

        DocumentSimilarity sim;
        sim.document_id = hit.id;
        sim.title = doc->title;
        sim.similarity_score = hit.similarity;
        sim.shared_keywords = shared_keywords(*query_doc, *doc);
        results.push_back(std::move(sim));
    }
    return results;
}

// ==========================================
// Trends / anomalies
// ==========================================

TrendAnalysis AnalyticsEngine::get_trend_analysis(int days, std::optional<Timestamp> now) const {
    auto snapshot = corpus();
    TrendAnalyzer analyzer(config_.trend);
    return analyzer.analyze(snapshot->documents(), days, now.value_or(Clock::now()));
}

std::vector<AnomalyResult> AnalyticsEngine::detect_anomalies(std::optional<int> category_id) const {
    auto snapshot = corpus();
    AnomalyDetector detector(config_.anomaly);
    auto results = detector.detect(*snapshot, category_id);
    log("[anomaly] " + std::to_string(results.size()) + " anomalies");
    return results;
}

} // namespace sem
