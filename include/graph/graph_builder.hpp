#pragma once

#include "graph/knowledge_graph.hpp"
#include "provider/corpus.hpp"
#include <functional>
#include <string>

namespace sem {

/**
 * @brief Parameters of a knowledge graph build
 */
struct KnowledgeGraphQuery {
    double threshold = 0.5;              // Minimum cosine similarity for a document edge
    int max_edges = 5;                   // Similarity edges per document node, (0, 20]
    bool include_topics = true;
    bool include_technologies = true;
    bool include_insights = false;
    bool include_people = false;         // Person nodes from the expertise map
    int max_documents = 100;

    nlohmann::json to_json() const;
    static KnowledgeGraphQuery from_json(const nlohmann::json& j);
};

// Progress callback
using GraphProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

// Node id helpers
std::string document_node_id(const std::string& document_id);
std::string derived_node_id(NodeType type, const std::string& slug);
std::string person_node_id(int user_id);

/**
 * @brief Builds a knowledge graph from a corpus snapshot
 *
 * Steps:
 * 1. Select up to max_documents documents, most recently updated first
 *    (ties by id).
 * 2. Add one topic/technology/insight node per distinct normalized label,
 *    with a weight 1.0 membership edge from each referencing document.
 * 3. Collect each document's top max_edges neighbours with similarity at
 *    or above the threshold, merge symmetric pairs, then accept pairs by
 *    descending weight while both endpoints are below max_edges.
 *
 * Documents without an embedding get no similarity edges. Person nodes are
 * merged afterwards by the expertise module.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(int max_edges_hard_cap = 20) : max_edges_hard_cap_(max_edges_hard_cap) {}

    void set_progress_callback(GraphProgressCallback cb) { progress_cb_ = std::move(cb); }

    /**
     * @throws ValidationError if the query is out of range
     */
    KnowledgeGraph build(const CorpusSnapshot& corpus, const KnowledgeGraphQuery& query) const;

    /**
     * @throws ValidationError describing the first out-of-range parameter
     */
    void validate_query(const KnowledgeGraphQuery& query) const;

private:
    std::vector<const DocumentRecord*> select_documents(const CorpusSnapshot& corpus,
                                                        int max_documents) const;

    void add_derived_nodes(KnowledgeGraph& graph,
                           const std::vector<const DocumentRecord*>& documents,
                           const KnowledgeGraphQuery& query) const;

    void add_similarity_edges(KnowledgeGraph& graph,
                              const CorpusSnapshot& corpus,
                              const std::vector<const DocumentRecord*>& documents,
                              const KnowledgeGraphQuery& query) const;

    void report(const std::string& stage, int current, int total) const {
        if (progress_cb_) progress_cb_(stage, current, total);
    }

    int max_edges_hard_cap_;
    GraphProgressCallback progress_cb_;
};

} // namespace sem
