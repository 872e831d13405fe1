#ifndef KNOWLEDGE_GRAPH_HPP
#define KNOWLEDGE_GRAPH_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sem {

enum class NodeType {
    DOCUMENT,
    TOPIC,
    TECHNOLOGY,
    PERSON,
    INSIGHT
};

inline std::string node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::DOCUMENT: return "document";
        case NodeType::TOPIC: return "topic";
        case NodeType::TECHNOLOGY: return "technology";
        case NodeType::PERSON: return "person";
        case NodeType::INSIGHT: return "insight";
        default: return "document";
    }
}

/**
 * @throws ValidationError for unknown names
 */
NodeType string_to_node_type(const std::string& s);

// What an edge expresses
enum class EdgeKind {
    SIMILARITY,    // document <-> document, weight = cosine similarity
    MEMBERSHIP,    // document -> topic/technology/insight, weight 1.0
    EXPERTISE      // person -> topic/technology, weight = normalized document count
};

inline std::string edge_kind_to_string(EdgeKind kind) {
    switch (kind) {
        case EdgeKind::SIMILARITY: return "similarity";
        case EdgeKind::MEMBERSHIP: return "membership";
        case EdgeKind::EXPERTISE: return "expertise";
        default: return "membership";
    }
}

/**
 * @brief A typed node in the knowledge graph
 *
 * Ids follow a per-type convention: "doc-<uuid>", "topic-<slug>",
 * "tech-<slug>", "insight-<slug>", "person-<user_id>". document_id and
 * summary are only set on document nodes and are omitted from JSON otherwise.
 */
struct GraphNode {
    std::string id;
    std::string label;
    NodeType node_type = NodeType::DOCUMENT;
    std::optional<std::string> document_id;
    int document_count = 0;
    std::optional<std::string> summary;
    std::vector<std::string> topics;

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief Undirected weighted edge, stored once per unordered node pair
 */
struct GraphEdge {
    std::string id;
    std::string source;
    std::string target;
    double weight = 1.0;                   // [0, 1]
    std::optional<std::string> label;      // "87%" on similarity edges
    EdgeKind kind = EdgeKind::MEMBERSHIP;

    bool connects(const std::string& a, const std::string& b) const {
        return (source == a && target == b) || (source == b && target == a);
    }

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

struct KnowledgeGraphMeta {
    size_t total_documents = 0;
    double similarity_threshold = 0.5;
    int max_edges_per_node = 5;

    nlohmann::json to_json() const {
        return {
            {"total_documents", total_documents},
            {"similarity_threshold", similarity_threshold},
            {"max_edges_per_node", max_edges_per_node}
        };
    }
};

/**
 * @brief Structural summary of a built graph
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    std::map<std::string, size_t> nodes_by_type;
    std::map<std::string, size_t> edges_by_kind;

    size_t max_similarity_degree = 0;      // Over document nodes
    double avg_similarity_degree = 0.0;
    double avg_similarity_weight = 0.0;
    size_t isolated_documents = 0;         // Document nodes without similarity edges

    nlohmann::json to_json() const;
};

/**
 * @brief Typed graph of documents and the entities derived from them
 *
 * Nodes live in an arena vector addressed through an id index, so no node
 * holds pointers to another. Node and edge order is insertion order and is
 * preserved by serialization.
 */
class KnowledgeGraph {
public:
    KnowledgeGraph() = default;

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Add a node
     * @return false if a node with the same id already exists (graph unchanged)
     */
    bool add_node(const GraphNode& node);

    /**
     * @brief Add an edge between two existing nodes
     *
     * An empty edge id is filled in as "sim-<n>" for similarity edges and
     * "e-<n>" otherwise, where n is the edge's position.
     *
     * @throws InternalError if an endpoint is missing or the pair is already connected
     */
    const GraphEdge& add_edge(GraphEdge edge);

    void set_meta(const KnowledgeGraphMeta& meta) { meta_ = meta; }

    // ==========================================
    // Queries
    // ==========================================

    const GraphNode* get_node(const std::string& id) const;
    GraphNode* get_node(const std::string& id);

    bool has_node(const std::string& id) const { return node_index_.count(id) > 0; }

    bool has_edge_between(const std::string& a, const std::string& b) const;

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }
    const KnowledgeGraphMeta& meta() const { return meta_; }

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }

    std::vector<const GraphNode*> nodes_of_type(NodeType type) const;

    // Number of incident edges of the given kind
    size_t degree(const std::string& node_id, EdgeKind kind) const;

    /**
     * @brief Check referential integrity and the per-node similarity edge cap
     * @param error Set to the first violation found
     */
    bool validate(std::string& error) const;

    GraphStatistics compute_statistics() const;

    // ==========================================
    // Serialization
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @throws ValidationError on missing arrays or dangling edges
     */
    static KnowledgeGraph from_json(const nlohmann::json& j);

    std::string to_dot() const;

    void export_to_json(const std::string& filename) const;

    /**
     * @brief Export to Graphviz DOT format for visualization
     */
    void export_to_dot(const std::string& filename) const;

    static KnowledgeGraph load_from_json(const std::string& filename);

private:
    static std::string pair_key(const std::string& a, const std::string& b);

    std::vector<GraphNode> nodes_;
    std::map<std::string, size_t> node_index_;
    std::vector<GraphEdge> edges_;
    std::map<std::string, size_t> pair_index_;
    std::map<std::string, std::map<EdgeKind, size_t>> degrees_;
    KnowledgeGraphMeta meta_;
};

} // namespace sem

#endif // KNOWLEDGE_GRAPH_HPP
