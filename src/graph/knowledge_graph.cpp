#include "graph/knowledge_graph.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace sem {

NodeType string_to_node_type(const std::string& s) {
    if (s == "document") return NodeType::DOCUMENT;
    if (s == "topic") return NodeType::TOPIC;
    if (s == "technology") return NodeType::TECHNOLOGY;
    if (s == "person") return NodeType::PERSON;
    if (s == "insight") return NodeType::INSIGHT;
    throw ValidationError("Unknown node type: " + s);
}

namespace {

EdgeKind string_to_edge_kind(const std::string& s) {
    if (s == "similarity") return EdgeKind::SIMILARITY;
    if (s == "expertise") return EdgeKind::EXPERTISE;
    return EdgeKind::MEMBERSHIP;
}

std::string escape_dot(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out += c;
    }
    return out;
}

const char* dot_shape(NodeType type) {
    switch (type) {
        case NodeType::DOCUMENT: return "box";
        case NodeType::TOPIC: return "ellipse";
        case NodeType::TECHNOLOGY: return "hexagon";
        case NodeType::PERSON: return "circle";
        case NodeType::INSIGHT: return "note";
        default: return "ellipse";
    }
}

const char* dot_color(NodeType type) {
    switch (type) {
        case NodeType::DOCUMENT: return "lightblue";
        case NodeType::TOPIC: return "palegreen";
        case NodeType::TECHNOLOGY: return "orange";
        case NodeType::PERSON: return "gold";
        case NodeType::INSIGHT: return "plum";
        default: return "white";
    }
}

} // anonymous namespace

// ==========================================
// GraphNode / GraphEdge serialization
// ==========================================

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["type"] = node_type_to_string(node_type);
    if (document_id) {
        j["document_id"] = *document_id;
    }
    j["document_count"] = document_count;
    if (summary) {
        j["summary"] = *summary;
    }
    j["topics"] = topics;
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.at("id").get<std::string>();
    node.label = j.value("label", node.id);
    node.node_type = string_to_node_type(j.value("type", "document"));
    if (j.contains("document_id") && j["document_id"].is_string()) {
        node.document_id = j["document_id"].get<std::string>();
    }
    node.document_count = j.value("document_count", 0);
    if (j.contains("summary") && j["summary"].is_string()) {
        node.summary = j["summary"].get<std::string>();
    }
    if (j.contains("topics")) {
        node.topics = j["topics"].get<std::vector<std::string>>();
    }
    return node;
}

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["source"] = source;
    j["target"] = target;
    j["weight"] = weight;
    if (label) {
        j["label"] = *label;
    }
    j["kind"] = edge_kind_to_string(kind);
    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.id = j.value("id", "");
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();
    edge.weight = j.value("weight", 1.0);
    if (j.contains("label") && j["label"].is_string()) {
        edge.label = j["label"].get<std::string>();
    }
    if (j.contains("kind")) {
        edge.kind = string_to_edge_kind(j["kind"].get<std::string>());
    } else if (edge.id.rfind("sim-", 0) == 0) {
        edge.kind = EdgeKind::SIMILARITY;
    }
    return edge;
}

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["nodes_by_type"] = nodes_by_type;
    j["edges_by_kind"] = edges_by_kind;
    j["max_similarity_degree"] = max_similarity_degree;
    j["avg_similarity_degree"] = avg_similarity_degree;
    j["avg_similarity_weight"] = avg_similarity_weight;
    j["isolated_documents"] = isolated_documents;
    return j;
}

// ==========================================
// Construction
// ==========================================

std::string KnowledgeGraph::pair_key(const std::string& a, const std::string& b) {
    return a < b ? a + '\x1f' + b : b + '\x1f' + a;
}

bool KnowledgeGraph::add_node(const GraphNode& node) {
    if (node_index_.count(node.id) > 0) {
        return false;
    }
    node_index_[node.id] = nodes_.size();
    nodes_.push_back(node);
    return true;
}

const GraphEdge& KnowledgeGraph::add_edge(GraphEdge edge) {
    if (!has_node(edge.source) || !has_node(edge.target)) {
        throw InternalError("Edge references unknown node: " + edge.source + " -- " + edge.target);
    }
    if (edge.source == edge.target) {
        throw InternalError("Self-loop on node " + edge.source);
    }

    std::string key = pair_key(edge.source, edge.target);
    if (pair_index_.count(key) > 0) {
        throw InternalError("Nodes already connected: " + edge.source + " -- " + edge.target);
    }

    if (edge.id.empty()) {
        std::string prefix = edge.kind == EdgeKind::SIMILARITY ? "sim-" : "e-";
        edge.id = prefix + std::to_string(edges_.size());
    }

    degrees_[edge.source][edge.kind]++;
    degrees_[edge.target][edge.kind]++;
    pair_index_[key] = edges_.size();
    edges_.push_back(std::move(edge));
    return edges_.back();
}

// ==========================================
// Queries
// ==========================================

const GraphNode* KnowledgeGraph::get_node(const std::string& id) const {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

GraphNode* KnowledgeGraph::get_node(const std::string& id) {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

bool KnowledgeGraph::has_edge_between(const std::string& a, const std::string& b) const {
    return pair_index_.count(pair_key(a, b)) > 0;
}

std::vector<const GraphNode*> KnowledgeGraph::nodes_of_type(NodeType type) const {
    std::vector<const GraphNode*> out;
    for (const auto& node : nodes_) {
        if (node.node_type == type) out.push_back(&node);
    }
    return out;
}

size_t KnowledgeGraph::degree(const std::string& node_id, EdgeKind kind) const {
    auto it = degrees_.find(node_id);
    if (it == degrees_.end()) return 0;
    auto kt = it->second.find(kind);
    return kt != it->second.end() ? kt->second : 0;
}

bool KnowledgeGraph::validate(std::string& error) const {
    for (const auto& edge : edges_) {
        if (!has_node(edge.source) || !has_node(edge.target)) {
            error = "Edge " + edge.id + " references a missing node";
            return false;
        }
        if (edge.weight < 0.0 || edge.weight > 1.0) {
            error = "Edge " + edge.id + " has weight outside [0, 1]";
            return false;
        }
    }

    for (const auto& node : nodes_) {
        size_t d = degree(node.id, EdgeKind::SIMILARITY);
        if (d > static_cast<size_t>(meta_.max_edges_per_node)) {
            error = "Node " + node.id + " has " + std::to_string(d) +
                    " similarity edges, limit is " + std::to_string(meta_.max_edges_per_node);
            return false;
        }
    }

    return true;
}

GraphStatistics KnowledgeGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = nodes_.size();
    stats.num_edges = edges_.size();

    size_t num_documents = 0;
    size_t degree_sum = 0;
    for (const auto& node : nodes_) {
        stats.nodes_by_type[node_type_to_string(node.node_type)]++;
        if (node.node_type != NodeType::DOCUMENT) continue;

        num_documents++;
        size_t d = degree(node.id, EdgeKind::SIMILARITY);
        degree_sum += d;
        stats.max_similarity_degree = std::max(stats.max_similarity_degree, d);
        if (d == 0) stats.isolated_documents++;
    }

    double weight_sum = 0.0;
    size_t num_similarity = 0;
    for (const auto& edge : edges_) {
        stats.edges_by_kind[edge_kind_to_string(edge.kind)]++;
        if (edge.kind == EdgeKind::SIMILARITY) {
            weight_sum += edge.weight;
            num_similarity++;
        }
    }

    if (num_documents > 0) {
        stats.avg_similarity_degree = static_cast<double>(degree_sum) / num_documents;
    }
    if (num_similarity > 0) {
        stats.avg_similarity_weight = weight_sum / num_similarity;
    }
    return stats;
}

// ==========================================
// Serialization
// ==========================================

nlohmann::json KnowledgeGraph::to_json() const {
    nlohmann::json j;
    j["nodes"] = nlohmann::json::array();
    for (const auto& node : nodes_) {
        j["nodes"].push_back(node.to_json());
    }
    j["edges"] = nlohmann::json::array();
    for (const auto& edge : edges_) {
        j["edges"].push_back(edge.to_json());
    }
    j["meta"] = meta_.to_json();
    return j;
}

KnowledgeGraph KnowledgeGraph::from_json(const nlohmann::json& j) {
    if (!j.contains("nodes") || !j["nodes"].is_array() ||
        !j.contains("edges") || !j["edges"].is_array()) {
        throw ValidationError("Knowledge graph JSON must contain 'nodes' and 'edges' arrays");
    }

    KnowledgeGraph graph;
    for (const auto& nj : j["nodes"]) {
        graph.add_node(GraphNode::from_json(nj));
    }
    for (const auto& ej : j["edges"]) {
        GraphEdge edge = GraphEdge::from_json(ej);
        if (!graph.has_node(edge.source) || !graph.has_node(edge.target)) {
            throw ValidationError("Edge " + edge.id + " references a missing node");
        }
        graph.add_edge(std::move(edge));
    }

    if (j.contains("meta")) {
        const auto& mj = j["meta"];
        KnowledgeGraphMeta meta;
        meta.total_documents = mj.value("total_documents", static_cast<size_t>(0));
        meta.similarity_threshold = mj.value("similarity_threshold", 0.5);
        meta.max_edges_per_node = mj.value("max_edges_per_node", 5);
        graph.set_meta(meta);
    }
    return graph;
}

std::string KnowledgeGraph::to_dot() const {
    std::ostringstream out;
    out << "graph KnowledgeGraph {\n";
    out << "  overlap=false;\n";
    out << "  node [style=filled];\n\n";

    for (const auto& node : nodes_) {
        out << "  \"" << escape_dot(node.id) << "\" [label=\"" << escape_dot(node.label)
            << "\", shape=" << dot_shape(node.node_type)
            << ", fillcolor=" << dot_color(node.node_type) << "];\n";
    }

    out << "\n";

    for (const auto& edge : edges_) {
        out << "  \"" << escape_dot(edge.source) << "\" -- \"" << escape_dot(edge.target) << "\"";
        if (edge.kind == EdgeKind::SIMILARITY) {
            out << " [label=\"" << escape_dot(edge.label.value_or("")) << "\", penwidth="
                << (1.0 + 2.0 * edge.weight) << "]";
        } else {
            out << " [style=dashed]";
        }
        out << ";\n";
    }

    out << "}\n";
    return out.str();
}

void KnowledgeGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

void KnowledgeGraph::export_to_dot(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_dot();
}

KnowledgeGraph KnowledgeGraph::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

} // namespace sem
