#include "graph/graph_builder.hpp"
#include "similarity/similarity_index.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace sem {

// ==========================================
// Query
// ==========================================

nlohmann::json KnowledgeGraphQuery::to_json() const {
    return {
        {"threshold", threshold},
        {"max_edges", max_edges},
        {"include_topics", include_topics},
        {"include_technologies", include_technologies},
        {"include_insights", include_insights},
        {"include_people", include_people},
        {"max_documents", max_documents}
    };
}

KnowledgeGraphQuery KnowledgeGraphQuery::from_json(const nlohmann::json& j) {
    KnowledgeGraphQuery q;
    q.threshold = j.value("threshold", q.threshold);
    q.max_edges = j.value("max_edges", q.max_edges);
    q.include_topics = j.value("include_topics", q.include_topics);
    q.include_technologies = j.value("include_technologies", q.include_technologies);
    q.include_insights = j.value("include_insights", q.include_insights);
    q.include_people = j.value("include_people", q.include_people);
    q.max_documents = j.value("max_documents", q.max_documents);
    return q;
}

// ==========================================
// Node ids
// ==========================================

std::string document_node_id(const std::string& document_id) {
    return "doc-" + document_id;
}

std::string derived_node_id(NodeType type, const std::string& slug) {
    switch (type) {
        case NodeType::TOPIC: return "topic-" + slug;
        case NodeType::TECHNOLOGY: return "tech-" + slug;
        case NodeType::INSIGHT: return "insight-" + slug;
        default:
            throw InternalError("derived_node_id called for " + node_type_to_string(type));
    }
}

std::string person_node_id(int user_id) {
    return "person-" + std::to_string(user_id);
}

// ==========================================
// GraphBuilder
// ==========================================

void GraphBuilder::validate_query(const KnowledgeGraphQuery& query) const {
    if (!(query.threshold >= 0.0 && query.threshold <= 1.0)) {
        throw ValidationError("threshold must be within [0, 1], got " + std::to_string(query.threshold));
    }
    if (query.max_edges <= 0 || query.max_edges > max_edges_hard_cap_) {
        throw ValidationError("max_edges must be within (0, " + std::to_string(max_edges_hard_cap_) +
                              "], got " + std::to_string(query.max_edges));
    }
    if (query.max_documents < 1) {
        throw ValidationError("max_documents must be at least 1, got " + std::to_string(query.max_documents));
    }
}

KnowledgeGraph GraphBuilder::build(const CorpusSnapshot& corpus, const KnowledgeGraphQuery& query) const {
    validate_query(query);

    KnowledgeGraph graph;
    auto documents = select_documents(corpus, query.max_documents);

    report("documents", 0, static_cast<int>(documents.size()));
    for (const auto* doc : documents) {
        GraphNode node;
        node.id = document_node_id(doc->id);
        node.label = doc->title;
        node.node_type = NodeType::DOCUMENT;
        node.document_id = doc->id;
        node.summary = doc->summary;
        node.topics = doc->topics;
        graph.add_node(node);
    }

    add_derived_nodes(graph, documents, query);
    add_similarity_edges(graph, corpus, documents, query);

    KnowledgeGraphMeta meta;
    meta.total_documents = documents.size();
    meta.similarity_threshold = query.threshold;
    meta.max_edges_per_node = query.max_edges;
    graph.set_meta(meta);

    return graph;
}

std::vector<const DocumentRecord*> GraphBuilder::select_documents(const CorpusSnapshot& corpus,
                                                                  int max_documents) const {
    auto documents = corpus.documents();
    std::sort(documents.begin(), documents.end(), [](const DocumentRecord* a, const DocumentRecord* b) {
        if (a->updated_at != b->updated_at) return a->updated_at > b->updated_at;
        return a->id < b->id;
    });
    if (documents.size() > static_cast<size_t>(max_documents)) {
        documents.resize(max_documents);
    }
    return documents;
}

void GraphBuilder::add_derived_nodes(KnowledgeGraph& graph,
                                     const std::vector<const DocumentRecord*>& documents,
                                     const KnowledgeGraphQuery& query) const {
    struct DerivedSource {
        NodeType type;
        bool enabled;
        std::vector<std::string> DocumentRecord::*labels;
    };
    const DerivedSource sources[] = {
        {NodeType::TOPIC, query.include_topics, &DocumentRecord::topics},
        {NodeType::TECHNOLOGY, query.include_technologies, &DocumentRecord::technologies},
        {NodeType::INSIGHT, query.include_insights, &DocumentRecord::insights},
    };

    for (const auto& source : sources) {
        if (!source.enabled) continue;

        // slug -> first-seen label, and the documents referencing it
        std::map<std::string, std::string> labels;
        std::map<std::string, std::vector<std::string>> referencing;

        for (const auto* doc : documents) {
            std::set<std::string> seen;
            for (const auto& raw : doc->*source.labels) {
                std::string label = trim_copy(raw);
                std::string slug = normalize_label(label);
                if (slug.empty() || !seen.insert(slug).second) continue;

                labels.emplace(slug, label);
                referencing[slug].push_back(doc->id);
            }
        }

        for (const auto& [slug, label] : labels) {
            GraphNode node;
            node.id = derived_node_id(source.type, slug);
            node.label = label;
            node.node_type = source.type;
            node.document_count = static_cast<int>(referencing[slug].size());
            graph.add_node(node);
        }

        for (const auto* doc : documents) {
            std::set<std::string> seen;
            for (const auto& raw : doc->*source.labels) {
                std::string slug = normalize_label(trim_copy(raw));
                if (slug.empty() || !seen.insert(slug).second) continue;

                GraphEdge edge;
                edge.source = document_node_id(doc->id);
                edge.target = derived_node_id(source.type, slug);
                edge.weight = 1.0;
                edge.kind = EdgeKind::MEMBERSHIP;
                graph.add_edge(edge);
            }
        }
    }
}

void GraphBuilder::add_similarity_edges(KnowledgeGraph& graph,
                                        const CorpusSnapshot& corpus,
                                        const std::vector<const DocumentRecord*>& documents,
                                        const KnowledgeGraphQuery& query) const {
    BruteForceSimilarityIndex index;
    for (const auto* doc : documents) {
        if (const auto* vec = corpus.embedding_for(doc->id)) {
            index.add(doc->id, *vec);
        }
    }
    if (index.size() < 2) {
        return;
    }

    struct Candidate {
        std::string source;
        std::string target;
        double weight;
    };

    // Unordered pair -> candidate, so A->B and B->A collapse into one
    std::map<std::pair<std::string, std::string>, Candidate> candidates;

    const int total = static_cast<int>(documents.size());
    int processed = 0;
    for (const auto* doc : documents) {
        report("similarity", ++processed, total);

        const auto* vec = index.get(doc->id);
        if (!vec) continue;

        auto hits = index.top_similar(*vec, static_cast<size_t>(query.max_edges), query.threshold, doc->id);
        for (const auto& hit : hits) {
            auto key = doc->id < hit.id ? std::make_pair(doc->id, hit.id) : std::make_pair(hit.id, doc->id);
            candidates.emplace(key, Candidate{doc->id, hit.id, hit.similarity});
        }
    }

    std::vector<Candidate> ordered;
    ordered.reserve(candidates.size());
    for (const auto& [key, candidate] : candidates) {
        ordered.push_back(candidate);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Candidate& a, const Candidate& b) {
        return a.weight > b.weight;
    });

    std::map<std::string, int> degree;
    for (const auto& c : ordered) {
        if (degree[c.source] >= query.max_edges || degree[c.target] >= query.max_edges) {
            continue;
        }
        degree[c.source]++;
        degree[c.target]++;

        GraphEdge edge;
        edge.source = document_node_id(c.source);
        edge.target = document_node_id(c.target);
        edge.weight = std::min(1.0, std::max(0.0, c.weight));
        edge.label = std::to_string(static_cast<int>(std::lround(c.weight * 100.0))) + "%";
        edge.kind = EdgeKind::SIMILARITY;
        graph.add_edge(edge);
    }
}

} // namespace sem
