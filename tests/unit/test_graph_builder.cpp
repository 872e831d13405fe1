#include <gtest/gtest.h>
#include "graph/graph_builder.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <random>
#include <set>

using namespace sem;

namespace {

DocumentRecord make_doc(const std::string& id,
                        std::vector<std::string> topics = {},
                        std::vector<std::string> technologies = {},
                        const std::string& updated = "2024-01-01") {
    DocumentRecord doc;
    doc.id = id;
    doc.title = "Document " + id;
    doc.topics = std::move(topics);
    doc.technologies = std::move(technologies);
    doc.created_at = parse_iso8601(updated);
    doc.updated_at = doc.created_at;
    return doc;
}

} // namespace

class GraphBuilderTest : public ::testing::Test {
protected:
    CorpusSnapshot corpus;

    void SetUp() override {
        // Twenty documents whose vectors all point into the positive orthant,
        // so most pairs clear the threshold and the degree cap is what binds
        std::mt19937 rng(7);
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        for (int i = 0; i < 20; ++i) {
            std::vector<float> vec(8);
            for (auto& v : vec) v = dist(rng);
            std::string id = "d" + std::to_string(i < 10 ? 0 : 1) + std::to_string(i % 10);
            corpus.add_document(make_doc(id, {i % 2 ? "Rust" : "Python"}, {"Linux"}), vec);
        }
    }
};

// ==========================================
// Similarity Edge Invariants
// ==========================================

TEST_F(GraphBuilderTest, DegreeCapThresholdAndNoDuplicates) {
    KnowledgeGraphQuery query;
    query.threshold = 0.5;
    query.max_edges = 5;

    GraphBuilder builder;
    KnowledgeGraph graph = builder.build(corpus, query);

    std::set<std::pair<std::string, std::string>> pairs;
    size_t similarity_edges = 0;
    for (const auto& edge : graph.edges()) {
        ASSERT_TRUE(graph.has_node(edge.source)) << edge.source;
        ASSERT_TRUE(graph.has_node(edge.target)) << edge.target;

        auto key = edge.source < edge.target ? std::make_pair(edge.source, edge.target)
                                             : std::make_pair(edge.target, edge.source);
        EXPECT_TRUE(pairs.insert(key).second) << "duplicate pair " << key.first << " -- " << key.second;

        if (edge.kind == EdgeKind::SIMILARITY) {
            similarity_edges++;
            EXPECT_GE(edge.weight, 0.5);
            EXPECT_LE(edge.weight, 1.0);
            ASSERT_TRUE(edge.label.has_value());
            EXPECT_EQ(*edge.label, std::to_string(static_cast<int>(std::lround(edge.weight * 100))) + "%");
        } else {
            EXPECT_DOUBLE_EQ(edge.weight, 1.0);
            EXPECT_FALSE(edge.label.has_value());
        }
    }
    EXPECT_GT(similarity_edges, 0);

    for (const auto* node : graph.nodes_of_type(NodeType::DOCUMENT)) {
        EXPECT_LE(graph.degree(node->id, EdgeKind::SIMILARITY), 5) << node->id;
    }

    std::string error;
    EXPECT_TRUE(graph.validate(error)) << error;
}

TEST_F(GraphBuilderTest, HighThresholdDropsEdges) {
    KnowledgeGraphQuery query;
    query.threshold = 1.0;
    query.include_topics = false;
    query.include_technologies = false;

    KnowledgeGraph graph = GraphBuilder().build(corpus, query);
    EXPECT_EQ(graph.num_edges(), 0);
    EXPECT_EQ(graph.num_nodes(), 20);
}

TEST_F(GraphBuilderTest, MetaReflectsQuery) {
    KnowledgeGraphQuery query;
    query.threshold = 0.7;
    query.max_edges = 3;
    query.max_documents = 8;

    KnowledgeGraph graph = GraphBuilder().build(corpus, query);
    EXPECT_EQ(graph.meta().total_documents, 8);
    EXPECT_DOUBLE_EQ(graph.meta().similarity_threshold, 0.7);
    EXPECT_EQ(graph.meta().max_edges_per_node, 3);
    EXPECT_EQ(graph.nodes_of_type(NodeType::DOCUMENT).size(), 8);
}

// ==========================================
// Query Validation Tests
// ==========================================

TEST_F(GraphBuilderTest, RejectsOutOfRangeQueries) {
    GraphBuilder builder;
    KnowledgeGraphQuery query;

    query.threshold = -0.1;
    EXPECT_THROW(builder.build(corpus, query), ValidationError);
    query.threshold = 1.5;
    EXPECT_THROW(builder.build(corpus, query), ValidationError);

    query = KnowledgeGraphQuery();
    query.max_edges = 0;
    EXPECT_THROW(builder.build(corpus, query), ValidationError);
    query.max_edges = 21;
    EXPECT_THROW(builder.build(corpus, query), ValidationError);
    query.max_edges = 20;
    EXPECT_NO_THROW(builder.build(corpus, query));

    query = KnowledgeGraphQuery();
    query.max_documents = 0;
    EXPECT_THROW(builder.build(corpus, query), ValidationError);
}

// ==========================================
// Node Selection Tests
// ==========================================

TEST(GraphBuilderSelectionTest, MostRecentlyUpdatedFirst) {
    CorpusSnapshot corpus;
    corpus.add_document(make_doc("old", {}, {}, "2023-01-01"));
    corpus.add_document(make_doc("new", {}, {}, "2024-06-01"));
    corpus.add_document(make_doc("mid", {}, {}, "2024-01-01"));

    KnowledgeGraphQuery query;
    query.max_documents = 2;
    KnowledgeGraph graph = GraphBuilder().build(corpus, query);

    EXPECT_TRUE(graph.has_node("doc-new"));
    EXPECT_TRUE(graph.has_node("doc-mid"));
    EXPECT_FALSE(graph.has_node("doc-old"));
}

TEST(GraphBuilderSelectionTest, DerivedNodesAndMembership) {
    CorpusSnapshot corpus;
    corpus.add_document(make_doc("1", {"Machine Learning", "  "}, {"Python"}), {1.0f, 0.0f});
    corpus.add_document(make_doc("2", {"machine learning", "Statistics"}, {"R", "Python"}), {0.9f, 0.1f});
    auto doc3 = make_doc("3", {"Statistics"});
    doc3.insights = {"Sampling bias matters"};
    corpus.add_document(doc3);

    KnowledgeGraphQuery query;
    query.include_insights = true;
    KnowledgeGraph graph = GraphBuilder().build(corpus, query);

    const auto* ml = graph.get_node("topic-machine-learning");
    ASSERT_NE(ml, nullptr);
    EXPECT_EQ(ml->label, "Machine Learning");
    EXPECT_EQ(ml->document_count, 2);
    EXPECT_FALSE(ml->document_id.has_value());

    const auto* python = graph.get_node("tech-python");
    ASSERT_NE(python, nullptr);
    EXPECT_EQ(python->node_type, NodeType::TECHNOLOGY);
    EXPECT_EQ(python->document_count, 2);

    ASSERT_NE(graph.get_node("insight-sampling-bias-matters"), nullptr);
    EXPECT_EQ(graph.nodes_of_type(NodeType::TOPIC).size(), 2);

    EXPECT_TRUE(graph.has_edge_between("doc-1", "topic-machine-learning"));
    EXPECT_TRUE(graph.has_edge_between("doc-2", "tech-r"));
    EXPECT_TRUE(graph.has_edge_between("doc-3", "insight-sampling-bias-matters"));

    // Document 3 has no embedding, so it only has membership edges
    EXPECT_EQ(graph.degree("doc-3", EdgeKind::SIMILARITY), 0);
    EXPECT_TRUE(graph.has_edge_between("doc-1", "doc-2"));

    const auto* doc1 = graph.get_node("doc-1");
    ASSERT_NE(doc1, nullptr);
    ASSERT_TRUE(doc1->document_id.has_value());
    EXPECT_EQ(*doc1->document_id, "1");
}

TEST(GraphBuilderSelectionTest, TopicsCanBeExcluded) {
    CorpusSnapshot corpus;
    corpus.add_document(make_doc("1", {"Rust"}, {"Tokio"}));

    KnowledgeGraphQuery query;
    query.include_topics = false;
    KnowledgeGraph graph = GraphBuilder().build(corpus, query);

    EXPECT_EQ(graph.nodes_of_type(NodeType::TOPIC).size(), 0);
    EXPECT_EQ(graph.nodes_of_type(NodeType::TECHNOLOGY).size(), 1);
}

TEST(GraphBuilderIdTest, NodeIds) {
    EXPECT_EQ(document_node_id("abc"), "doc-abc");
    EXPECT_EQ(derived_node_id(NodeType::TOPIC, "rust"), "topic-rust");
    EXPECT_EQ(derived_node_id(NodeType::TECHNOLOGY, "rust"), "tech-rust");
    EXPECT_EQ(derived_node_id(NodeType::INSIGHT, "x"), "insight-x");
    EXPECT_EQ(person_node_id(42), "person-42");
    EXPECT_THROW(derived_node_id(NodeType::PERSON, "x"), InternalError);
}
