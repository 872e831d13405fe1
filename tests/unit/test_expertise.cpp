#include <gtest/gtest.h>
#include "expertise/expertise_aggregator.hpp"
#include "graph/graph_builder.hpp"
#include "core/errors.hpp"

using namespace sem;

// ==========================================
// Level Boundary Tests
// ==========================================

TEST(ExpertiseLevelTest, ExactBoundaries) {
    EXPECT_EQ(expertise_level_from_doc_count(0), ExpertiseLevel::BEGINNER);
    EXPECT_EQ(expertise_level_from_doc_count(2), ExpertiseLevel::BEGINNER);
    EXPECT_EQ(expertise_level_from_doc_count(3), ExpertiseLevel::INTERMEDIATE);
    EXPECT_EQ(expertise_level_from_doc_count(7), ExpertiseLevel::INTERMEDIATE);
    EXPECT_EQ(expertise_level_from_doc_count(8), ExpertiseLevel::ADVANCED);
    EXPECT_EQ(expertise_level_from_doc_count(15), ExpertiseLevel::ADVANCED);
    EXPECT_EQ(expertise_level_from_doc_count(16), ExpertiseLevel::EXPERT);
    EXPECT_EQ(expertise_level_from_doc_count(1000000), ExpertiseLevel::EXPERT);
}

TEST(ExpertiseLevelTest, StringConversion) {
    EXPECT_EQ(expertise_level_to_string(ExpertiseLevel::ADVANCED), "advanced");
    EXPECT_EQ(string_to_expertise_level("Intermediate"), ExpertiseLevel::INTERMEDIATE);
    EXPECT_THROW(string_to_expertise_level("guru"), ValidationError);
}

TEST(ExpertiseLevelTest, EntryLevelFollowsCount) {
    ExpertiseEntry entry;
    entry.document_count = 8;
    EXPECT_EQ(entry.level(), ExpertiseLevel::ADVANCED);
    entry.document_count = 7;
    EXPECT_EQ(entry.level(), ExpertiseLevel::INTERMEDIATE);
    EXPECT_EQ(entry.to_json()["level"], "intermediate");
}

// ==========================================
// Aggregation Tests
// ==========================================

class ExpertiseAggregatorTest : public ::testing::Test {
protected:
    std::vector<DocumentRecord> records;

    void SetUp() override {
        // alice: four Rust documents, two of them also about Tokio
        for (int i = 0; i < 4; ++i) {
            add("a" + std::to_string(i), 1, "alice", {"Systems"}, i < 2 ? std::vector<std::string>{"Rust", "Tokio"}
                                                                         : std::vector<std::string>{"Rust"});
        }
        // bob: one Rust document and one Python document
        add("b0", 2, "bob", {"Systems"}, {"rust"});
        add("b1", 2, "bob", {"Data"}, {"Python"});

        // No author: ignored
        DocumentRecord orphan;
        orphan.id = "x";
        orphan.topics = {"Orphaned"};
        records.push_back(orphan);
    }

    void add(const std::string& id, int user_id, const std::string& name,
             std::vector<std::string> topics, std::vector<std::string> technologies) {
        DocumentRecord doc;
        doc.id = id;
        doc.title = id;
        doc.topics = std::move(topics);
        doc.technologies = std::move(technologies);
        doc.author = Author{user_id, name, name + "@example.com"};
        records.push_back(doc);
    }

    std::vector<const DocumentRecord*> pointers() const {
        std::vector<const DocumentRecord*> out;
        for (const auto& r : records) out.push_back(&r);
        return out;
    }
};

TEST_F(ExpertiseAggregatorTest, GroupsByMemberAndArea) {
    ExpertiseAggregator aggregator;
    TeamExpertiseMap map = aggregator.aggregate(pointers());

    ASSERT_EQ(map.members.size(), 2);
    const auto* alice = map.find_member(1);
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->username, "alice");
    EXPECT_EQ(alice->email, "alice@example.com");
    EXPECT_EQ(alice->total_documents, 4);

    ASSERT_FALSE(alice->expertise_areas.empty());
    // Count descending, then name: Rust(4), Systems(4), Tokio(2)
    EXPECT_EQ(alice->expertise_areas[0].topic, "Rust");
    EXPECT_EQ(alice->expertise_areas[0].document_count, 4);
    EXPECT_EQ(alice->expertise_areas[0].level(), ExpertiseLevel::INTERMEDIATE);
    EXPECT_EQ(alice->expertise_areas[1].topic, "Systems");
    EXPECT_EQ(alice->expertise_areas[2].topic, "Tokio");
    EXPECT_EQ(alice->expertise_areas[2].level(), ExpertiseLevel::BEGINNER);

    ASSERT_EQ(alice->top_technologies.size(), 2);
    EXPECT_EQ(alice->top_technologies[0], "Rust");
    EXPECT_EQ(alice->top_topics, std::vector<std::string>{"Systems"});

    EXPECT_EQ(map.find_member(99), nullptr);
}

TEST_F(ExpertiseAggregatorTest, SharedAndUniqueAreas) {
    ExpertiseAggregator aggregator;
    TeamExpertiseMap map = aggregator.aggregate(pointers());

    // "rust" and "Rust" normalize to the same area
    EXPECT_EQ(map.shared_areas, (std::vector<std::string>{"Rust", "Systems"}));

    ASSERT_EQ(map.unique_experts.size(), 3);
    EXPECT_EQ(map.unique_experts[0].area, "Data");
    EXPECT_EQ(map.unique_experts[0].expert_name, "bob");
    EXPECT_EQ(map.unique_experts[1].area, "Python");
    EXPECT_EQ(map.unique_experts[2].area, "Tokio");
    EXPECT_EQ(map.unique_experts[2].expert_user_id, 1);
}

TEST_F(ExpertiseAggregatorTest, EntriesCoverEveryPair) {
    ExpertiseAggregator aggregator;
    TeamExpertiseMap map = aggregator.aggregate(pointers());

    // alice: Systems, Rust, Tokio; bob: Systems, Data, rust, Python
    EXPECT_EQ(map.entries.size(), 7);
    for (const auto& entry : map.entries) {
        EXPECT_GT(entry.document_count, 0);
    }
}

TEST_F(ExpertiseAggregatorTest, AreasCappedPerMember) {
    DocumentRecord doc;
    doc.id = "many";
    doc.author = Author{3, "carol", ""};
    for (int i = 0; i < 15; ++i) doc.topics.push_back("Topic " + std::to_string(i));
    records.push_back(doc);

    ExpertiseAggregator aggregator;
    TeamExpertiseMap map = aggregator.aggregate(pointers());
    const auto* carol = map.find_member(3);
    ASSERT_NE(carol, nullptr);
    EXPECT_EQ(carol->expertise_areas.size(), 10);
    EXPECT_EQ(carol->top_topics.size(), 5);
}

TEST(ExpertiseEmptyTest, NoDocuments) {
    ExpertiseAggregator aggregator;
    TeamExpertiseMap map = aggregator.aggregate({});
    EXPECT_TRUE(map.members.empty());
    EXPECT_TRUE(map.entries.empty());
    EXPECT_TRUE(map.shared_areas.empty());
}

// ==========================================
// Graph Merge Tests
// ==========================================

TEST_F(ExpertiseAggregatorTest, MergeAddsPersonNodesAndEdges) {
    CorpusSnapshot corpus;
    for (const auto& r : records) corpus.add_document(r);

    KnowledgeGraph graph = GraphBuilder().build(corpus, KnowledgeGraphQuery());

    ExpertiseAggregator aggregator;
    aggregator.merge_into_graph(graph, aggregator.aggregate(corpus.documents()));

    const auto* alice = graph.get_node("person-1");
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->node_type, NodeType::PERSON);
    EXPECT_EQ(alice->label, "alice");
    EXPECT_EQ(alice->document_count, 4);
    EXPECT_FALSE(alice->to_json().contains("document_id"));
    ASSERT_NE(graph.get_node("person-2"), nullptr);

    // alice holds Rust and Systems at Intermediate (4 documents)
    EXPECT_TRUE(graph.has_edge_between("person-1", "tech-rust"));
    EXPECT_TRUE(graph.has_edge_between("person-1", "topic-systems"));
    // Beginner areas get no edge
    EXPECT_FALSE(graph.has_edge_between("person-1", "tech-tokio"));
    EXPECT_EQ(graph.degree("person-2", EdgeKind::EXPERTISE), 0);

    for (const auto& edge : graph.edges()) {
        if (edge.kind != EdgeKind::EXPERTISE) continue;
        EXPECT_DOUBLE_EQ(edge.weight, 1.0);  // 4 / max count 4
        EXPECT_FALSE(edge.label.has_value());
    }

    std::string error;
    EXPECT_TRUE(graph.validate(error)) << error;
}

TEST_F(ExpertiseAggregatorTest, MergeSkipsAreasMissingFromGraph) {
    CorpusSnapshot corpus;
    for (const auto& r : records) corpus.add_document(r);

    KnowledgeGraphQuery query;
    query.include_technologies = false;
    KnowledgeGraph graph = GraphBuilder().build(corpus, query);

    ExpertiseAggregator aggregator;
    aggregator.merge_into_graph(graph, aggregator.aggregate(corpus.documents()));

    EXPECT_FALSE(graph.has_node("tech-rust"));
    EXPECT_TRUE(graph.has_edge_between("person-1", "topic-systems"));
    EXPECT_EQ(graph.degree("person-1", EdgeKind::EXPERTISE), 1);
}
