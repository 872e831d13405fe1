#include "engine/analytics_engine.hpp"
#include <iostream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>

using namespace sem;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

DocumentRecord make_doc(const std::string& id,
                        const std::string& title,
                        std::vector<std::string> topics,
                        std::vector<std::string> technologies,
                        int user_id,
                        const std::string& username,
                        const std::string& created) {
    DocumentRecord doc;
    doc.id = id;
    doc.title = title;
    doc.topics = std::move(topics);
    doc.technologies = std::move(technologies);
    doc.author = Author{user_id, username, username + "@example.com"};
    doc.created_at = parse_iso8601(created);
    doc.updated_at = doc.created_at;
    doc.content_length = 1200;
    doc.word_count = 200;
    return doc;
}

int main() {
    print_separator("Semantic Analytics Example - Team Knowledge Base");

    const std::string output_dir = "output_json";
    mkdir(output_dir.c_str(), 0755);

    // Small hand-made corpus: two themes (backend services, data pipelines)
    auto corpus = std::make_shared<CorpusSnapshot>();
    corpus->add_document(
        make_doc("d1", "Async Rust services", {"Concurrency", "Web services"}, {"Rust", "Tokio"}, 1, "alice", "2024-05-01"),
        {0.90f, 0.10f, 0.00f, 0.05f});
    corpus->add_document(
        make_doc("d2", "Tokio runtime internals", {"Concurrency"}, {"Rust", "Tokio"}, 1, "alice", "2024-05-10"),
        {0.85f, 0.15f, 0.05f, 0.00f});
    corpus->add_document(
        make_doc("d3", "HTTP API design", {"Web services"}, {"Rust", "Axum"}, 2, "bob", "2024-05-20"),
        {0.80f, 0.20f, 0.10f, 0.10f});
    corpus->add_document(
        make_doc("d4", "Batch ETL with Spark", {"Data pipelines"}, {"Spark", "Python"}, 2, "bob", "2024-05-25"),
        {0.05f, 0.10f, 0.90f, 0.20f});
    corpus->add_document(
        make_doc("d5", "Streaming ingestion", {"Data pipelines", "Streaming"}, {"Kafka", "Python"}, 3, "carol", "2024-06-01"),
        {0.10f, 0.05f, 0.85f, 0.30f});
    corpus->add_document(
        make_doc("d6", "Warehouse modelling", {"Data pipelines"}, {"SQL"}, 3, "carol", "2024-06-05"),
        {0.00f, 0.10f, 0.80f, 0.25f});

    EngineConfig config;
    AnalyticsEngine engine(corpus, config);

    // 1. Knowledge graph
    std::cout << "1. Building knowledge graph (threshold 0.5, 3 edges per document)...\n";
    KnowledgeGraphQuery query = engine.default_graph_query();
    query.max_edges = 3;
    query.include_people = true;

    KnowledgeGraph graph = engine.build_graph(query);
    auto stats = graph.compute_statistics();
    std::cout << "   Nodes: " << stats.num_nodes << ", edges: " << stats.num_edges << "\n";
    for (const auto& [type, count] : stats.nodes_by_type) {
        std::cout << "   - " << type << ": " << count << "\n";
    }

    graph.export_to_json(output_dir + "/knowledge_graph.json");
    graph.export_to_dot(output_dir + "/knowledge_graph.dot");
    std::cout << "   Exported to " << output_dir << "/knowledge_graph.{json,dot}\n";

    // 2. Similar documents
    std::cout << "\n2. Documents similar to d1:\n";
    for (const auto& sim : engine.find_similar_documents("d1", 3, 0.5)) {
        std::cout << "   " << std::fixed << std::setprecision(3) << sim.similarity_score
                  << "  " << sim.title << "\n";
    }

    // 3. Clustering
    std::cout << "\n3. Clustering into 2 groups...\n";
    ClusteringJob job = engine.start_clustering(DocumentsScope{}, 2, ClusteringAlgorithm::KMEANS);
    job = engine.wait_for_clustering_job(job.id);
    std::cout << "   Job " << job.id << ": " << job_status_to_string(job.status) << "\n";

    if (auto result = engine.get_clustering_result(job.id)) {
        for (const auto& cluster : result->clusters) {
            std::cout << "   " << cluster.name << " -> ";
            for (const auto& id : cluster.member_document_ids) std::cout << id << " ";
            std::cout << "\n";
        }
        std::cout << "   Silhouette: " << result->metrics.silhouette_score << "\n";
    } else if (job.error_message) {
        std::cout << "   Failed: " << *job.error_message << "\n";
    }

    // 4. Expertise
    std::cout << "\n4. Team expertise:\n";
    TeamExpertiseMap map = engine.build_team_expertise_map();
    for (const auto& member : map.members) {
        std::cout << "   " << member.username << " (" << member.total_documents << " docs)";
        if (!member.expertise_areas.empty()) {
            const auto& top = member.expertise_areas.front();
            std::cout << " - strongest: " << top.topic << " [" << expertise_level_to_string(top.level()) << "]";
        }
        std::cout << "\n";
    }

    // 5. Trends over the 60 days before June 10th
    std::cout << "\n5. Trends (60 days to 2024-06-10):\n";
    TrendAnalysis trends = engine.get_trend_analysis(60, parse_iso8601("2024-06-10"));
    for (const auto& topic : trends.trending_topics) {
        std::cout << "   " << topic.topic << ": " << topic.count << " ("
                  << trend_direction_to_string(topic.trend_direction) << ")\n";
    }

    print_separator("Done");
    return 0;
}
