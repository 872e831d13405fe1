#include "cli/cli.hpp"
#include "engine/analytics_engine.hpp"
#include "engine/engine_config.hpp"
#include "provider/embedding_provider.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <climits>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

using namespace sem;

// ============== Helper Functions ==============

EngineConfig load_cli_config(const ParsedOptions& args) {
    EngineConfig config = load_config_with_fallback(args.text("config").value_or(""));
    if (args.flag("verbose")) {
        config.verbose = true;
        config.embedding.verbose = true;
    }

    std::string error;
    if (!config.validate(error)) {
        throw ValidationError("Invalid configuration: " + error);
    }
    return config;
}

std::unique_ptr<AnalyticsEngine> load_engine(const ParsedOptions& args, const EngineConfig& config) {
    std::string input_path = args.require("input");
    JsonCorpusProvider provider(input_path);
    auto engine = AnalyticsEngine::from_provider(provider, config);

    if (config.verbose) {
        engine->set_progress_callback([](const std::string& stage, int current, int total) {
            std::cerr << "  [" << stage << "] " << current << "/" << total << "\n";
        });
    }
    return engine;
}

// Write JSON to --output when given, stdout otherwise
void emit_json(const nlohmann::json& j, const ParsedOptions& args) {
    if (auto path_arg = args.text("output")) {
        const std::string& path = *path_arg;
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + path);
        }
        file << j.dump(2);
        std::cout << "Wrote " << path << "\n";
    } else {
        std::cout << j.dump(2) << "\n";
    }
}

std::string format_percent(double value) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << value * 100.0 << "%";
    return ss.str();
}

// ============== semantica graph ==============
int cmd_graph(const ParsedOptions& args) {
    EngineConfig config = load_cli_config(args);
    auto engine = load_engine(args, config);

    KnowledgeGraphQuery query = engine->default_graph_query();
    query.threshold = args.number("threshold").value_or(query.threshold);
    query.max_edges = args.integer("max-edges").value_or(query.max_edges);
    query.max_documents = args.integer("max-documents").value_or(query.max_documents);
    query.include_topics = !args.flag("no-topics");
    query.include_technologies = !args.flag("no-technologies");
    query.include_insights = args.flag("insights");
    query.include_people = args.flag("people");

    std::string format = args.require("format");

    KnowledgeGraph graph = engine->build_graph(query);
    std::string output_path = args.require("output");

    if (format == "dot") {
        graph.export_to_dot(output_path);
    } else {
        graph.export_to_json(output_path);
    }

    auto stats = graph.compute_statistics();
    std::cout << "Knowledge graph: " << stats.num_nodes << " nodes, " << stats.num_edges << " edges\n";
    for (const auto& [type, count] : stats.nodes_by_type) {
        std::cout << "  " << type << ": " << count << "\n";
    }
    std::cout << "Saved to: " << output_path << "\n";
    return 0;
}

// ============== semantica similar ==============
int cmd_similar(const ParsedOptions& args) {
    EngineConfig config = load_cli_config(args);
    auto engine = load_engine(args, config);

    std::string document_id = args.require("document");
    auto results = engine->find_similar_documents(document_id, args.integer("limit"),
                                                  args.number("min-similarity"));

    if (args.flag("json")) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& r : results) j.push_back(r.to_json());
        emit_json(j, args);
        return 0;
    }

    std::cout << "Documents similar to " << document_id << ":\n";
    if (results.empty()) {
        std::cout << "  (none above threshold)\n";
    }
    for (const auto& r : results) {
        std::cout << "  " << format_percent(r.similarity_score) << "  " << r.title
                  << " [" << r.document_id << "]";
        if (!r.shared_keywords.empty()) {
            std::cout << "  shared: ";
            for (size_t i = 0; i < r.shared_keywords.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << r.shared_keywords[i];
            }
        }
        std::cout << "\n";
    }
    return 0;
}

// ============== semantica cluster ==============
int cmd_cluster(const ParsedOptions& args) {
    EngineConfig config = load_cli_config(args);
    auto engine = load_engine(args, config);

    DocumentsScope scope;
    scope.category_id = args.integer("category");
    scope.document_ids = args.id_list("documents");
    ClusteringAlgorithm algorithm = string_to_clustering_algorithm(args.require("algorithm"));

    ClusteringJob job = engine->start_clustering(scope, args.integer("k"), algorithm);
    std::cout << "Submitted clustering job " << job.id << "\n";

    job = engine->wait_for_clustering_job(job.id);
    if (job.status == JobStatus::FAILED) {
        std::cerr << "Error: clustering job failed: " << job.error_message.value_or("unknown error") << "\n";
        return 1;
    }

    auto result = engine->get_clustering_result(job.id);
    if (!result) {
        throw InternalError("Completed job has no result: " + job.id);
    }

    if (args.has("output")) {
        nlohmann::json j = job.to_json();
        j["result"] = result->to_json();
        emit_json(j, args);
    }

    std::cout << "\nClusters (" << clustering_algorithm_to_string(result->algorithm) << ", "
              << result->iterations << " iterations):\n";
    for (const auto& cluster : result->clusters) {
        std::cout << "  " << cluster.name << " (" << cluster.member_document_ids.size() << " documents)\n";
    }
    std::cout << "\nSilhouette score: " << std::fixed << std::setprecision(3)
              << result->metrics.silhouette_score << "\n";
    std::cout << "Inertia: " << result->metrics.inertia << "\n";
    return 0;
}

// ============== semantica expertise ==============
int cmd_expertise(const ParsedOptions& args) {
    EngineConfig config = load_cli_config(args);
    auto engine = load_engine(args, config);

    TeamExpertiseMap map = engine->build_team_expertise_map();

    if (args.has("output")) {
        emit_json(map.to_json(), args);
    }

    std::cout << "Team expertise (" << map.members.size() << " members):\n";
    for (const auto& member : map.members) {
        std::cout << "\n  " << (member.username.empty() ? std::to_string(member.user_id) : member.username)
                  << " - " << member.total_documents << " documents\n";
        for (const auto& area : member.expertise_areas) {
            std::cout << "    " << area.topic << ": " << expertise_level_to_string(area.level())
                      << " (" << area.document_count << ")\n";
        }
    }

    if (!map.unique_experts.empty()) {
        std::cout << "\nSingle-expert areas:\n";
        for (const auto& u : map.unique_experts) {
            std::cout << "  " << u.area << " -> " << u.expert_name << "\n";
        }
    }
    return 0;
}

// ============== semantica trends ==============
int cmd_trends(const ParsedOptions& args) {
    EngineConfig config = load_cli_config(args);
    auto engine = load_engine(args, config);

    int days = args.integer("days").value_or(30);
    std::optional<Timestamp> now;
    if (auto when = args.text("now")) now = parse_iso8601(*when);

    TrendAnalysis analysis = engine->get_trend_analysis(days, now);

    if (args.has("output")) {
        emit_json(analysis.to_json(), args);
    }

    std::cout << "Trends " << format_iso8601(analysis.period_start) << " .. "
              << format_iso8601(analysis.period_end) << " (by "
              << trend_granularity_to_string(analysis.granularity) << ")\n";
    std::cout << "\nTopics:\n";
    for (const auto& t : analysis.trending_topics) {
        std::cout << "  " << t.topic << ": " << t.count << " documents, growth "
                  << format_percent(t.growth_rate) << " (" << trend_direction_to_string(t.trend_direction) << ")\n";
    }
    std::cout << "\nKeywords:\n";
    for (const auto& k : analysis.trending_keywords) {
        std::cout << "  " << k.keyword << ": " << k.count << ", growth " << format_percent(k.growth_rate) << "\n";
    }
    return 0;
}

// ============== semantica anomalies ==============
int cmd_anomalies(const ParsedOptions& args) {
    EngineConfig config = load_cli_config(args);
    auto engine = load_engine(args, config);

    auto anomalies = engine->detect_anomalies(args.integer("category"));

    if (args.has("output")) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& a : anomalies) j.push_back(a.to_json());
        emit_json(j, args);
    }

    std::cout << "Anomalies: " << anomalies.size() << "\n";
    for (const auto& a : anomalies) {
        std::cout << "  [" << anomaly_type_to_string(a.anomaly_type) << "] " << a.title
                  << " (score " << std::fixed << std::setprecision(2) << a.anomaly_score << ")\n";
        std::cout << "      " << a.explanation << "\n";
    }
    return 0;
}

// ============== semantica embed ==============
int cmd_embed(const ParsedOptions& args) {
    EngineConfig config = load_cli_config(args);
    std::string input_path = args.require("input");
    std::string output_path = args.require("output");
    int batch_size = args.integer("batch-size").value_or(16);
    bool force = args.flag("force");

    EmbeddingConfig embedding = config.embedding;
    if (embedding.api_key.empty()) {
        embedding.api_key = get_api_key_from_env("SEM_EMBEDDING_API_KEY");
    }
    if (embedding.api_key.empty()) {
        embedding.api_key = get_api_key_from_env("OPENAI_API_KEY");
    }

    auto provider = EmbeddingProviderFactory::create(embedding.provider, embedding);
    if (!provider->is_configured()) {
        std::cerr << "Error: no embedding API key configured.\n";
        std::cerr << "Set SEM_EMBEDDING_API_KEY or OPENAI_API_KEY, or pass --config.\n";
        return 1;
    }

    std::cout << "Loading corpus from: " << input_path << "\n";
    CorpusSnapshot corpus = CorpusSnapshot::load_from_json(input_path);

    std::vector<std::string> ids;
    std::vector<std::string> texts;
    for (const auto* doc : corpus.documents()) {
        if (!force && corpus.embedding_for(doc->id)) continue;

        std::string text = doc->content;
        if (text.empty()) {
            text = doc->title;
            if (doc->summary) text += "\n\n" + *doc->summary;
        }
        ids.push_back(doc->id);
        texts.push_back(text);
    }

    std::cout << "Embedding " << texts.size() << " documents with " << provider->get_provider_name()
              << " (" << provider->get_model() << ")\n";

    for (size_t start = 0; start < texts.size(); start += static_cast<size_t>(batch_size)) {
        size_t end = std::min(texts.size(), start + static_cast<size_t>(batch_size));
        std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

        auto vectors = provider->embed_batch(batch);
        for (size_t i = 0; i < vectors.size(); ++i) {
            corpus.set_embedding(ids[start + i], vectors[i]);
        }
        std::cout << "  " << end << "/" << texts.size() << "\n";
    }

    corpus.save_to_json(output_path);
    std::cout << "Saved to: " << output_path << "\n";
    return 0;
}

// ============== semantica stats ==============
int cmd_stats(const ParsedOptions& args) {
    std::string input_path = args.require("input");

    std::cout << "Loading corpus from: " << input_path << "\n";
    CorpusSnapshot corpus = CorpusSnapshot::load_from_json(input_path);

    auto documents = corpus.documents();
    size_t with_author = 0;
    std::map<int, size_t> by_category;
    for (const auto* doc : documents) {
        if (doc->author) ++with_author;
        if (doc->category_id) ++by_category[*doc->category_id];
    }

    std::cout << "\nCorpus Statistics:\n";
    std::cout << "  Documents: " << corpus.num_documents() << "\n";
    std::cout << "  Embedded: " << corpus.num_embeddings() << "\n";
    std::cout << "  Embedding dimension: " << corpus.embeddings().dimension() << "\n";
    std::cout << "  With author: " << with_author << "\n";

    if (!by_category.empty()) {
        std::cout << "\nBy category:\n";
        for (const auto& [category, count] : by_category) {
            std::cout << "  " << category << ": " << count << "\n";
        }
    }

    if (corpus.num_embeddings() > 0) {
        KnowledgeGraphQuery query;
        KnowledgeGraph graph = GraphBuilder().build(corpus, query);
        auto stats = graph.compute_statistics();
        std::cout << "\nSimilarity (threshold " << query.threshold << ", max " << query.max_edges << " edges):\n";
        std::cout << "  Similarity edges: " << stats.edges_by_kind["similarity"] << "\n";
        std::cout << "  Avg degree: " << stats.avg_similarity_degree << "\n";
        std::cout << "  Isolated documents: " << stats.isolated_documents << "\n";
    }

    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("semantica", "1.0.0");

    const OptionSpec input_opt = OptionSpec::text("input", "i", "Corpus snapshot JSON file", true);
    const OptionSpec config_opt = OptionSpec::text("config", "c", "Config file (default: .semantica.json or environment)");
    const OptionSpec verbose_opt = OptionSpec::flag("verbose", "V", "Verbose logging to stderr");
    const std::vector<std::string> algorithms = {"kmeans", "dbscan", "hierarchical", "spectral"};

    cli.register_command({
        "graph",
        "Build the knowledge graph of a corpus",
        {
            input_opt,
            OptionSpec::text("output", "o", "Output file", true),
            OptionSpec::choice("format", "f", "Output format", {"json", "dot"}, "json"),
            OptionSpec::number("threshold", "t", "Minimum similarity for document edges", 0.0, 1.0),
            OptionSpec::integer("max-edges", "e", "Similarity edges per document", 1, 20),
            OptionSpec::integer("max-documents", "m", "Documents to include, most recently updated first", 1, INT_MAX),
            OptionSpec::flag("no-topics", "", "Leave out topic nodes"),
            OptionSpec::flag("no-technologies", "", "Leave out technology nodes"),
            OptionSpec::flag("insights", "", "Include insight nodes"),
            OptionSpec::flag("people", "p", "Include team members linked to their expertise"),
            config_opt,
            verbose_opt
        },
        cmd_graph
    });

    cli.register_command({
        "similar",
        "Find documents similar to a given document",
        {
            input_opt,
            OptionSpec::text("document", "d", "Document id", true),
            OptionSpec::integer("limit", "l", "Maximum results", 1, INT_MAX),
            OptionSpec::number("min-similarity", "s", "Minimum cosine similarity", -1.0, 1.0),
            OptionSpec::flag("json", "j", "Print results as JSON"),
            OptionSpec::text("output", "o", "Write JSON results to file"),
            config_opt,
            verbose_opt
        },
        cmd_similar
    });

    cli.register_command({
        "cluster",
        "Cluster documents by embedding and print the result",
        {
            input_opt,
            OptionSpec::integer("k", "k", "Number of clusters", 1, INT_MAX),
            OptionSpec::choice("algorithm", "a", "Clustering algorithm", algorithms, "kmeans"),
            OptionSpec::integer("category", "g", "Only cluster documents of this category id", INT_MIN, INT_MAX),
            OptionSpec::id_list("documents", "d", "Document ids to cluster"),
            OptionSpec::text("output", "o", "Write job and result JSON to file"),
            config_opt,
            verbose_opt
        },
        cmd_cluster
    });

    cli.register_command({
        "expertise",
        "Build the team expertise map",
        {
            input_opt,
            OptionSpec::text("output", "o", "Write JSON map to file"),
            config_opt,
            verbose_opt
        },
        cmd_expertise
    });

    cli.register_command({
        "trends",
        "Report trending topics and keywords",
        {
            input_opt,
            OptionSpec::integer("days", "n", "Window length in days", 1, 36500, "30"),
            OptionSpec::text("now", "w", "End of window, ISO-8601 (default: current time)"),
            OptionSpec::text("output", "o", "Write JSON report to file"),
            config_opt,
            verbose_opt
        },
        cmd_trends
    });

    cli.register_command({
        "anomalies",
        "Detect documents that deviate from the corpus baseline",
        {
            input_opt,
            OptionSpec::integer("category", "g", "Only consider documents of this category id", INT_MIN, INT_MAX),
            OptionSpec::text("output", "o", "Write JSON results to file"),
            config_opt,
            verbose_opt
        },
        cmd_anomalies
    });

    cli.register_command({
        "embed",
        "Generate embeddings for a corpus using the configured provider",
        {
            input_opt,
            OptionSpec::text("output", "o", "Output corpus JSON file", true),
            OptionSpec::integer("batch-size", "b", "Texts per embedding request", 1, 2048, "16"),
            OptionSpec::flag("force", "F", "Re-embed documents that already have a vector"),
            config_opt,
            verbose_opt
        },
        cmd_embed
    });

    cli.register_command({
        "stats",
        "Print statistics about a corpus snapshot",
        {
            input_opt
        },
        cmd_stats
    });

    return cli.run(argc, argv);
}
