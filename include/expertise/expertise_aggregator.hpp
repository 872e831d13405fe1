#pragma once

#include "core/document.hpp"
#include "graph/knowledge_graph.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sem {

enum class ExpertiseLevel {
    BEGINNER,
    INTERMEDIATE,
    ADVANCED,
    EXPERT
};

/**
 * @brief Map a document count to a level
 *
 * [0,2] Beginner, [3,7] Intermediate, [8,15] Advanced, 16+ Expert.
 * Negative counts map to Beginner.
 */
inline ExpertiseLevel expertise_level_from_doc_count(long long count) {
    if (count <= 2) return ExpertiseLevel::BEGINNER;
    if (count <= 7) return ExpertiseLevel::INTERMEDIATE;
    if (count <= 15) return ExpertiseLevel::ADVANCED;
    return ExpertiseLevel::EXPERT;
}

inline std::string expertise_level_to_string(ExpertiseLevel level) {
    switch (level) {
        case ExpertiseLevel::BEGINNER: return "beginner";
        case ExpertiseLevel::INTERMEDIATE: return "intermediate";
        case ExpertiseLevel::ADVANCED: return "advanced";
        case ExpertiseLevel::EXPERT: return "expert";
        default: return "beginner";
    }
}

/**
 * @throws ValidationError for unknown names
 */
ExpertiseLevel string_to_expertise_level(const std::string& s);

enum class ExpertiseAreaKind {
    TOPIC,
    TECHNOLOGY
};

/**
 * @brief One (user, area) pair with the number of distinct documents behind it
 *
 * The level is always derived from document_count, never stored.
 */
struct ExpertiseEntry {
    int user_id = 0;
    std::string topic;
    ExpertiseAreaKind kind = ExpertiseAreaKind::TOPIC;
    int document_count = 0;

    ExpertiseLevel level() const { return expertise_level_from_doc_count(document_count); }

    nlohmann::json to_json() const;
};

struct MemberExpertise {
    int user_id = 0;
    std::string username;
    std::string email;
    std::vector<ExpertiseEntry> expertise_areas;   // Count descending, capped
    int total_documents = 0;
    std::vector<std::string> top_technologies;
    std::vector<std::string> top_topics;

    nlohmann::json to_json() const;
};

struct UniqueExpert {
    std::string area;
    int expert_user_id = 0;
    std::string expert_name;

    nlohmann::json to_json() const {
        return {{"area", area}, {"expert_user_id", expert_user_id}, {"expert_name", expert_name}};
    }
};

struct TeamExpertiseMap {
    std::vector<MemberExpertise> members;          // By user id
    std::vector<ExpertiseEntry> entries;           // Every (user, area) pair, uncapped
    std::vector<std::string> shared_areas;         // Held by more than one member
    std::vector<UniqueExpert> unique_experts;      // Held by exactly one member

    const MemberExpertise* find_member(int user_id) const;

    nlohmann::json to_json() const;
};

struct ExpertiseConfig {
    size_t max_areas_per_member = 10;
    size_t top_areas = 5;                          // top_topics / top_technologies length
    ExpertiseLevel person_edge_min_level = ExpertiseLevel::INTERMEDIATE;
};

/**
 * @brief Folds document authorship and extracted topics into per-user expertise
 */
class ExpertiseAggregator {
public:
    ExpertiseAggregator() = default;
    explicit ExpertiseAggregator(const ExpertiseConfig& config) : config_(config) {}

    /**
     * @brief Group documents by (author, area) and count distinct documents
     *
     * Documents without an author are ignored. Areas are topics and
     * technologies; labels are compared by their normalized form and the
     * first spelling seen is kept.
     */
    TeamExpertiseMap aggregate(const std::vector<const DocumentRecord*>& documents) const;

    /**
     * @brief Add one Person node per member and an expertise edge to every
     * topic/technology node already in the graph where the member's level
     * meets person_edge_min_level
     *
     * Edge weight is document_count divided by the largest count in the map.
     */
    void merge_into_graph(KnowledgeGraph& graph, const TeamExpertiseMap& map) const;

private:
    ExpertiseConfig config_;
};

} // namespace sem
