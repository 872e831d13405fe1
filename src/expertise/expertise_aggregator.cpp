#include "expertise/expertise_aggregator.hpp"
#include "graph/graph_builder.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace sem {

ExpertiseLevel string_to_expertise_level(const std::string& s) {
    std::string name = to_lower_copy(trim_copy(s));
    if (name == "beginner") return ExpertiseLevel::BEGINNER;
    if (name == "intermediate") return ExpertiseLevel::INTERMEDIATE;
    if (name == "advanced") return ExpertiseLevel::ADVANCED;
    if (name == "expert") return ExpertiseLevel::EXPERT;
    throw ValidationError("Unknown expertise level: " + s);
}

// ==========================================
// Serialization
// ==========================================

nlohmann::json ExpertiseEntry::to_json() const {
    return {
        {"user_id", user_id},
        {"topic", topic},
        {"kind", kind == ExpertiseAreaKind::TOPIC ? "topic" : "technology"},
        {"document_count", document_count},
        {"level", expertise_level_to_string(level())}
    };
}

nlohmann::json MemberExpertise::to_json() const {
    nlohmann::json j;
    j["user_id"] = user_id;
    j["username"] = username;
    j["email"] = email;
    j["expertise_areas"] = nlohmann::json::array();
    for (const auto& area : expertise_areas) {
        j["expertise_areas"].push_back({
            {"area", area.topic},
            {"document_count", area.document_count},
            {"level", expertise_level_to_string(area.level())}
        });
    }
    j["total_documents"] = total_documents;
    j["top_technologies"] = top_technologies;
    j["top_topics"] = top_topics;
    return j;
}

const MemberExpertise* TeamExpertiseMap::find_member(int user_id) const {
    for (const auto& m : members) {
        if (m.user_id == user_id) return &m;
    }
    return nullptr;
}

nlohmann::json TeamExpertiseMap::to_json() const {
    nlohmann::json j;
    j["members"] = nlohmann::json::array();
    for (const auto& m : members) {
        j["members"].push_back(m.to_json());
    }
    j["entries"] = nlohmann::json::array();
    for (const auto& e : entries) {
        j["entries"].push_back(e.to_json());
    }
    j["shared_areas"] = shared_areas;
    j["unique_experts"] = nlohmann::json::array();
    for (const auto& u : unique_experts) {
        j["unique_experts"].push_back(u.to_json());
    }
    return j;
}

// ==========================================
// ExpertiseAggregator
// ==========================================

namespace {

struct AreaCount {
    std::string label;                   // First spelling seen
    std::set<std::string> documents;
};

// Labels ranked by count descending, then alphabetically
std::vector<std::string> top_labels(const std::map<std::string, AreaCount>& areas, size_t limit) {
    std::vector<const AreaCount*> ranked;
    for (const auto& [slug, area] : areas) {
        ranked.push_back(&area);
    }
    std::sort(ranked.begin(), ranked.end(), [](const AreaCount* a, const AreaCount* b) {
        if (a->documents.size() != b->documents.size()) return a->documents.size() > b->documents.size();
        return a->label < b->label;
    });

    std::vector<std::string> out;
    for (const auto* area : ranked) {
        if (out.size() >= limit) break;
        out.push_back(area->label);
    }
    return out;
}

} // anonymous namespace

TeamExpertiseMap ExpertiseAggregator::aggregate(const std::vector<const DocumentRecord*>& documents) const {
    struct MemberState {
        Author author;
        std::set<std::string> documents;
        std::map<std::string, AreaCount> topics;        // Keyed by slug
        std::map<std::string, AreaCount> technologies;
    };
    std::map<int, MemberState> members;

    auto fold = [](std::map<std::string, AreaCount>& areas,
                   const std::vector<std::string>& labels,
                   const std::string& document_id) {
        for (const auto& raw : labels) {
            std::string label = trim_copy(raw);
            std::string slug = normalize_label(label);
            if (slug.empty()) continue;

            auto it = areas.find(slug);
            if (it == areas.end()) {
                it = areas.emplace(slug, AreaCount{label, {}}).first;
            }
            it->second.documents.insert(document_id);
        }
    };

    for (const auto* doc : documents) {
        if (!doc->author) continue;

        auto& state = members[doc->author->user_id];
        if (state.documents.empty()) {
            state.author = *doc->author;
        }
        state.documents.insert(doc->id);
        fold(state.topics, doc->topics, doc->id);
        fold(state.technologies, doc->technologies, doc->id);
    }

    TeamExpertiseMap map;

    // area slug -> (label, holders)
    std::map<std::string, std::pair<std::string, std::vector<const MemberState*>>> holders;

    for (const auto& kv : members) {
        const int user_id = kv.first;
        const MemberState& state = kv.second;

        MemberExpertise member;
        member.user_id = user_id;
        member.username = state.author.username;
        member.email = state.author.email;
        member.total_documents = static_cast<int>(state.documents.size());
        member.top_topics = top_labels(state.topics, config_.top_areas);
        member.top_technologies = top_labels(state.technologies, config_.top_areas);

        std::vector<ExpertiseEntry> entries;
        auto emit = [&](const std::map<std::string, AreaCount>& areas, ExpertiseAreaKind kind) {
            for (const auto& [slug, area] : areas) {
                ExpertiseEntry entry;
                entry.user_id = user_id;
                entry.topic = area.label;
                entry.kind = kind;
                entry.document_count = static_cast<int>(area.documents.size());
                entries.push_back(entry);

                auto& holder = holders[slug];
                if (holder.first.empty()) holder.first = area.label;
                if (holder.second.empty() || holder.second.back() != &state) {
                    holder.second.push_back(&state);
                }
            }
        };
        emit(state.topics, ExpertiseAreaKind::TOPIC);
        emit(state.technologies, ExpertiseAreaKind::TECHNOLOGY);

        std::stable_sort(entries.begin(), entries.end(), [](const ExpertiseEntry& a, const ExpertiseEntry& b) {
            if (a.document_count != b.document_count) return a.document_count > b.document_count;
            return a.topic < b.topic;
        });

        map.entries.insert(map.entries.end(), entries.begin(), entries.end());

        member.expertise_areas = entries;
        if (member.expertise_areas.size() > config_.max_areas_per_member) {
            member.expertise_areas.resize(config_.max_areas_per_member);
        }
        map.members.push_back(std::move(member));
    }

    for (const auto& [slug, holder] : holders) {
        if (holder.second.size() > 1) {
            map.shared_areas.push_back(holder.first);
        } else if (holder.second.size() == 1) {
            UniqueExpert expert;
            expert.area = holder.first;
            expert.expert_user_id = holder.second.front()->author.user_id;
            expert.expert_name = holder.second.front()->author.username;
            map.unique_experts.push_back(expert);
        }
    }
    std::sort(map.shared_areas.begin(), map.shared_areas.end());
    std::sort(map.unique_experts.begin(), map.unique_experts.end(),
              [](const UniqueExpert& a, const UniqueExpert& b) { return a.area < b.area; });

    return map;
}

void ExpertiseAggregator::merge_into_graph(KnowledgeGraph& graph, const TeamExpertiseMap& map) const {
    int max_count = 0;
    for (const auto& entry : map.entries) {
        max_count = std::max(max_count, entry.document_count);
    }

    for (const auto& member : map.members) {
        GraphNode node;
        node.id = person_node_id(member.user_id);
        node.label = member.username.empty() ? node.id : member.username;
        node.node_type = NodeType::PERSON;
        node.document_count = member.total_documents;
        node.topics = member.top_topics;
        graph.add_node(node);
    }

    if (max_count == 0) {
        return;
    }

    for (const auto& entry : map.entries) {
        if (entry.level() < config_.person_edge_min_level) continue;

        NodeType type = entry.kind == ExpertiseAreaKind::TOPIC ? NodeType::TOPIC : NodeType::TECHNOLOGY;
        std::string target = derived_node_id(type, normalize_label(entry.topic));
        std::string source = person_node_id(entry.user_id);
        if (!graph.has_node(target) || !graph.has_node(source) || graph.has_edge_between(source, target)) {
            continue;
        }

        GraphEdge edge;
        edge.source = source;
        edge.target = target;
        edge.weight = static_cast<double>(entry.document_count) / max_count;
        edge.kind = EdgeKind::EXPERTISE;
        graph.add_edge(edge);
    }
}

} // namespace sem
