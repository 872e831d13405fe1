#include "core/document.hpp"
#include "core/errors.hpp"
#include <sstream>

namespace sem {

nlohmann::json DocumentRecord::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["title"] = title;
    if (summary.has_value()) {
        j["summary"] = summary.value();
    }
    j["topics"] = topics;
    j["technologies"] = technologies;
    j["insights"] = insights;
    j["tags"] = tags;

    if (author.has_value()) {
        j["author"] = {
            {"user_id", author->user_id},
            {"username", author->username},
            {"email", author->email}
        };
    }
    if (category_id.has_value()) {
        j["category_id"] = category_id.value();
    }

    j["created_at"] = format_iso8601(created_at);
    j["updated_at"] = format_iso8601(updated_at);
    j["content_length"] = content_length;
    j["word_count"] = word_count;

    if (!content.empty()) {
        j["content"] = content;
    }
    return j;
}

DocumentRecord DocumentRecord::from_json(const nlohmann::json& j) {
    DocumentRecord doc;
    if (!j.contains("id") || !j["id"].is_string()) {
        throw ValidationError("Document record is missing a string 'id'");
    }
    doc.id = j["id"].get<std::string>();
    doc.title = j.value("title", "Untitled");

    if (j.contains("summary") && j["summary"].is_string()) {
        doc.summary = j["summary"].get<std::string>();
    }

    doc.topics = j.value("topics", std::vector<std::string>{});
    doc.technologies = j.value("technologies", std::vector<std::string>{});
    doc.insights = j.value("insights", std::vector<std::string>{});
    doc.tags = j.value("tags", std::vector<std::string>{});

    if (j.contains("author") && j["author"].is_object()) {
        const auto& a = j["author"];
        Author author;
        author.user_id = a.value("user_id", 0);
        author.username = a.value("username", "");
        author.email = a.value("email", "");
        doc.author = author;
    }
    if (j.contains("category_id") && j["category_id"].is_number_integer()) {
        doc.category_id = j["category_id"].get<int>();
    }

    if (j.contains("created_at")) {
        doc.created_at = parse_iso8601(j["created_at"].get<std::string>());
    }
    if (j.contains("updated_at")) {
        doc.updated_at = parse_iso8601(j["updated_at"].get<std::string>());
    } else {
        doc.updated_at = doc.created_at;
    }

    doc.content = j.value("content", "");
    doc.content_length = j.value("content_length", static_cast<long long>(doc.content.size()));
    if (j.contains("word_count")) {
        doc.word_count = j["word_count"].get<long long>();
    } else {
        std::stringstream ss(doc.content);
        std::string word;
        while (ss >> word) doc.word_count++;
    }

    return doc;
}

} // namespace sem
