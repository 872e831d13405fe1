#pragma once

#include "core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sem {

/**
 * @brief Author of a document (a team member)
 */
struct Author {
    int user_id = 0;
    std::string username;
    std::string email;
};

/**
 * @brief Per-document metadata supplied by the document-understanding collaborator
 *
 * The engine treats these records as read-only input. Topics, technologies
 * and insights drive derived graph nodes; the author drives Person nodes.
 */
struct DocumentRecord {
    std::string id;                                    // Document UUID
    std::string title;
    std::optional<std::string> summary;

    std::vector<std::string> topics;
    std::vector<std::string> technologies;
    std::vector<std::string> insights;
    std::vector<std::string> tags;

    std::optional<Author> author;
    std::optional<int> category_id;

    Timestamp created_at{};
    Timestamp updated_at{};

    long long content_length = 0;                      // Characters
    long long word_count = 0;

    // Raw text, only needed when generating embeddings
    std::string content;

    nlohmann::json to_json() const;
    static DocumentRecord from_json(const nlohmann::json& j);
};

/**
 * @brief A persisted embedding row, keyed by document id
 */
struct DocumentEmbedding {
    std::string document_id;
    std::vector<float> vector;
    Timestamp created_at{};
};

} // namespace sem
