#pragma once

#include <string>

namespace sem {

std::string to_lower_copy(const std::string& s);

std::string trim_copy(const std::string& s);

/**
 * @brief Normalize a label to a node-id fragment
 *
 * Lowercase, every run of non-alphanumeric characters collapsed to a single
 * '-', no leading or trailing '-'. "pgvector 0.4" -> "pgvector-0-4".
 */
std::string normalize_label(const std::string& label);

} // namespace sem
