#include "core/text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace sem {

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string normalize_label(const std::string& label) {
    std::string out;
    out.reserve(label.size());
    bool pending_dash = false;

    for (unsigned char c : label) {
        // Bytes >= 128 belong to multi-byte UTF-8 sequences; keep them verbatim
        if (std::isalnum(c) || c >= 128) {
            if (pending_dash && !out.empty()) {
                out.push_back('-');
            }
            pending_dash = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_dash = true;
        }
    }

    return out;
}

} // namespace sem
