#include "file_list_extractor.hpp"

#include <Poco/StringTokenizer.h>

std::vector<std::string> FileListExtractor::extract(const std::string& body, const std::string& key) {
    std::vector<std::string> result;

    std::size_t key_pos = body.find("\"" + key + "\"");
    if (key_pos == std::string::npos) return result;
    std::size_t open = body.find('[', key_pos + key.size() + 2);
    if (open == std::string::npos) return result;
    std::size_t close = body.find(']', open + 1);
    if (close == std::string::npos) return result;

    Poco::StringTokenizer items(body.substr(open + 1, close - open - 1), ",", Poco::StringTokenizer::TOK_TRIM);
    for (const auto& item : items) {
        std::size_t first = item.find_first_not_of('"');
        if (first == std::string::npos) continue;
        std::size_t last = item.find_last_not_of('"');
        std::string value = item.substr(first, last - first + 1);
        if (!value.empty()) result.push_back(value);
    }
    return result;
}
