#pragma once

#include <string>
#include <vector>

// Pulls the string array stored under a key out of a small JSON-ish request body,
// e.g. {"files": ["/a.txt", "/docs/"]}. This is a targeted scan, not a JSON parser:
// a missing key, missing brackets or garbage all give an empty list.
class FileListExtractor {
public:
    static std::vector<std::string> extract(const std::string& body, const std::string& key = "files");
};
