#include "protocol.hpp"

#include <Poco/String.h>

#include <map>

namespace {
    const std::map<std::string, std::string> MEDIA_TYPES = {
        {"html",  "text/html; charset=utf-8"},
        {"htm",   "text/html; charset=utf-8"},
        {"css",   "text/css; charset=utf-8"},
        {"js",    "application/javascript; charset=utf-8"},
        {"mjs",   "application/javascript; charset=utf-8"},
        {"json",  "application/json; charset=utf-8"},
        {"png",   "image/png"},
        {"jpg",   "image/jpeg"},
        {"jpeg",  "image/jpeg"},
        {"gif",   "image/gif"},
        {"svg",   "image/svg+xml"},
        {"ico",   "image/x-icon"},
        {"webp",  "image/webp"},
        {"woff",  "font/woff"},
        {"woff2", "font/woff2"},
        {"ttf",   "font/ttf"},
        {"pdf",   "application/pdf"},
        {"wasm",  "application/wasm"},
        {"xml",   "application/xml; charset=utf-8"},
        {"txt",   "text/plain; charset=utf-8"},
        {"md",    "text/plain; charset=utf-8"},
        {"mp4",   "video/mp4"},
        {"webm",  "video/webm"},
        {"mp3",   "audio/mpeg"},
        {"ogg",   "audio/ogg"},
    };
}

const std::string& mediaTypeFor(const fs::path& file) {
    std::string ext = Poco::toLower(file.extension().string());
    if (!ext.empty()) ext.erase(0, 1);
    auto it = MEDIA_TYPES.find(ext);
    if (it == MEDIA_TYPES.end()) {
        return ContentTypes::APPLICATION_OCTET_STREAM;
    }
    return it->second;
}
