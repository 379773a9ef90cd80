#include "file_manager.hpp"
#include "errors.hpp"

#include <Poco/Logger.h>
#include <Poco/UTF8Encoding.h>
#include <Poco/TextIterator.h>
#include <Poco/Unicode.h>

#include <fstream>

FileManager::FileManager(const PathResolver& resolver) : resolver_(resolver) {}

std::string FileManager::sanitize_filename(const std::string& filename) {
    Poco::UTF8Encoding utf8;
    Poco::TextIterator it(filename, utf8);
    Poco::TextIterator end(filename);
    std::string safe;
    for (; it != end; ++it) {
        int c = *it;
        // Invalid UTF-8 comes back as a negative value.
        if (c > 0 && (Poco::Unicode::isAlpha(c) || Poco::Unicode::isDigit(c) || c == '.' || c == '-' || c == '_' || c == ' ')) {
            unsigned char bytes[4];
            int n = utf8.convert(c, bytes, sizeof(bytes));
            safe.append(reinterpret_cast<const char*>(bytes), static_cast<std::size_t>(n));
        } else {
            safe += '_';
        }
    }
    return safe;
}

std::optional<SandboxedPath> FileManager::store_upload(const SandboxedPath& dir, const UploadedPart& part) {
    Poco::Logger& log = Poco::Logger::get("leak.Upload");
    std::string safe = sanitize_filename(part.filename);
    if (safe.empty() || safe == "." || safe == "..") {
        log.warning("Rejected upload name '" + part.filename + "'");
        return std::nullopt;
    }

    std::optional<SandboxedPath> target;
    try {
        target = resolver_.child(dir, safe);
    } catch (const LeakException& e) {
        log.warning("Rejected upload destination for '" + safe + "': " + e.displayText());
        return std::nullopt;
    }

    std::ofstream outfile(target->path(), std::ios::binary | std::ios::trunc);
    if (!outfile) {
        log.error("Failed to open file for writing: " + target->string());
        return std::nullopt;
    }
    outfile.write(part.data.data(), static_cast<std::streamsize>(part.data.size()));
    outfile.close();
    if (!outfile) {
        log.error("Failed to write " + target->string());
        return std::nullopt;
    }
    return target;
}
