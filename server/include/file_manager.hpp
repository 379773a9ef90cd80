#pragma once

#include "path_resolver.hpp"
#include "multipart_parser.hpp"

#include <string>
#include <optional>

// Writes uploaded files into the served tree.
class FileManager {
public:
    explicit FileManager(const PathResolver& resolver);

    /**
     * @brief Stores one uploaded part in dir, replacing any file of the same name.
     * @return Where the file was written, or nothing if the name was unusable or the
     *         write failed (the reason is logged).
     */
    std::optional<SandboxedPath> store_upload(const SandboxedPath& dir, const UploadedPart& part);

    // Replaces every character (UTF-8 code point) that is not a Unicode letter or
    // digit, '.', '-', '_' or space with a single '_'.
    static std::string sanitize_filename(const std::string& filename);

private:
    const PathResolver& resolver_;
};
