#pragma once

#include <string>
#include <vector>
#include <optional>

// One file carried by a multipart/form-data upload.
struct UploadedPart {
    std::string filename; // as sent by the client, last path component only
    std::string data;
};


// Decodes multipart/form-data bodies that have been read into memory.
// Form fields without a filename are ignored. Input that does not look like
// multipart yields no parts rather than an error.
class MultipartParser {
public:
    std::vector<UploadedPart> parse(const std::string& body, const std::string& boundary) const;

    // Boundary parameter of a multipart/form-data Content-Type, if there is one.
    static std::optional<std::string> boundaryFrom(const std::string& content_type);

    // Filename from the Content-Disposition line of a part's header block.
    static std::optional<std::string> filenameFrom(const std::string& headers);
};
