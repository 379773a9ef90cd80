#pragma once

#include <string>
#include <cstddef>
#include <filesystem>

namespace fs = std::filesystem;

const std::string SERVER_NAME = "leak";
const std::string SERVER_VERSION = "0.5.0";

// --- Routes ---
// Uploads and archive downloads are addressed relative to the directory they act on:
//   POST /photos/__upload      (multipart/form-data, one or more file parts)
//   POST /photos/__download    ({"files": ["/photos/a.jpg", "/photos/trip/"]})
// Everything else is a GET/HEAD for a file or a directory listing.
namespace Routes {
    const std::string UPLOAD_SUFFIX   = "/__upload";
    const std::string DOWNLOAD_SUFFIX = "/__download";
    const std::string INDEX_DOCUMENT  = "index.html";
} // namespace Routes


// --- HTTP Headers ---
namespace HttpHeaders {
    const std::string CONTENT_DISPOSITION = "Content-Disposition";
    const std::string ALLOW_ORIGIN        = "Access-Control-Allow-Origin";
    const std::string ALLOW_METHODS       = "Access-Control-Allow-Methods";
    const std::string ALLOW_HEADERS       = "Access-Control-Allow-Headers";
    const std::string SERVER              = "Server";
} // namespace HttpHeaders


// --- Limits ---
namespace Limits {
    const std::size_t MAX_UPLOAD_BYTES    = 500 * 1024 * 1024; // combined, per request
    const std::size_t MAX_SELECTION_BYTES = 1024 * 1024;       // __download request body
} // namespace Limits


// --- JSON keys of the directory listing payload ---
namespace JsonKeys {
    const std::string PATH            = "path";
    const std::string PARENT          = "parent";
    const std::string UPLOAD_TARGET   = "upload_target";
    const std::string DOWNLOAD_TARGET = "download_target";
    const std::string FOLDERS         = "folders";
    const std::string FILES           = "files";
    const std::string TOTAL_SIZE      = "total_size";
    const std::string ENTRIES         = "entries";
    const std::string NAME            = "name";
    const std::string HREF            = "href";
    const std::string IS_DIRECTORY    = "is_directory";
    const std::string SIZE            = "size";
    const std::string MODIFIED_AGO    = "modified_ago"; // seconds
} // namespace JsonKeys


// --- Content Types ---
namespace ContentTypes {
    const std::string APPLICATION_JSON         = "application/json; charset=utf-8";
    const std::string MULTIPART_FORM_DATA      = "multipart/form-data";
    const std::string APPLICATION_OCTET_STREAM = "application/octet-stream";
    const std::string APPLICATION_ZIP          = "application/zip";
    const std::string TEXT_PLAIN               = "text/plain; charset=utf-8";
    const std::string TEXT_HTML                = "text/html; charset=utf-8";
} // namespace ContentTypes

// Media type for a file served by the static handler, picked from its extension.
// Unknown extensions are application/octet-stream.
const std::string& mediaTypeFor(const fs::path& file);

// Name offered to the browser for archive downloads.
const std::string ARCHIVE_FILENAME = SERVER_NAME + "-download.zip";
