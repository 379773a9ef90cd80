#include "request_router.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "multipart_parser.hpp"
#include "file_list_extractor.hpp"
#include "archive_builder.hpp"
#include "directory_lister.hpp"
#include "file_manager.hpp"

#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPBasicCredentials.h>
#include <Poco/Timestamp.h>
#include <Poco/Logger.h>
#include <Poco/Format.h>
#include <Poco/String.h>
#include <Poco/Exception.h>

#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace {
    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string join_href(const std::string& base, const std::string& tail) {
        return ends_with(base, "/") ? base + tail : base + "/" + tail;
    }
}


LeakRequestHandlerFactory::LeakRequestHandlerFactory(ServerConfigPtr config)
    : config_(std::move(config)) {}

HTTPRequestHandler* LeakRequestHandlerFactory::createRequestHandler(const HTTPServerRequest&) {
    return new RequestRouter(config_);
}


// --- RequestRouter Implementation ---
RequestRouter::RequestRouter(ServerConfigPtr config) : config_(std::move(config)) {}

Route RequestRouter::classify(const std::string& method, const std::string& path) {
    if (method == Poco::Net::HTTPRequest::HTTP_POST) {
        if (ends_with(path, Routes::UPLOAD_SUFFIX))   return Route::Upload;
        if (ends_with(path, Routes::DOWNLOAD_SUFFIX)) return Route::Download;
    }
    if (method == Poco::Net::HTTPRequest::HTTP_GET || method == Poco::Net::HTTPRequest::HTTP_HEAD) {
        return Route::Static;
    }
    if (method == Poco::Net::HTTPRequest::HTTP_OPTIONS) {
        return Route::Preflight;
    }
    return Route::Unsupported;
}

bool RequestRouter::isAuthorized(const HTTPServerRequest& request, const Credential& expected) {
    if (!request.hasCredentials()) {
        return false;
    }
    try {
        std::string scheme;
        std::string auth_info;
        request.getCredentials(scheme, auth_info);
        if (Poco::icompare(scheme, std::string("Basic")) != 0) {
            return false;
        }
        Poco::Net::HTTPBasicCredentials credentials(auth_info);
        return credentials.getUsername() == expected.username && credentials.getPassword() == expected.password;
    } catch (const Poco::Exception&) {
        // Undecodable Authorization header.
        return false;
    }
}

std::string RequestRouter::requestPath(const std::string& uri) {
    std::string path = uri.substr(0, uri.find_first_of("?#"));
    return path.empty() ? "/" : path;
}

std::string RequestRouter::readBody(std::istream& in, std::size_t limit, const std::string& too_large_message) {
    std::string body;
    char buffer[8192];
    while (in) {
        in.read(buffer, sizeof(buffer));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        if (body.size() + static_cast<std::size_t>(n) > limit) {
            throw PayloadTooLargeException(too_large_message);
        }
        body.append(buffer, static_cast<std::size_t>(n));
    }
    return body;
}

// Main request router
void RequestRouter::handleRequest(HTTPServerRequest& request, HTTPServerResponse& response) {
    response.set(HttpHeaders::SERVER, SERVER_NAME + "/" + SERVER_VERSION + " (Poco)");
    response.set(HttpHeaders::ALLOW_ORIGIN, "*");

    const std::string method = request.getMethod();
    const std::string path = requestPath(request.getURI());
    Route route = Route::Unsupported;

    // Nothing about the request is looked at before the credential check.
    if (config_->credential && !isAuthorized(request, *config_->credential)) {
        sendUnauthorized(request, response);
    } else {
        route = classify(method, path);
        try {
            dispatch(route, path, request, response);
        } catch (const LeakException& e) {
            Poco::Logger::get("leak.Router").information(method + " " + path + ": " + e.displayText());
            if (!response.sent()) {
                if (dynamic_cast<const PayloadTooLargeException*>(&e)) {
                    response.setKeepAlive(false);
                }
                sendText(response, statusFor(e), e.message());
            }
        } catch (const Poco::Exception& e) {
            Poco::Logger::get("leak.Router").error("Poco Exception in handler: " + e.displayText());
            if (!response.sent()) sendText(response, HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, "Server error");
        } catch (const std::exception& e) {
            Poco::Logger::get("leak.Router").error(std::string("Standard Exception in handler: ") + e.what());
            if (!response.sent()) sendText(response, HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, "Server error");
        }
    }

    // Uploads log their own line per stored file.
    if (route != Route::Upload) {
        Poco::Logger::get("leak.Router").information(Poco::format("%d %s %s %s",
            static_cast<int>(response.getStatus()), method, path, request.clientAddress().host().toString()));
    }
}

void RequestRouter::dispatch(Route route, const std::string& path, HTTPServerRequest& request, HTTPServerResponse& response) {
    switch (route) {
    case Route::Upload:
        handleUpload(path, request, response);
        break;
    case Route::Download:
        handleDownload(request, response);
        break;
    case Route::Static:
        handleStatic(path, request, response);
        break;
    case Route::Preflight:
        handlePreflight(response);
        break;
    case Route::Unsupported:
        response.set("Allow", "GET, HEAD, POST, OPTIONS");
        sendText(response, HTTPResponse::HTTP_METHOD_NOT_ALLOWED, "Method not allowed");
        break;
    }
}


// --- Handler Implementations ---

void RequestRouter::handleUpload(const std::string& path, HTTPServerRequest& request, HTTPServerResponse& response) {
    std::string dir_path = path.substr(0, path.size() - Routes::UPLOAD_SUFFIX.size());
    if (dir_path.empty()) dir_path = "/";

    const PathResolver& resolver = config_->resolver;
    std::optional<SandboxedPath> dir;
    try {
        dir = resolver.resolve(dir_path);
    } catch (const LeakException&) {
        sendText(response, HTTPResponse::HTTP_BAD_REQUEST, "Invalid path");
        return;
    }
    std::error_code ec;
    if (!fs::is_directory(dir->path(), ec)) {
        sendText(response, HTTPResponse::HTTP_BAD_REQUEST, "Not a directory");
        return;
    }

    auto boundary = MultipartParser::boundaryFrom(request.getContentType());
    if (!boundary) {
        sendText(response, HTTPResponse::HTTP_BAD_REQUEST, "Missing boundary");
        return;
    }
    if (request.hasContentLength() && request.getContentLength64() > static_cast<Poco::Int64>(Limits::MAX_UPLOAD_BYTES)) {
        throw PayloadTooLargeException("500MB max");
    }

    Poco::Timestamp started;
    std::string body = readBody(request.stream(), Limits::MAX_UPLOAD_BYTES, "500MB max");
    MultipartParser parser;
    std::vector<UploadedPart> parts = parser.parse(body, *boundary);
    if (parts.empty()) {
        sendText(response, HTTPResponse::HTTP_BAD_REQUEST, "No file in upload");
        return;
    }
    std::uint64_t elapsed_ms = static_cast<std::uint64_t>(started.elapsed() / 1000);

    FileManager file_manager(resolver);
    Poco::Logger& log = Poco::Logger::get("leak.Upload");
    for (const auto& part : parts) {
        auto stored = file_manager.store_upload(*dir, part);
        if (!stored) continue;
        log.information(Poco::format("UPLOAD %s (%s at %s) from %s",
            stored->filename(),
            formatSize(part.data.size()),
            formatSpeed(part.data.size(), elapsed_ms),
            request.clientAddress().host().toString()));
    }
    sendText(response, HTTPResponse::HTTP_OK, "OK");
}

void RequestRouter::handleDownload(HTTPServerRequest& request, HTTPServerResponse& response) {
    std::string body = readBody(request.stream(), Limits::MAX_SELECTION_BYTES, "Request body too large");
    std::vector<std::string> selections = FileListExtractor::extract(body);
    if (selections.empty()) {
        sendText(response, HTTPResponse::HTTP_BAD_REQUEST, "No files specified");
        return;
    }

    ArchiveBuilder builder(config_->resolver);
    std::string archive;
    try {
        archive = builder.build(selections);
    } catch (const InternalFailureException&) {
        sendText(response, HTTPResponse::HTTP_INTERNAL_SERVER_ERROR, "ZIP creation failed");
        return;
    }
    Poco::Logger::get("leak.Archive").information("DOWNLOAD ZIP (" + formatSize(archive.size()) + ")");

    response.setStatus(HTTPResponse::HTTP_OK);
    response.setContentType(ContentTypes::APPLICATION_ZIP);
    response.set(HttpHeaders::CONTENT_DISPOSITION, "attachment; filename=\"" + ARCHIVE_FILENAME + "\"");
    response.sendBuffer(archive.data(), archive.size());
}

void RequestRouter::handleStatic(const std::string& path, HTTPServerRequest& request, HTTPServerResponse& response) {
    const PathResolver& resolver = config_->resolver;
    const std::string not_found = "404 Not Found: " + path;

    std::optional<SandboxedPath> target;
    try {
        target = resolver.resolve(path);
    } catch (const LeakException&) {
        sendText(response, HTTPResponse::HTTP_NOT_FOUND, not_found);
        return;
    }

    std::error_code ec;
    if (fs::is_directory(target->path(), ec)) {
        auto index = resolver.revalidate(target->path() / Routes::INDEX_DOCUMENT);
        if (index && fs::is_regular_file(index->path(), ec)) {
            try {
                response.sendFile(index->string(), ContentTypes::TEXT_HTML);
                return;
            } catch (const Poco::FileException& e) {
                Poco::Logger::get("leak.Router").warning("Cannot read " + index->string() + ": " + e.displayText());
            }
        }
        sendJson(response, HTTPResponse::HTTP_OK, listingPayload(*target, path));
        return;
    }

    if (!fs::is_regular_file(target->path(), ec)) {
        sendText(response, HTTPResponse::HTTP_NOT_FOUND, not_found);
        return;
    }
    try {
        response.sendFile(target->string(), mediaTypeFor(target->path()));
    } catch (const Poco::FileException&) {
        sendText(response, HTTPResponse::HTTP_NOT_FOUND, not_found);
    }
}

void RequestRouter::handlePreflight(HTTPServerResponse& response) {
    response.set(HttpHeaders::ALLOW_METHODS, "GET, HEAD, POST, OPTIONS");
    response.set(HttpHeaders::ALLOW_HEADERS, "Content-Type, Authorization");
    response.setStatus(HTTPResponse::HTTP_NO_CONTENT);
    response.setContentLength(0);
    response.send();
}

json RequestRouter::listingPayload(const SandboxedPath& dir, const std::string& path) const {
    DirectoryLister lister;
    std::vector<DirectoryEntry> entries = lister.list(dir);

    std::string display = path;
    while (display.size() > 1 && ends_with(display, "/")) display.pop_back();

    json payload;
    payload[JsonKeys::PATH] = display;
    if (dir != config_->resolver.root()) {
        std::size_t slash = display.rfind('/');
        payload[JsonKeys::PARENT] = (slash == std::string::npos || slash == 0) ? std::string("/") : display.substr(0, slash);
    }
    payload[JsonKeys::UPLOAD_TARGET] = join_href(path, Routes::UPLOAD_SUFFIX.substr(1));
    payload[JsonKeys::DOWNLOAD_TARGET] = join_href(path, Routes::DOWNLOAD_SUFFIX.substr(1));

    json items = json::array();
    std::size_t folders = 0;
    std::size_t files = 0;
    std::uintmax_t total_size = 0;
    for (const auto& entry : entries) {
        std::string href = join_href(path, encodePathSegment(entry.name));
        if (entry.is_directory()) {
            href += "/";
            ++folders;
        } else {
            ++files;
            total_size += entry.size;
        }
        items.push_back({
            {JsonKeys::NAME, entry.name},
            {JsonKeys::HREF, href},
            {JsonKeys::IS_DIRECTORY, entry.is_directory()},
            {JsonKeys::SIZE, entry.size},
            {JsonKeys::MODIFIED_AGO, entry.age_seconds}
        });
    }
    payload[JsonKeys::FOLDERS] = folders;
    payload[JsonKeys::FILES] = files;
    payload[JsonKeys::TOTAL_SIZE] = total_size;
    payload[JsonKeys::ENTRIES] = items;
    return payload;
}


// --- Utility Methods ---

void RequestRouter::sendText(HTTPServerResponse& response, HTTPResponse::HTTPStatus status, const std::string& text) {
    response.setStatus(status);
    response.setContentType(ContentTypes::TEXT_PLAIN);
    response.sendBuffer(text.data(), text.size());
}

void RequestRouter::sendJson(HTTPServerResponse& response, HTTPResponse::HTTPStatus status, const json& payload) {
    std::string body = payload.dump(2);
    response.setStatus(status);
    response.setContentType(ContentTypes::APPLICATION_JSON);
    response.sendBuffer(body.data(), body.size());
}

void RequestRouter::sendUnauthorized(HTTPServerRequest& request, HTTPServerResponse& response) {
    // The request body is never read, so the connection cannot be reused for another request.
    if (request.getMethod() == Poco::Net::HTTPRequest::HTTP_POST) {
        response.setKeepAlive(false);
    }
    response.requireAuthentication(SERVER_NAME);
    response.setContentType(ContentTypes::TEXT_PLAIN);
    const std::string text = "Authentication required";
    response.sendBuffer(text.data(), text.size());
}
