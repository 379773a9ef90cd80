#pragma once

#include "config.hpp"
#include "protocol.hpp"
#include "path_resolver.hpp"

#include <Poco/Net/HTTPRequestHandler.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/HTTPServerRequest.h>
#include <Poco/Net/HTTPServerResponse.h>
#include <nlohmann/json.hpp>

#include <string>
#include <istream>

// POCO using declarations
using Poco::Net::HTTPRequestHandler;
using Poco::Net::HTTPRequestHandlerFactory;
using Poco::Net::HTTPServerRequest;
using Poco::Net::HTTPServerResponse;
using Poco::Net::HTTPResponse; // For status codes
using json = nlohmann::json;

// What a request is asking for, decided from its method and path alone.
enum class Route {
    Upload,      // POST .../__upload
    Download,    // POST .../__download
    Static,      // GET or HEAD
    Preflight,   // OPTIONS
    Unsupported
};


// Request Handler Factory: one RequestRouter per request, all sharing the same config.
class LeakRequestHandlerFactory : public HTTPRequestHandlerFactory {
public:
    explicit LeakRequestHandlerFactory(ServerConfigPtr config);
    HTTPRequestHandler* createRequestHandler(const HTTPServerRequest& request) override;

private:
    ServerConfigPtr config_;
};


// Main HTTP Request Handler: checks credentials, routes, and runs the handlers.
class RequestRouter : public HTTPRequestHandler {
public:
    explicit RequestRouter(ServerConfigPtr config);
    void handleRequest(HTTPServerRequest& request, HTTPServerResponse& response) override;

    static Route classify(const std::string& method, const std::string& path);

    // True if the request carries "Authorization: Basic ..." matching expected.
    static bool isAuthorized(const HTTPServerRequest& request, const Credential& expected);

    // Request target without query string or fragment, still percent-encoded.
    static std::string requestPath(const std::string& uri);

    // Reads the whole body, throwing PayloadTooLargeException(too_large_message) once
    // more than limit bytes arrive.
    static std::string readBody(std::istream& in, std::size_t limit, const std::string& too_large_message);

    // Listing payload for a directory requested as path.
    json listingPayload(const SandboxedPath& dir, const std::string& path) const;

private:
    ServerConfigPtr config_;

    void dispatch(Route route, const std::string& path, HTTPServerRequest& request, HTTPServerResponse& response);

    void handleUpload(const std::string& path, HTTPServerRequest& request, HTTPServerResponse& response);
    void handleDownload(HTTPServerRequest& request, HTTPServerResponse& response);
    void handleStatic(const std::string& path, HTTPServerRequest& request, HTTPServerResponse& response);
    void handlePreflight(HTTPServerResponse& response);

    // --- Utility Methods ---
    void sendText(HTTPServerResponse& response, HTTPResponse::HTTPStatus status, const std::string& text);
    void sendJson(HTTPServerResponse& response, HTTPResponse::HTTPStatus status, const json& payload);
    void sendUnauthorized(HTTPServerRequest& request, HTTPServerResponse& response);
};
