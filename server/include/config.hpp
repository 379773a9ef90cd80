#pragma once

#include "path_resolver.hpp"

#include <Poco/Net/Context.h>
#include <Poco/Util/AbstractConfiguration.h>

#include <string>
#include <optional>
#include <memory>

// The single username/password pair accepted through HTTP Basic authentication.
struct Credential {
    std::string username;
    std::string password;

    // Parses "user:pass" (split at the first ':'). Throws Poco::InvalidArgumentException
    // when there is no ':'.
    static Credential parse(const std::string& user_colon_pass);
};


// Startup settings, as read from leak.properties and the command line.
//
//   server.port          = 8080
//   server.root          = /srv/share      (default: current directory)
//   server.max_threads   = 16
//   server.max_queued    = 100
//   auth.credentials     = user:pass       (default: no authentication)
//   tls.certificate      = cert.pem        (TLS is on when both files are set)
//   tls.private_key      = key.pem
struct ServerSettings {
    unsigned short port = 8080;
    std::string root = ".";
    int max_threads = 16;
    int max_queued = 100;
    std::optional<Credential> credential;
    std::string tls_certificate;
    std::string tls_private_key;

    bool tls_requested() const { return !tls_certificate.empty() && !tls_private_key.empty(); }
};

ServerSettings loadSettings(const Poco::Util::AbstractConfiguration& config);
ServerSettings loadSettingsFromFile(const std::string& filePath);


// Process-wide configuration shared read-only by every connection.
struct ServerConfig {
    // Resolves the root and, when requested, loads the TLS certificate and key.
    explicit ServerConfig(const ServerSettings& settings);
    ServerConfig(const PathResolver& resolver, std::optional<Credential> credential);

    PathResolver resolver;
    std::optional<Credential> credential;
    Poco::Net::Context::Ptr tls_context; // null when serving plain HTTP

    bool tls_enabled() const { return !tls_context.isNull(); }
};

using ServerConfigPtr = std::shared_ptr<const ServerConfig>;
