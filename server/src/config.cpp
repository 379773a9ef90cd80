#include "config.hpp"

#include <Poco/Util/PropertyFileConfiguration.h>
#include <Poco/AutoPtr.h>
#include <Poco/Logger.h>
#include <Poco/Exception.h>

#include <utility>

using namespace Poco::Util;
using Poco::AutoPtr;

Credential Credential::parse(const std::string& user_colon_pass) {
    std::size_t colon = user_colon_pass.find(':');
    if (colon == std::string::npos) {
        throw Poco::InvalidArgumentException("Credentials must be given as user:pass");
    }
    return Credential{user_colon_pass.substr(0, colon), user_colon_pass.substr(colon + 1)};
}

ServerSettings loadSettings(const AbstractConfiguration& config) {
    ServerSettings settings;
    settings.port = static_cast<unsigned short>(config.getUInt("server.port", settings.port));
    settings.root = config.getString("server.root", settings.root);
    settings.max_threads = config.getInt("server.max_threads", settings.max_threads);
    settings.max_queued = config.getInt("server.max_queued", settings.max_queued);
    if (settings.max_threads < 1 || settings.max_queued < 1) {
        throw Poco::InvalidArgumentException("server.max_threads and server.max_queued must be at least 1");
    }

    std::string credentials = config.getString("auth.credentials", "");
    if (!credentials.empty()) {
        settings.credential = Credential::parse(credentials);
    }
    settings.tls_certificate = config.getString("tls.certificate", "");
    settings.tls_private_key = config.getString("tls.private_key", "");
    if (settings.tls_certificate.empty() != settings.tls_private_key.empty()) {
        throw Poco::InvalidArgumentException("tls.certificate and tls.private_key must be set together");
    }
    return settings;
}

ServerSettings loadSettingsFromFile(const std::string& filePath) {
    AutoPtr<PropertyFileConfiguration> config = new PropertyFileConfiguration(filePath);
    ServerSettings settings = loadSettings(*config);
    Poco::Logger::get("leak.Config").information("Configuration loaded from " + filePath);
    return settings;
}

ServerConfig::ServerConfig(const ServerSettings& settings)
    : resolver(settings.root), credential(settings.credential) {
    if (settings.tls_requested()) {
        tls_context = new Poco::Net::Context(
            Poco::Net::Context::TLS_SERVER_USE,
            settings.tls_private_key,
            settings.tls_certificate,
            "",
            Poco::Net::Context::VERIFY_NONE);
    }
}

ServerConfig::ServerConfig(const PathResolver& resolver, std::optional<Credential> credential)
    : resolver(resolver), credential(std::move(credential)) {}
