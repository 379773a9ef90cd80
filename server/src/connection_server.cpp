#include "connection_server.hpp"
#include "request_router.hpp"

#include <Poco/Net/SecureServerSocket.h>
#include <Poco/Net/SecureStreamSocket.h>
#include <Poco/Net/HTTPServerConnection.h>
#include <Poco/Net/NetException.h>
#include <Poco/Logger.h>
#include <Poco/Exception.h>

namespace {
    const int LISTEN_BACKLOG = 64;

    int at_least_one(int value, const std::string& what) {
        if (value < 1) {
            throw Poco::InvalidArgumentException(what + " must be at least 1");
        }
        return value;
    }
}

// --- SeenClientRegistry ---

bool SeenClientRegistry::accept(const Poco::Net::StreamSocket& socket) {
    try {
        std::string host = socket.peerAddress().host().toString();
        if (remember(host)) {
            Poco::Logger::get("leak.Server").information("CONNECT " + host);
        }
    } catch (const Poco::Net::NetException& e) {
        // Peer went away between accept() and here; the worker will notice.
        Poco::Logger::get("leak.Server").debug("No peer address: " + e.displayText());
    }
    return true;
}

bool SeenClientRegistry::remember(const std::string& host) {
    Poco::FastMutex::ScopedLock lock(mutex_);
    return hosts_.insert(host).second;
}

bool SeenClientRegistry::seen(const std::string& host) const {
    Poco::FastMutex::ScopedLock lock(mutex_);
    return hosts_.count(host) > 0;
}

std::size_t SeenClientRegistry::size() const {
    Poco::FastMutex::ScopedLock lock(mutex_);
    return hosts_.size();
}


// --- LeakConnection ---

LeakConnection::LeakConnection(const Poco::Net::StreamSocket& socket,
                               ServerConfigPtr config,
                               Poco::Net::HTTPServerParams::Ptr params,
                               Poco::Net::HTTPRequestHandlerFactory::Ptr factory)
    : Poco::Net::TCPServerConnection(socket),
      config_(std::move(config)),
      params_(params),
      factory_(factory) {}

void LeakConnection::run() {
    if (config_->tls_enabled()) {
        try {
            Poco::Net::SecureStreamSocket secure(socket());
            secure.completeHandshake();
        } catch (const Poco::Exception& e) {
            // No channel to answer on yet: just close.
            Poco::Logger::get("leak.Connection").debug("TLS handshake failed: " + e.displayText());
            return;
        }
    }
    Poco::Net::HTTPServerConnection http(socket(), params_, factory_);
    http.run();
}


// --- LeakConnectionFactory ---

LeakConnectionFactory::LeakConnectionFactory(ServerConfigPtr config, Poco::Net::HTTPServerParams::Ptr params)
    : config_(std::move(config)),
      params_(params),
      factory_(new LeakRequestHandlerFactory(config_)) {}

Poco::Net::TCPServerConnection* LeakConnectionFactory::createConnection(const Poco::Net::StreamSocket& socket) {
    return new LeakConnection(socket, config_, params_, factory_);
}


// --- ConnectionServer ---

ConnectionServer::ConnectionServer(ServerConfigPtr config, unsigned short port, int max_threads, int max_queued)
    : config_(std::move(config)),
      socket_(bind(*config_, port)),
      pool_(1, at_least_one(max_threads, "max_threads")),
      seen_clients_(new SeenClientRegistry) {
    Poco::Net::HTTPServerParams::Ptr params = new Poco::Net::HTTPServerParams;
    params->setMaxThreads(max_threads);
    params->setMaxQueued(at_least_one(max_queued, "max_queued"));
    params->setKeepAlive(true);
    params->setServerName(SERVER_NAME);

    server_ = std::make_unique<Poco::Net::TCPServer>(
        Poco::Net::TCPServerConnectionFactory::Ptr(new LeakConnectionFactory(config_, params)),
        pool_,
        socket_,
        params.cast<Poco::Net::TCPServerParams>());
    server_->setConnectionFilter(seen_clients_.cast<Poco::Net::TCPServerConnectionFilter>());
}

ConnectionServer::~ConnectionServer() {
    stop();
}

Poco::Net::ServerSocket ConnectionServer::bind(const ServerConfig& config, unsigned short port) {
    if (config.tls_enabled()) {
        return Poco::Net::SecureServerSocket(port, LISTEN_BACKLOG, config.tls_context);
    }
    return Poco::Net::ServerSocket(port, LISTEN_BACKLOG);
}

void ConnectionServer::start() {
    if (running_) return;
    server_->start();
    running_ = true;
    Poco::Logger::get("leak.Server").information("Listening on port " + std::to_string(port()) + (config_->tls_enabled() ? " (TLS)" : ""));
}

void ConnectionServer::stop() {
    if (!running_) return;
    server_->stop();
    running_ = false;
    Poco::Logger::get("leak.Server").information("Server stopped.");
}

unsigned short ConnectionServer::port() const {
    return socket_.address().port();
}

int ConnectionServer::currentConnections() const {
    return server_->currentConnections();
}
