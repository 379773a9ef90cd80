#pragma once

#include "config.hpp"

#include <Poco/Net/TCPServer.h>
#include <Poco/Net/TCPServerConnection.h>
#include <Poco/Net/TCPServerConnectionFactory.h>
#include <Poco/Net/TCPServerConnectionFilter.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/ServerSocket.h>
#include <Poco/Net/StreamSocket.h>
#include <Poco/ThreadPool.h>
#include <Poco/AutoPtr.h>
#include <Poco/Mutex.h>

#include <set>
#include <string>
#include <memory>

// Remembers which client addresses have connected so the first connection from
// each one gets a CONNECT log line. Runs on the accept thread and admits every
// connection; it is bookkeeping, not access control.
class SeenClientRegistry : public Poco::Net::TCPServerConnectionFilter {
public:
    using Ptr = Poco::AutoPtr<SeenClientRegistry>;

    bool accept(const Poco::Net::StreamSocket& socket) override;

    // Records host; true if it had not been seen before.
    bool remember(const std::string& host);
    bool seen(const std::string& host) const;
    std::size_t size() const;

protected:
    ~SeenClientRegistry() override = default;

private:
    mutable Poco::FastMutex mutex_;
    std::set<std::string> hosts_;
};


// One accepted connection: Accepted -> (TLS handshake) -> Serving -> Closed.
// A failed handshake closes the socket without writing anything.
class LeakConnection : public Poco::Net::TCPServerConnection {
public:
    LeakConnection(const Poco::Net::StreamSocket& socket,
                   ServerConfigPtr config,
                   Poco::Net::HTTPServerParams::Ptr params,
                   Poco::Net::HTTPRequestHandlerFactory::Ptr factory);

    void run() override;

private:
    ServerConfigPtr config_;
    Poco::Net::HTTPServerParams::Ptr params_;
    Poco::Net::HTTPRequestHandlerFactory::Ptr factory_;
};


class LeakConnectionFactory : public Poco::Net::TCPServerConnectionFactory {
public:
    LeakConnectionFactory(ServerConfigPtr config, Poco::Net::HTTPServerParams::Ptr params);
    Poco::Net::TCPServerConnection* createConnection(const Poco::Net::StreamSocket& socket) override;

private:
    ServerConfigPtr config_;
    Poco::Net::HTTPServerParams::Ptr params_;
    Poco::Net::HTTPRequestHandlerFactory::Ptr factory_;
};


/**
 * @brief Accepts connections on one port and serves each on a worker thread.
 * The accept loop runs on its own thread and only enqueues sockets, so a slow upload
 * or a large archive never holds up new connections. With a TLS context in the config
 * the listening socket is a SecureServerSocket.
 */
class ConnectionServer {
public:
    // Throws Poco::InvalidArgumentException if max_threads or max_queued is below 1.
    ConnectionServer(ServerConfigPtr config, unsigned short port, int max_threads = 16, int max_queued = 100);
    ~ConnectionServer();

    void start();
    void stop();

    unsigned short port() const;
    int currentConnections() const;
    const SeenClientRegistry& seenClients() const { return *seen_clients_; }

private:
    static Poco::Net::ServerSocket bind(const ServerConfig& config, unsigned short port);

    ServerConfigPtr config_;
    Poco::Net::ServerSocket socket_;
    Poco::ThreadPool pool_;
    SeenClientRegistry::Ptr seen_clients_;
    std::unique_ptr<Poco::Net::TCPServer> server_;
    bool running_ = false;
};
