#include "config.hpp"
#include "connection_server.hpp"
#include "protocol.hpp"

#include <Poco/Net/SSLManager.h>
#include <Poco/Util/ServerApplication.h>
#include <Poco/Util/Option.h>
#include <Poco/Util/OptionSet.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Logger.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/PatternFormatter.h>
#include <Poco/Path.h>
#include <Poco/AutoPtr.h>

#include <iostream>
#include <memory>


class LeakServerApp : public Poco::Util::ServerApplication {
public:
    LeakServerApp() : _helpRequested(false) {}

protected:
    void initialize(Application& self) override {
        // leak.properties next to the executable, if present. Command-line values
        // live in a higher-priority layer and win over it.
        loadConfiguration();
        if (!config().has("logging.loggers.root.channel")) {
            Poco::AutoPtr<Poco::PatternFormatter> formatter = new Poco::PatternFormatter("%H:%M:%S %s: %t");
            Poco::AutoPtr<Poco::FormattingChannel> channel = new Poco::FormattingChannel(formatter, new Poco::ConsoleChannel);
            Poco::Logger::setChannel("", channel);
        }
        ServerApplication::initialize(self);
        logger().information("leak " + SERVER_VERSION + " initializing...");
    }

    void uninitialize() override {
        logger().information("leak uninitializing...");
        ServerApplication::uninitialize();
    }

    void defineOptions(Poco::Util::OptionSet& options) override {
        ServerApplication::defineOptions(options);
        options.addOption(
            Poco::Util::Option("help", "h", "Display help.")
                .required(false).repeatable(false)
                .callback(Poco::Util::OptionCallback<LeakServerApp>(this, &LeakServerApp::handleHelp)));
        options.addOption(
            Poco::Util::Option("port", "P", "Port to listen on (default 8080).")
                .required(false).repeatable(false).argument("port").binding("server.port"));
        options.addOption(
            Poco::Util::Option("root", "r", "Directory to serve (default: current directory).")
                .required(false).repeatable(false).argument("dir").binding("server.root"));
        options.addOption(
            Poco::Util::Option("auth", "a", "Require HTTP Basic authentication with user:pass.")
                .required(false).repeatable(false).argument("user:pass").binding("auth.credentials"));
        options.addOption(
            Poco::Util::Option("tls-cert", "", "PEM certificate; enables HTTPS together with --tls-key.")
                .required(false).repeatable(false).argument("file").binding("tls.certificate"));
        options.addOption(
            Poco::Util::Option("tls-key", "", "PEM private key for --tls-cert.")
                .required(false).repeatable(false).argument("file").binding("tls.private_key"));
        options.addOption(
            Poco::Util::Option("config-file", "c", "Load settings from a properties file.")
                .required(false).repeatable(true).argument("file")
                .callback(Poco::Util::OptionCallback<LeakServerApp>(this, &LeakServerApp::handleConfig)));
    }

    void handleHelp(const std::string&, const std::string&) {
        _helpRequested = true; displayHelp(); stopOptionsProcessing();
    }

    void handleConfig(const std::string&, const std::string& value) {
        loadConfiguration(value);
    }

    void displayHelp() {
        Poco::Util::HelpFormatter hf(options()); hf.setCommand(commandName());
        hf.setUsage("[port] [directory] OPTIONS");
        hf.setHeader("leak: file server with uploads, archive downloads and TLS.");
        hf.format(std::cout);
    }

    int main(const std::vector<std::string>& args) override {
        if (_helpRequested) return Application::EXIT_OK;

        // "leak 8080 ./dist" works as well as --port/--root.
        if (args.size() > 0) config().setString("server.port", args[0]);
        if (args.size() > 1) config().setString("server.root", args[1]);
        if (!config().has("server.root")) config().setString("server.root", Poco::Path::current());

        ServerSettings settings;
        ServerConfigPtr serverConfig;
        try {
            settings = loadSettings(config());
            if (settings.tls_requested()) Poco::Net::initializeSSL();
            serverConfig = std::make_shared<const ServerConfig>(settings);
        } catch (const Poco::Exception& e) {
            logger().fatal("Configuration error: " + e.displayText());
            return Application::EXIT_CONFIG;
        }

        int rc = Application::EXIT_OK;
        try {
            ConnectionServer server(serverConfig, settings.port, settings.max_threads, settings.max_queued);
            server.start();
            const std::string scheme = serverConfig->tls_enabled() ? "https" : "http";
            logger().information("Local:  " + scheme + "://127.0.0.1:" + std::to_string(server.port()));
            logger().information("Root:   " + serverConfig->resolver.root().string());
            if (serverConfig->credential) logger().information("Auth:   enabled");
            if (serverConfig->tls_enabled()) logger().information("TLS:    enabled");
            waitForTerminationRequest();
            logger().information("Shutting down...");
            server.stop();
        } catch (const Poco::Exception& e) {
            logger().fatal("Failed to start server: " + e.displayText());
            rc = Application::EXIT_SOFTWARE;
        }

        if (settings.tls_requested()) Poco::Net::uninitializeSSL();
        return rc;
    }

private:
    bool _helpRequested;
};

POCO_SERVER_MAIN(LeakServerApp)
