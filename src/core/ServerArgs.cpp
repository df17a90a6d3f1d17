/**
 * @file ServerArgs.cpp
 * @brief Command line parsing for ftpcore_server
 */

#include "ftpcore/ServerArgs.h"
#include "ftpcore/NetErrors.h"

#include <sstream>

namespace FtpCore {

namespace {

    [[noreturn]] void badArgument(const std::string& message) {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_ARGUMENT, message);
    }

    int parsePortArg(const std::string& text) {
        size_t used = 0;
        int value = -1;
        try {
            value = std::stoi(text, &used);
        } catch (const std::exception&) {
            badArgument("--port expects a number, got \"" + text + "\"");
        }
        if (used != text.size()) {
            badArgument("--port expects a number, got \"" + text + "\"");
        }
        return value;
    }

} // anonymous namespace

ServerArgs ServerArgs::parseOrThrow(int argc, const char* const* argv) {
    ServerArgs out;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        auto value = [&]() -> std::string {
            if (i + 1 >= argc || !argv[i + 1]) {
                badArgument("Missing value for " + a);
            }
            return std::string(argv[++i]);
        };

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--config" || a == "-c") {
            out.configPath = value();
            continue;
        }

        if (a == "--host") {
            out.host = value();
            continue;
        }

        if (a == "--port" || a == "-p") {
            out.port = parsePortArg(value());
            continue;
        }

        if (a == "--pasv") {
            out.pasv = value();
            continue;
        }

        if (a == "--log-level") {
            out.logLevel = value();
            continue;
        }

        if (a == "--log-file") {
            out.logFile = value();
            continue;
        }

        badArgument("Unknown argument: " + a);
    }

    return out;
}

ServerConfig ServerArgs::resolveConfig() const {
    ServerConfig cfg = configPath ? ServerConfig::loadFile(*configPath) : ServerConfig();

    if (host) {
        cfg.host = *host;
    }
    if (port) {
        cfg.port = *port;
    }
    if (pasv) {
        cfg.pasvPorts = PortSet::parse(*pasv);
    }
    if (logLevel) {
        const auto level = parseLogLevel(*logLevel);
        if (!level) {
            badArgument("Unknown log level \"" + *logLevel + "\"");
        }
        cfg.logLevel = *level;
    }
    if (logFile) {
        cfg.logFile = *logFile;
    }

    cfg.validate();
    return cfg;
}

std::string ServerArgs::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --config, -c FILE   JSON configuration file\n"
        << "  --host HOST         Host name or address to listen on (default: " << DEFAULT_LISTEN_HOST << ")\n"
        << "  --port, -p PORT     Control port, 0 = system assigned (default: " << DEFAULT_LISTEN_PORT << ")\n"
        << "  --pasv PORTS        Passive ports, e.g. 50000-50100 or 50000,50002\n"
        << "  --log-level LEVEL   debug, info, warning or error (default: " << DEFAULT_LOG_LEVEL << ")\n"
        << "  --log-file FILE     Also append a trace log to FILE\n"
        << "  --help, -h          Show this help message\n";
    return oss.str();
}

}  // namespace FtpCore
