#include <cstdlib>
#include <iostream>
#include <string>
#include <optional>
#include <vector>
#include "ClientConfig.h"
#include "Config.h"
#include "Courier.h"
#include "Logger.h"

using namespace FileCourier;

namespace {

    const char* SYSTEM_CONFIG = "/etc/filecourier/courier.conf";

    /// System-wide defaults, then the user's file; missing files are skipped
    std::vector<std::string> defaultConfigLayers() {
        std::vector<std::string> layers = {SYSTEM_CONFIG};
        if (const char* home = std::getenv("HOME")) {
            layers.push_back(std::string(home) + "/.config/filecourier/courier.conf");
        }
        return layers;
    }

    void printUsage(const char* program) {
        std::cout << "FileCourier - resumable TLS file upload" << std::endl;
        std::cout << "\nUsage: " << program
                  << " --host <HOST> --file <PATH> (--uuid <ID> | --destination <PATH> | --directory <PATH>) [OPTIONS]"
                  << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --host <HOST>              Receiving service host" << std::endl;
        std::cout << "  --port <PORT>              Receiving service port (default: 1055)" << std::endl;
        std::cout << "  --file <PATH>              Local file to send" << std::endl;
        std::cout << "  --uuid <ID>                Store under a server-side object id" << std::endl;
        std::cout << "  --destination <PATH>       Store at an explicit server path" << std::endl;
        std::cout << "  --directory <PATH>         Store inside a server directory" << std::endl;
        std::cout << "  --config <FILE>            key=value configuration file, applied over" << std::endl;
        std::cout << "                             " << SYSTEM_CONFIG << " and ~/.config/filecourier/courier.conf" << std::endl;
        std::cout << "  --cert <FILE>              Client certificate (PEM)" << std::endl;
        std::cout << "  --key <FILE>               Client private key (PEM)" << std::endl;
        std::cout << "  --ca <FILE|DIR>            Trusted CAs; enables peer verification" << std::endl;
        std::cout << "  --chunk-size <BYTES>       Streaming chunk size (default: 65536)" << std::endl;
        std::cout << "  --checksum <md5|sha256>    Digest algorithm (default: md5)" << std::endl;
        std::cout << "  --log-level <LEVEL>        debug, info, warn, error, critical" << std::endl;
        std::cout << "  --log-file <FILE>          Also write logs to FILE" << std::endl;
        std::cout << "  --help                     Show this help message" << std::endl;
    }

    int usageError(const std::string& message) {
        std::cerr << "Error: " << message << " (see --help)" << std::endl;
        return 2;
    }

}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string host;
    std::string filePath;
    std::optional<DestinationSelector> destination;
    int selectorCount = 0;

    // Flags that map onto configuration keys override the file
    Config overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (!hasValue) {
            return usageError("Missing value for " + arg);
        }

        if (arg == "--host") {
            host = argv[++i];
        }
        else if (arg == "--file") {
            filePath = argv[++i];
        }
        else if (arg == "--uuid") {
            destination = DestinationUuid{argv[++i]};
            ++selectorCount;
        }
        else if (arg == "--destination") {
            destination = DestinationPath{argv[++i]};
            ++selectorCount;
        }
        else if (arg == "--directory") {
            destination = DestinationDirectory{argv[++i]};
            ++selectorCount;
        }
        else if (arg == "--config") {
            configPath = argv[++i];
        }
        else if (arg == "--port") {
            overrides.set("port", argv[++i]);
        }
        else if (arg == "--cert") {
            overrides.set("tls_cert_file", argv[++i]);
        }
        else if (arg == "--key") {
            overrides.set("tls_key_file", argv[++i]);
        }
        else if (arg == "--ca") {
            overrides.set("tls_ca_file", argv[++i]);
        }
        else if (arg == "--chunk-size") {
            overrides.set("chunk_size", argv[++i]);
        }
        else if (arg == "--checksum") {
            overrides.set("checksum_algorithm", argv[++i]);
        }
        else if (arg == "--log-level") {
            overrides.set("log_level", argv[++i]);
        }
        else if (arg == "--log-file") {
            overrides.set("log_file", argv[++i]);
        }
        else {
            return usageError("Unknown option " + arg);
        }
    }

    if (host.empty()) {
        return usageError("--host is required");
    }
    if (filePath.empty()) {
        return usageError("--file is required");
    }
    if (selectorCount != 1 || !destination) {
        return usageError("Exactly one of --uuid, --destination or --directory is required");
    }

    Config settings;
    settings.loadLayered(defaultConfigLayers());
    if (!configPath.empty() && !settings.loadFromFile(configPath)) {
        return usageError("Cannot read config file " + configPath);
    }
    for (const char* key : {"port", "tls_cert_file", "tls_key_file", "tls_ca_file", "chunk_size",
                            "checksum_algorithm", "log_level", "log_file"}) {
        if (overrides.hasKey(key)) {
            settings.set(key, overrides.get(key));
        }
    }

    auto config = ClientConfig::fromConfig(settings);
    if (!config) {
        return usageError(config.error().message);
    }

    auto& logger = Logger::instance();
    logger.setLevel(config->logLevel);
    logger.setComponent("CourierSend");
    if (!config->logFile.empty() && !logger.setLogFile(config->logFile)) {
        std::cerr << "Warning: cannot open log file " << config->logFile << std::endl;
    }

    TransferRequest request;
    request.host = host;
    request.port = config->port;
    request.filepath = filePath;
    request.destination = *destination;

    auto result = Courier::sendFile(request, *config);
    if (!result) {
        std::cout << "error " << result.error().describe() << std::endl;
        return 1;
    }

    std::cout << "ok " << result->bytesSent << " " << result->fileSize << std::endl;
    return 0;
}
