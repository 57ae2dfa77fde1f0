#include "ClientConfig.h"
#include "TransferEngine.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <unordered_map>

namespace FileCourier {

namespace {
    bool isUnsigned(const std::string& value) {
        return !value.empty() && value.size() <= 19 &&
               std::all_of(value.begin(), value.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    bool isBoolean(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower == "1" || lower == "0" || lower == "true" || lower == "false" ||
               lower == "yes" || lower == "no" || lower == "on" || lower == "off";
    }

    const std::unordered_map<std::string, Config::Validator>& schema() {
        static const std::unordered_map<std::string, Config::Validator> rules = {
            {"port", [](const std::string&, const std::string& v) {
                return isUnsigned(v) && std::stoul(v) >= 1 && std::stoul(v) <= 65535;
            }},
            {"chunk_size", [](const std::string&, const std::string& v) {
                return isUnsigned(v) && std::stoull(v) > 0 &&
                       std::stoull(v) <= TransferEngine::Options::MAX_CHUNK_SIZE;
            }},
            {"max_frame_size", [](const std::string&, const std::string& v) {
                return isUnsigned(v) && std::stoull(v) >= 64 && std::stoull(v) <= 0xFFFFFFFFull;
            }},
            {"tls_verify_peer", [](const std::string&, const std::string& v) {
                return isBoolean(v);
            }},
            {"checksum_algorithm", [](const std::string&, const std::string& v) {
                ChecksumAlgorithm algorithm;
                return FileChecksum::parseAlgorithm(v, algorithm);
            }},
            {"log_level", [](const std::string&, const std::string& v) {
                LogLevel level;
                return Logger::parseLevel(v, level);
            }},
        };
        return rules;
    }
}

Result<ClientConfig> ClientConfig::fromConfig(const Config& config) {
    std::string failedKey;
    if (!config.validate(schema(), &failedKey)) {
        return Error{ErrorCode::InvalidConfig,
                     "Invalid value for '" + failedKey + "': " + config.get(failedKey)};
    }

    ClientConfig result;
    result.port = config.getInt("port", DEFAULT_PORT);
    result.certFile = config.get("tls_cert_file");
    result.keyFile = config.get("tls_key_file");
    result.keyPassword = config.get("tls_key_password");
    result.caFile = config.get("tls_ca_file");
    result.verifyPeer = config.getBool("tls_verify_peer", false);
    result.serverName = config.get("tls_server_name");
    result.chunkSize = config.getSize("chunk_size", DEFAULT_CHUNK_SIZE);
    result.maxFrameSize = config.getSize("max_frame_size", DEFAULT_MAX_FRAME_SIZE);
    result.logFile = config.get("log_file");

    if (config.hasKey("checksum_algorithm")) {
        FileChecksum::parseAlgorithm(config.get("checksum_algorithm"), result.checksumAlgorithm);
    }
    if (config.hasKey("log_level")) {
        Logger::parseLevel(config.get("log_level"), result.logLevel);
    }

    if (result.certFile.empty() != result.keyFile.empty()) {
        return Error{ErrorCode::InvalidConfig,
                     "tls_cert_file and tls_key_file must be set together"};
    }

    return result;
}

} // namespace FileCourier
