#include "connector/kafka/KafkaConfig.hpp"
#include "logger/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <string>

namespace connector::kafka {
    namespace {
        std::string trim(const std::string &text) {
            const auto first = text.find_first_not_of(" \t\r");
            if (first == std::string::npos) return "";
            const auto last = text.find_last_not_of(" \t\r");
            return text.substr(first, last - first + 1);
        }

        bool isSecret(const std::string &varName) {
            return varName.find("PASSWORD") != std::string::npos;
        }
    }

    std::string KafkaConfig::resolvePlaceholder(const std::string &value) {
        static const std::regex placeholderRegex(R"(\$\{([^}:]+):([^}]*)\})");
        std::string result;
        auto searchStart = value.cbegin();
        std::smatch matches;

        // Resolved values are never rescanned, so a value containing "${" cannot loop
        while (std::regex_search(searchStart, value.cend(), matches, placeholderRegex)) {
            const std::string varName = matches[1].str();
            const char *envValue = std::getenv(varName.c_str());
            const std::string replacement = envValue ? envValue : matches[2].str();

            if (isSecret(varName)) {
                Logger::logDebug("[KafkaConfig] Resolved " + varName + " = ***");
            } else {
                Logger::logDebug("[KafkaConfig] " + std::string(envValue ? "Resolved " : "Using default for ") +
                                 varName + " = " + replacement);
            }

            result.append(searchStart, matches[0].first);
            result += replacement;
            searchStart = matches[0].second;
        }
        result.append(searchStart, value.cend());
        return result;
    }

    void KafkaConfig::loadEnvFile(const std::string &envFilePath) {
        std::ifstream envFile(envFilePath);
        if (!envFile.is_open()) {
            Logger::logInfo("[KafkaConfig] No .env file found at: " + envFilePath + " (using system environment only)");
            return;
        }

        std::string line;
        int loadedVars = 0;

        while (std::getline(envFile, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;

            const size_t pos = line.find('=');
            if (pos == std::string::npos) continue;

            const std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            // Variables already present in the environment take precedence
            if (std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
                loadedVars++;
            }
        }

        Logger::logInfo("[KafkaConfig] Loaded " + std::to_string(loadedVars) + " variables from " + envFilePath);
    }

    void KafkaConfig::resolveFromEnvironment(const std::string &envFilePath) {
        loadEnvFile(envFilePath);

        brokers = resolvePlaceholder(brokers);
        clientId = resolvePlaceholder(clientId);
        consumerGroupId = resolvePlaceholder(consumerGroupId);
        autoOffsetReset = resolvePlaceholder(autoOffsetReset);
        compressionType = resolvePlaceholder(compressionType);
        eventsTopic = resolvePlaceholder(eventsTopic);
        statusTopic = resolvePlaceholder(statusTopic);
        controlTopic = resolvePlaceholder(controlTopic);
        requestsTopic = resolvePlaceholder(requestsTopic);
        responsesTopic = resolvePlaceholder(responsesTopic);
        securityProtocol = resolvePlaceholder(securityProtocol);
        sslCaLocation = resolvePlaceholder(sslCaLocation);
        saslMechanism = resolvePlaceholder(saslMechanism);
        saslUsername = resolvePlaceholder(saslUsername);
        saslPassword = resolvePlaceholder(saslPassword);
        serviceId = resolvePlaceholder(serviceId);

        Logger::logInfo("[KafkaConfig] All placeholders resolved");
    }

    void KafkaConfig::printConfig() const {
        Logger::logInfo("[KafkaConfig] Final configuration:");
        Logger::logInfo("  Brokers: " + brokers);
        Logger::logInfo("  Client ID: " + clientId);
        Logger::logInfo("  Consumer Group: " + consumerGroupId);
        Logger::logInfo("  Service ID: " + serviceId);
        Logger::logInfo("  Topics: " + eventsTopic + ", " + statusTopic + ", " + controlTopic + ", " +
                        requestsTopic + ", " + responsesTopic);
        if (!securityProtocol.empty()) {
            Logger::logInfo("  Security Protocol: " + securityProtocol);
        }
        if (!saslMechanism.empty()) {
            Logger::logInfo("  SASL Mechanism: " + saslMechanism);
        }
    }
}
