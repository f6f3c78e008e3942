/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading client configuration (settings.json).
 *
 * Keeps JSON parsing of the settings file out of the client and the CLI.
 */

#pragma once

#include <optional>
#include <string>
#include "infrastructure/DoclingClient.hpp"

namespace docling::infrastructure {

/**
 * @struct ClientSettings
 * @brief User-facing client options, as read from settings.json and the environment.
 */
struct ClientSettings {
    std::string baseUrl = DoclingClient::kDefaultBaseUrl;
    std::optional<int> connectTimeoutSeconds;
    std::optional<int> readTimeoutSeconds;
    std::optional<bool> followRedirects;
    std::optional<bool> verifyTls;
    std::optional<std::string> caCertPath;
    std::optional<std::string> proxyHost;
    std::optional<int> proxyPort;

    /**
     * @brief Seeds a client builder with these settings.
     * @throws domain::ConfigurationError on an invalid base URL or proxy.
     */
    DoclingClient::Builder toClientBuilder() const;
};

class ConfigLoader {
public:
    /** @brief Environment variable overriding the base URL. */
    static constexpr const char* kBaseUrlEnv = "DOCLING_BASE_URL";

    /**
     * @brief Reads settings from a JSON file.
     * @param path Path to settings.json.
     * @return Defaults when the file does not exist or cannot be parsed (the latter is logged).
     */
    static ClientSettings LoadClientSettings(const std::string& path);

    /** @brief Applies DOCLING_BASE_URL, when set and non-empty. */
    static void ApplyEnvironment(ClientSettings& settings);

    /** @brief Location of the per-user settings file. */
    static std::string DefaultSettingsPath();
};

} // namespace docling::infrastructure
