/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace docling::infrastructure {

DoclingClient::Builder ClientSettings::toClientBuilder() const {
    auto transport = HttpTransport::builder();
    if (connectTimeoutSeconds) {
        transport.connectTimeout(std::chrono::seconds(*connectTimeoutSeconds));
    }
    if (readTimeoutSeconds) {
        transport.readTimeout(std::chrono::seconds(*readTimeoutSeconds));
    }
    if (followRedirects) {
        transport.followRedirects(*followRedirects);
    }
    if (verifyTls) {
        transport.verifyServerCertificate(*verifyTls);
    }
    if (caCertPath) {
        transport.caCertPath(*caCertPath);
    }
    if (proxyHost) {
        transport.proxy(*proxyHost, proxyPort.value_or(8080));
    }

    auto builder = DoclingClient::builder();
    builder.baseUrl(baseUrl).httpTransportBuilder(transport);
    return builder;
}

ClientSettings ConfigLoader::LoadClientSettings(const std::string& path) {
    ClientSettings settings;
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("base_url")) {
            settings.baseUrl = j["base_url"].get<std::string>();
        }
        if (j.contains("connect_timeout_seconds")) {
            settings.connectTimeoutSeconds = j["connect_timeout_seconds"].get<int>();
        }
        if (j.contains("read_timeout_seconds")) {
            settings.readTimeoutSeconds = j["read_timeout_seconds"].get<int>();
        }
        if (j.contains("follow_redirects")) {
            settings.followRedirects = j["follow_redirects"].get<bool>();
        }
        if (j.contains("verify_tls")) {
            settings.verifyTls = j["verify_tls"].get<bool>();
        }
        if (j.contains("ca_cert_path")) {
            settings.caCertPath = j["ca_cert_path"].get<std::string>();
        }
        if (j.contains("proxy") && j["proxy"].is_object()) {
            const auto& proxy = j["proxy"];
            if (proxy.contains("host")) {
                settings.proxyHost = proxy["host"].get<std::string>();
            }
            if (proxy.contains("port")) {
                settings.proxyPort = proxy["port"].get<int>();
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what()
                  << ". Using defaults." << std::endl;
        return ClientSettings{};
    }

    return settings;
}

void ConfigLoader::ApplyEnvironment(ClientSettings& settings) {
    const char* baseUrl = std::getenv(kBaseUrlEnv);
    if (baseUrl && *baseUrl) {
        settings.baseUrl = baseUrl;
    }
}

std::string ConfigLoader::DefaultSettingsPath() {
    return PathUtils::GetDefaultSettingsPath().string();
}

} // namespace docling::infrastructure
