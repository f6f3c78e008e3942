#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"

using namespace docling::infrastructure;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_config_root";
    std::filesystem::create_directories(testRoot);
    std::string settingsPath = testRoot + "/settings.json";

    // Missing file yields defaults.
    auto defaults = ConfigLoader::LoadClientSettings(testRoot + "/does-not-exist.json");
    assert(defaults.baseUrl == "http://localhost:5001");
    assert(!defaults.readTimeoutSeconds);

    {
        std::ofstream f(settingsPath);
        f << R"({
            "base_url": "https://docling.example.com",
            "connect_timeout_seconds": 5,
            "read_timeout_seconds": 600,
            "follow_redirects": false,
            "verify_tls": true,
            "proxy": {"host": "proxy.local", "port": 3128}
        })";
    }

    auto settings = ConfigLoader::LoadClientSettings(settingsPath);
    assert(settings.baseUrl == "https://docling.example.com");
    assert(settings.connectTimeoutSeconds == 5);
    assert(settings.readTimeoutSeconds == 600);
    assert(settings.followRedirects == false);
    assert(settings.proxyHost == std::string("proxy.local"));
    assert(settings.proxyPort == 3128);

    auto client = settings.toClientBuilder().build();
    const auto& config = client.getTransport().getConfig();
    assert(client.getBaseUrl().getHost() == "docling.example.com");
    assert(config.connectTimeout == std::chrono::seconds(5));
    assert(config.readTimeout == std::chrono::seconds(600));
    assert(!config.followRedirects);
    assert(config.proxyHost == std::string("proxy.local"));
    assert(config.version == HttpTransport::Version::Auto);

    // The environment overrides the file.
    setenv(ConfigLoader::kBaseUrlEnv, "http://10.0.0.7:5001", 1);
    ConfigLoader::ApplyEnvironment(settings);
    assert(settings.baseUrl == "http://10.0.0.7:5001");
    auto plain = settings.toClientBuilder().build();
    assert(plain.getTransport().getConfig().version == HttpTransport::Version::Http1_1);
    unsetenv(ConfigLoader::kBaseUrlEnv);

    // A malformed file falls back to defaults.
    {
        std::ofstream f(settingsPath);
        f << "{ this is not json";
    }
    auto fallback = ConfigLoader::LoadClientSettings(settingsPath);
    assert(fallback.baseUrl == "http://localhost:5001");
    assert(!fallback.proxyHost);

    // The default settings path lives under the XDG config home.
    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    assert(ConfigLoader::DefaultSettingsPath() == "/tmp/xdg-test/docling/settings.json");

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
