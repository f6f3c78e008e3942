/**
 * @file HttpTransport.hpp
 * @brief Blocking HTTP transport over cpp-httplib.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include "infrastructure/Url.hpp"

namespace docling::infrastructure {

/**
 * @class HttpTransport
 * @brief Immutable HTTP configuration plus blocking GET/POST.
 *
 * Each call opens its own connection, so a single instance can be shared between
 * threads.
 */
class HttpTransport {
public:
    enum class Version {
        Auto,    ///< Let the transport pick (HTTP/1.1 with httplib).
        Http1_1, ///< HTTP/1.1, no upgrade attempt.
        Http2    ///< Not supported; rejected at build time.
    };

    using Headers = std::map<std::string, std::string>;

    struct Config {
        Version version = Version::Auto;
        std::chrono::milliseconds connectTimeout{std::chrono::seconds(30)};
        std::chrono::milliseconds readTimeout{std::chrono::minutes(5)};
        std::chrono::milliseconds writeTimeout{std::chrono::minutes(5)};
        bool followRedirects = true;
        std::optional<std::string> proxyHost;
        int proxyPort = 0;
        Headers defaultHeaders;
        bool verifyServerCertificate = true;
        std::optional<std::string> caCertPath;
    };

    struct Response {
        int status = 0;
        std::string body;
        std::string contentType;

        bool isSuccess() const { return status >= 200 && status < 300; }
    };

    class Builder {
    public:
        Builder() = default;
        explicit Builder(Config config) : m_config(std::move(config)) {}

        Builder& version(Version value) { m_config.version = value; return *this; }
        Builder& connectTimeout(std::chrono::milliseconds value) { m_config.connectTimeout = value; return *this; }
        Builder& readTimeout(std::chrono::milliseconds value) { m_config.readTimeout = value; return *this; }
        Builder& writeTimeout(std::chrono::milliseconds value) { m_config.writeTimeout = value; return *this; }
        Builder& followRedirects(bool value) { m_config.followRedirects = value; return *this; }
        Builder& proxy(std::string host, int port);
        Builder& defaultHeader(const std::string& name, const std::string& value) {
            m_config.defaultHeaders[name] = value;
            return *this;
        }
        Builder& verifyServerCertificate(bool value) { m_config.verifyServerCertificate = value; return *this; }
        Builder& caCertPath(std::string path) { m_config.caCertPath = std::move(path); return *this; }

        const Config& getConfig() const { return m_config; }

        /** @throws domain::TransportError if the configured protocol version is unsupported. */
        HttpTransport build() const;

    private:
        Config m_config;
    };

    static Builder builder() { return Builder(); }
    Builder toBuilder() const { return Builder(m_config); }

    const Config& getConfig() const { return m_config; }

    /**
     * @brief Sends a GET and waits for the full response.
     * @throws domain::TransportError if no response was received.
     */
    Response get(const Url& baseUrl, const std::string& path, const Headers& headers) const;

    /**
     * @brief Sends a POST with the given body and waits for the full response.
     * @throws domain::TransportError if no response was received.
     */
    Response post(const Url& baseUrl,
                  const std::string& path,
                  const Headers& headers,
                  const std::string& body,
                  const std::string& contentType) const;

private:
    explicit HttpTransport(Config config);

    Config m_config;
};

} // namespace docling::infrastructure
