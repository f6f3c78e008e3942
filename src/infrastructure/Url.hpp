/**
 * @file Url.hpp
 * @brief Minimal structured URL for the service base address.
 */

#pragma once

#include <string>

namespace docling::infrastructure {

/**
 * @class Url
 * @brief An absolute http(s) URL split into scheme, host, port and path.
 */
class Url {
public:
    /**
     * @brief Parses an absolute URL.
     * @throws domain::ConfigurationError on blank input, a missing or unsupported
     *         scheme, a missing host or an invalid port.
     */
    static Url parse(const std::string& text);

    const std::string& getScheme() const { return m_scheme; }
    const std::string& getHost() const { return m_host; }

    /** @brief Explicit port, or the scheme default (80 / 443). */
    int getPort() const { return m_port; }

    /** @brief Path component, "" when the URL has none. */
    const std::string& getPath() const { return m_path; }

    /** @brief True for plaintext http. */
    bool isPlaintext() const { return m_scheme == "http"; }

    /** @brief "scheme://host:port", the form the HTTP transport connects to. */
    std::string schemeHostPort() const;

    /**
     * @brief Resolves a reference against this URL.
     *
     * An absolute path replaces the base path; a relative path is appended to the
     * base path's directory.
     */
    std::string resolvePath(const std::string& reference) const;

    std::string toString() const;

    bool operator==(const Url& other) const {
        return m_scheme == other.m_scheme && m_host == other.m_host &&
               m_port == other.m_port && m_path == other.m_path;
    }
    bool operator!=(const Url& other) const { return !(*this == other); }

private:
    Url(std::string scheme, std::string host, int port, bool explicitPort, std::string path);

    std::string m_scheme;
    std::string m_host;
    int m_port;
    bool m_explicitPort;
    std::string m_path;
};

} // namespace docling::infrastructure
