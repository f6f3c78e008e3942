/**
 * @file Url.cpp
 * @brief Implementation of Url.
 */

#include "infrastructure/Url.hpp"
#include "domain/DoclingErrors.hpp"
#include "domain/ValidationUtils.hpp"
#include <algorithm>
#include <cctype>

namespace docling::infrastructure {

namespace {

std::string Trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

Url::Url(std::string scheme, std::string host, int port, bool explicitPort, std::string path)
    : m_scheme(std::move(scheme)),
      m_host(std::move(host)),
      m_port(port),
      m_explicitPort(explicitPort),
      m_path(std::move(path)) {}

Url Url::parse(const std::string& text) {
    std::string input = Trim(domain::ValidationUtils::EnsureNotBlank(text, "baseUrl"));

    auto schemeEnd = input.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw domain::ConfigurationError("URL has no scheme: " + input);
    }
    std::string scheme = ToLower(input.substr(0, schemeEnd));
    if (scheme != "http" && scheme != "https") {
        throw domain::ConfigurationError("Unsupported URL scheme '" + scheme + "' in " + input);
    }

    std::string rest = input.substr(schemeEnd + 3);
    auto pathStart = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, pathStart);
    std::string path = pathStart == std::string::npos ? "" : rest.substr(pathStart);

    // Query and fragment carry no meaning for a base address.
    auto queryStart = path.find_first_of("?#");
    if (queryStart != std::string::npos) {
        path = path.substr(0, queryStart);
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host = authority;
    int port = scheme == "https" ? 443 : 80;
    bool explicitPort = false;

    // Bracketed IPv6 literal: [::1]:5001
    std::size_t portSeparator = std::string::npos;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw domain::ConfigurationError("Malformed IPv6 host in URL: " + input);
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            portSeparator = close + 1;
        }
    } else {
        portSeparator = authority.rfind(':');
        if (portSeparator != std::string::npos) {
            host = authority.substr(0, portSeparator);
        }
    }

    if (portSeparator != std::string::npos) {
        std::string portText = authority.substr(portSeparator + 1);
        if (portText.empty() || !std::all_of(portText.begin(), portText.end(),
                                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw domain::ConfigurationError("Invalid port in URL: " + input);
        }
        if (portText.size() > 5) {
            throw domain::ConfigurationError("Port out of range in URL: " + input);
        }
        port = std::stoi(portText);
        if (port <= 0 || port > 65535) {
            throw domain::ConfigurationError("Port out of range in URL: " + input);
        }
        explicitPort = true;
    }

    if (host.empty()) {
        throw domain::ConfigurationError("URL has no host: " + input);
    }

    return Url(scheme, ToLower(host), port, explicitPort, path);
}

std::string Url::schemeHostPort() const {
    std::string host = m_host.find(':') != std::string::npos ? "[" + m_host + "]" : m_host;
    return m_scheme + "://" + host + ":" + std::to_string(m_port);
}

std::string Url::resolvePath(const std::string& reference) const {
    if (!reference.empty() && reference.front() == '/') {
        return reference;
    }
    auto lastSlash = m_path.rfind('/');
    std::string directory = lastSlash == std::string::npos ? "/" : m_path.substr(0, lastSlash + 1);
    return directory + reference;
}

std::string Url::toString() const {
    std::string host = m_host.find(':') != std::string::npos ? "[" + m_host + "]" : m_host;
    std::string out = m_scheme + "://" + host;
    if (m_explicitPort) {
        out += ":" + std::to_string(m_port);
    }
    return out + m_path;
}

} // namespace docling::infrastructure
