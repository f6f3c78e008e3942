/**
 * @file HttpTransport.cpp
 * @brief Implementation of HttpTransport.
 */

#include "infrastructure/HttpTransport.hpp"
#include "domain/DoclingErrors.hpp"
#include "domain/ValidationUtils.hpp"
#include <httplib.h>
#include <memory>

namespace docling::infrastructure {

namespace {

std::unique_ptr<httplib::Client> OpenClient(const HttpTransport::Config& config, const Url& baseUrl) {
    auto cli = std::make_unique<httplib::Client>(baseUrl.schemeHostPort());
    if (!cli->is_valid()) {
        throw domain::TransportError("Cannot open a connection to " + baseUrl.toString() +
                                     (baseUrl.isPlaintext() ? "" : " (TLS support unavailable)"));
    }

    cli->set_connection_timeout(config.connectTimeout);
    cli->set_read_timeout(config.readTimeout);
    cli->set_write_timeout(config.writeTimeout);
    cli->set_follow_location(config.followRedirects);

    if (config.proxyHost) {
        cli->set_proxy(*config.proxyHost, config.proxyPort);
    }
    if (!config.defaultHeaders.empty()) {
        cli->set_default_headers(httplib::Headers(config.defaultHeaders.begin(), config.defaultHeaders.end()));
    }

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    cli->enable_server_certificate_verification(config.verifyServerCertificate);
    if (config.caCertPath) {
        cli->set_ca_cert_path(*config.caCertPath);
    }
#endif

    return cli;
}

HttpTransport::Response ToResponse(const httplib::Result& res,
                                   const std::string& method,
                                   const Url& baseUrl,
                                   const std::string& path) {
    if (!res) {
        throw domain::TransportError(method + " " + baseUrl.schemeHostPort() + path + " failed: " +
                                     httplib::to_string(res.error()));
    }
    HttpTransport::Response out;
    out.status = res->status;
    out.body = res->body;
    out.contentType = res->get_header_value("Content-Type");
    return out;
}

} // namespace

HttpTransport::Builder& HttpTransport::Builder::proxy(std::string host, int port) {
    m_config.proxyHost = domain::ValidationUtils::EnsureNotBlank(host, "proxyHost");
    if (port <= 0 || port > 65535) {
        throw domain::ConfigurationError("proxyPort out of range: " + std::to_string(port));
    }
    m_config.proxyPort = port;
    return *this;
}

HttpTransport HttpTransport::Builder::build() const {
    if (m_config.version == Version::Http2) {
        throw domain::TransportError("HTTP/2 is not supported by this transport; use Auto or Http1_1");
    }
    return HttpTransport(m_config);
}

HttpTransport::HttpTransport(Config config)
    : m_config(std::move(config)) {}

HttpTransport::Response HttpTransport::get(const Url& baseUrl,
                                           const std::string& path,
                                           const Headers& headers) const {
    auto cli = OpenClient(m_config, baseUrl);
    auto res = cli->Get(path, httplib::Headers(headers.begin(), headers.end()));
    return ToResponse(res, "GET", baseUrl, path);
}

HttpTransport::Response HttpTransport::post(const Url& baseUrl,
                                            const std::string& path,
                                            const Headers& headers,
                                            const std::string& body,
                                            const std::string& contentType) const {
    auto cli = OpenClient(m_config, baseUrl);
    auto res = cli->Post(path, httplib::Headers(headers.begin(), headers.end()), body, contentType);
    return ToResponse(res, "POST", baseUrl, path);
}

} // namespace docling::infrastructure
