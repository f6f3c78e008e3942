/**
 * @file DoclingClient.hpp
 * @brief DoclingApi implementation over HTTP.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/DoclingApi.hpp"
#include "infrastructure/HttpTransport.hpp"
#include "infrastructure/JsonMapper.hpp"
#include "infrastructure/Url.hpp"

namespace docling::infrastructure {

/**
 * @class DoclingClient
 * @brief Talks to a Docling Serve instance through HttpTransport and JsonMapper.
 *
 * The instance is immutable; reconfigure with toBuilder() or Builder(const DoclingClient&).
 */
class DoclingClient : public domain::DoclingApi {
public:
    static constexpr const char* kDefaultBaseUrl = "http://localhost:5001";
    static constexpr const char* kHealthPath = "/health";
    static constexpr const char* kConvertSourcePath = "/v1/convert/source";

    class Builder : public domain::DoclingApi::Builder {
    public:
        Builder();
        explicit Builder(const DoclingClient& client);

        /**
         * @brief Sets the base URL from text.
         * @throws domain::ConfigurationError if blank or not an absolute http(s) URL.
         */
        Builder& baseUrl(const std::string& value);
        Builder& baseUrl(Url value);
        Builder& httpTransportBuilder(HttpTransport::Builder value);
        Builder& jsonMapperBuilder(JsonMapper::Builder value);

        const Url& getBaseUrl() const { return m_baseUrl; }
        const HttpTransport::Builder& getHttpTransportBuilder() const { return m_transportBuilder; }
        const JsonMapper::Builder& getJsonMapperBuilder() const { return m_mapperBuilder; }

        /**
         * @brief Builds the client. Plaintext base URLs pin the transport to HTTP/1.1.
         * @throws domain::TransportError if the transport configuration is unsupported.
         */
        DoclingClient build() const;

        std::unique_ptr<domain::DoclingApi> buildApi() const override;

    private:
        Url m_baseUrl;
        HttpTransport::Builder m_transportBuilder;
        JsonMapper::Builder m_mapperBuilder;
    };

    static Builder builder() { return Builder(); }

    domain::health::HealthCheckResponse health() const override;

    domain::convert::ConvertDocumentResponse convertSource(
        const domain::convert::ConvertDocumentRequest& request) const override;

    std::unique_ptr<domain::DoclingApi::Builder> toBuilder() const override;

    const Url& getBaseUrl() const { return m_baseUrl; }
    const HttpTransport& getTransport() const { return m_transport; }
    const JsonMapper& getJsonMapper() const { return m_jsonMapper; }

private:
    DoclingClient(Url baseUrl, HttpTransport transport, JsonMapper jsonMapper);

    /// Throws ProtocolError unless the status is 2xx.
    static const HttpTransport::Response& EnsureSuccess(const HttpTransport::Response& response);

    Url m_baseUrl;
    HttpTransport m_transport;
    JsonMapper m_jsonMapper;
};

} // namespace docling::infrastructure
