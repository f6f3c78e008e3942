/**
 * @file DoclingClient.cpp
 * @brief Implementation of DoclingClient.
 */

#include "infrastructure/DoclingClient.hpp"
#include "domain/DoclingErrors.hpp"
#include "domain/ValidationUtils.hpp"

namespace docling::infrastructure {

namespace {
constexpr const char* kJsonMediaType = "application/json";
}

DoclingClient::Builder::Builder()
    : m_baseUrl(Url::parse(kDefaultBaseUrl)) {}

DoclingClient::Builder::Builder(const DoclingClient& client)
    : m_baseUrl(client.m_baseUrl),
      m_transportBuilder(client.m_transport.toBuilder()),
      m_mapperBuilder(client.m_jsonMapper.toBuilder()) {}

DoclingClient::Builder& DoclingClient::Builder::baseUrl(const std::string& value) {
    m_baseUrl = Url::parse(domain::ValidationUtils::EnsureNotBlank(value, "baseUrl"));
    return *this;
}

DoclingClient::Builder& DoclingClient::Builder::baseUrl(Url value) {
    m_baseUrl = std::move(value);
    return *this;
}

DoclingClient::Builder& DoclingClient::Builder::httpTransportBuilder(HttpTransport::Builder value) {
    m_transportBuilder = std::move(value);
    return *this;
}

DoclingClient::Builder& DoclingClient::Builder::jsonMapperBuilder(JsonMapper::Builder value) {
    m_mapperBuilder = std::move(value);
    return *this;
}

DoclingClient DoclingClient::Builder::build() const {
    HttpTransport::Builder transportBuilder = m_transportBuilder;
    if (m_baseUrl.isPlaintext()) {
        // Docling Serve (FastAPI/uvicorn) does not fall back gracefully from a protocol
        // upgrade attempt over plaintext, so pin HTTP/1.1.
        transportBuilder.version(HttpTransport::Version::Http1_1);
    }
    return DoclingClient(m_baseUrl, transportBuilder.build(), m_mapperBuilder.build());
}

std::unique_ptr<domain::DoclingApi> DoclingClient::Builder::buildApi() const {
    return std::make_unique<DoclingClient>(build());
}

DoclingClient::DoclingClient(Url baseUrl, HttpTransport transport, JsonMapper jsonMapper)
    : m_baseUrl(std::move(baseUrl)),
      m_transport(std::move(transport)),
      m_jsonMapper(std::move(jsonMapper)) {}

const HttpTransport::Response& DoclingClient::EnsureSuccess(const HttpTransport::Response& response) {
    if (!response.isSuccess()) {
        throw domain::ProtocolError(response.status, response.body);
    }
    return response;
}

domain::health::HealthCheckResponse DoclingClient::health() const {
    HttpTransport::Headers headers{{"Accept", kJsonMediaType}};
    auto response = m_transport.get(m_baseUrl, m_baseUrl.resolvePath(kHealthPath), headers);
    return m_jsonMapper.readValue<domain::health::HealthCheckResponse>(EnsureSuccess(response).body);
}

domain::convert::ConvertDocumentResponse DoclingClient::convertSource(
    const domain::convert::ConvertDocumentRequest& request) const {
    HttpTransport::Headers headers{{"Accept", kJsonMediaType}};
    auto body = m_jsonMapper.writeValueAsString(request);
    auto response = m_transport.post(m_baseUrl, m_baseUrl.resolvePath(kConvertSourcePath),
                                     headers, body, kJsonMediaType);
    return m_jsonMapper.readValue<domain::convert::ConvertDocumentResponse>(EnsureSuccess(response).body);
}

std::unique_ptr<domain::DoclingApi::Builder> DoclingClient::toBuilder() const {
    return std::make_unique<Builder>(*this);
}

} // namespace docling::infrastructure
