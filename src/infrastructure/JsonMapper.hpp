/**
 * @file JsonMapper.hpp
 * @brief JSON codec for the Docling value objects (nlohmann::json).
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/DoclingErrors.hpp"
#include "domain/convert/request/ConvertDocumentRequest.hpp"
#include "domain/convert/response/ConvertDocumentResponse.hpp"
#include "domain/health/HealthCheckResponse.hpp"

namespace docling::infrastructure {

/**
 * @class JsonMapper
 * @brief Maps value objects to the service's snake_case JSON and back.
 *
 * Absent optional fields are omitted, never written as null. Decoding failures of any
 * kind surface as domain::SerializationError.
 */
class JsonMapper {
public:
    struct Config {
        int indent = -1;                      ///< -1 writes compact JSON.
        bool failOnUnknownProperties = false; ///< Reject fields the model does not know.
    };

    class Builder {
    public:
        Builder() = default;
        explicit Builder(Config config) : m_config(config) {}

        Builder& indent(int value) { m_config.indent = value; return *this; }
        Builder& failOnUnknownProperties(bool value) { m_config.failOnUnknownProperties = value; return *this; }

        const Config& getConfig() const { return m_config; }
        JsonMapper build() const { return JsonMapper(m_config); }

    private:
        Config m_config;
    };

    static Builder builder() { return Builder(); }
    Builder toBuilder() const { return Builder(m_config); }

    const Config& getConfig() const { return m_config; }

    nlohmann::json toJson(const domain::convert::ConvertDocumentRequest& request) const;
    nlohmann::json toJson(const domain::convert::ConvertDocumentOptions& options) const;
    nlohmann::json toJson(const domain::convert::DocumentResponse& document) const;
    nlohmann::json toJson(const domain::convert::ConvertDocumentResponse& response) const;
    nlohmann::json toJson(const domain::health::HealthCheckResponse& response) const;

    domain::convert::DocumentResponse readDocumentResponse(const nlohmann::json& j) const;
    domain::convert::ConvertDocumentResponse readConvertDocumentResponse(const nlohmann::json& j) const;
    domain::health::HealthCheckResponse readHealthCheckResponse(const nlohmann::json& j) const;

    /**
     * @brief Serializes any supported value object using the configured indent.
     * @throws domain::SerializationError if a string is not valid UTF-8.
     */
    template <typename T>
    std::string writeValueAsString(const T& value) const {
        try {
            return toJson(value).dump(m_config.indent);
        } catch (const nlohmann::json::exception& e) {
            throw domain::SerializationError(std::string("Cannot encode JSON: ") + e.what());
        }
    }

    /**
     * @brief Parses text into one of the supported response types.
     * @throws domain::SerializationError on malformed or incompatible JSON.
     */
    template <typename T>
    T readValue(const std::string& text) const;

private:
    explicit JsonMapper(Config config) : m_config(config) {}

    nlohmann::json parse(const std::string& text) const;

    Config m_config;
};

template <>
domain::convert::DocumentResponse JsonMapper::readValue<domain::convert::DocumentResponse>(const std::string& text) const;

template <>
domain::convert::ConvertDocumentResponse JsonMapper::readValue<domain::convert::ConvertDocumentResponse>(const std::string& text) const;

template <>
domain::health::HealthCheckResponse JsonMapper::readValue<domain::health::HealthCheckResponse>(const std::string& text) const;

} // namespace docling::infrastructure
