/**
 * @file HealthCheckResponse.hpp
 * @brief Value Object for the service health payload.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include "domain/JsonObject.hpp"

namespace docling::domain::health {

/**
 * @class HealthCheckResponse
 * @brief Passthrough of whatever the health endpoint returns.
 */
class HealthCheckResponse {
public:
    class Builder;

    explicit HealthCheckResponse(JsonObject properties)
        : m_properties(std::move(properties)) {}

    /** @brief The "status" field, when present and a string. */
    std::optional<std::string> getStatus() const {
        auto it = m_properties.find("status");
        if (it != m_properties.end() && it->second.is_string()) {
            return it->second.get<std::string>();
        }
        return std::nullopt;
    }

    /** @brief Every field of the payload, verbatim. */
    const JsonObject& getProperties() const { return m_properties; }

    static Builder builder();
    Builder toBuilder() const;

    bool operator==(const HealthCheckResponse& other) const { return m_properties == other.m_properties; }
    bool operator!=(const HealthCheckResponse& other) const { return !(*this == other); }

private:
    JsonObject m_properties;
};

class HealthCheckResponse::Builder {
public:
    Builder() = default;
    explicit Builder(const HealthCheckResponse& response) : m_properties(response.m_properties) {}

    Builder& status(const std::string& value) {
        m_properties["status"] = value;
        return *this;
    }

    Builder& property(const std::string& key, nlohmann::json value) {
        m_properties[key] = std::move(value);
        return *this;
    }

    Builder& properties(JsonObject value) {
        m_properties = std::move(value);
        return *this;
    }

    HealthCheckResponse build() const { return HealthCheckResponse(m_properties); }

private:
    JsonObject m_properties;
};

inline HealthCheckResponse::Builder HealthCheckResponse::builder() {
    return Builder();
}

inline HealthCheckResponse::Builder HealthCheckResponse::toBuilder() const {
    return Builder(*this);
}

} // namespace docling::domain::health
