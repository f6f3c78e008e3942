/**
 * @file DoclingErrors.hpp
 * @brief Exception types raised by the Docling client.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace docling::domain {

/**
 * @class ConfigurationError
 * @brief A required configuration value is missing or malformed.
 *
 * Raised at the point of assignment, before any network activity.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @class DoclingError
 * @brief Base class for failures of a call against the service.
 */
class DoclingError : public std::runtime_error {
public:
    explicit DoclingError(const std::string& message)
        : std::runtime_error(message) {}
};

/** @brief Connection failure, timeout, TLS failure or unsupported protocol. */
class TransportError : public DoclingError {
public:
    explicit TransportError(const std::string& message)
        : DoclingError(message) {}
};

/**
 * @class ProtocolError
 * @brief The service answered with a non-success HTTP status.
 */
class ProtocolError : public DoclingError {
public:
    ProtocolError(int status, std::string body)
        : DoclingError("HTTP status " + std::to_string(status)),
          m_status(status),
          m_body(std::move(body)) {}

    /** @brief HTTP status code returned by the service. */
    int getStatus() const { return m_status; }

    /** @brief Raw response body, left uninterpreted. */
    const std::string& getBody() const { return m_body; }

private:
    int m_status;
    std::string m_body;
};

/** @brief Malformed or schema-incompatible JSON, in either direction. */
class SerializationError : public DoclingError {
public:
    explicit SerializationError(const std::string& message)
        : DoclingError(message) {}
};

} // namespace docling::domain
