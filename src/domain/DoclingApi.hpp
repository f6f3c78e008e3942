/**
 * @file DoclingApi.hpp
 * @brief Interface of the Docling Serve document conversion API.
 */

#pragma once
#include <memory>
#include "convert/request/ConvertDocumentRequest.hpp"
#include "convert/response/ConvertDocumentResponse.hpp"
#include "health/HealthCheckResponse.hpp"

namespace docling::domain {

/**
 * @class DoclingApi
 * @brief Abstract contract every transport binding implements.
 *
 * Calls are synchronous and independent; implementations hold immutable configuration
 * only and may be shared between threads.
 */
class DoclingApi {
public:
    /**
     * @class Builder
     * @brief Produces a configured DoclingApi implementation.
     */
    class Builder {
    public:
        virtual ~Builder() = default;

        /** @brief Builds a new API instance from the current configuration. */
        virtual std::unique_ptr<DoclingApi> buildApi() const = 0;
    };

    virtual ~DoclingApi() = default;

    /**
     * @brief Retrieves the health status of the service.
     * @throws DoclingError on any failure; no fallback value is returned.
     */
    virtual health::HealthCheckResponse health() const = 0;

    /**
     * @brief Converts the request's sources into documents.
     * @param request A fully built request.
     * @return The converted document with processing details and errors.
     * @throws DoclingError on any failure.
     */
    virtual convert::ConvertDocumentResponse convertSource(const convert::ConvertDocumentRequest& request) const = 0;

    /**
     * @brief Returns a builder seeded with this instance's configuration,
     * for copy-and-modify reconfiguration.
     */
    virtual std::unique_ptr<Builder> toBuilder() const = 0;
};

} // namespace docling::domain
