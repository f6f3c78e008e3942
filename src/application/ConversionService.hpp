/**
 * @file ConversionService.hpp
 * @brief Use cases of the command line tool on top of DoclingApi.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/DoclingApi.hpp"

namespace docling::application {

/**
 * @class ConversionService
 * @brief Health checks, conversions of URLs or local files, and writing results to disk.
 */
class ConversionService {
public:
    /** @throws domain::ConfigurationError if @p api is null. */
    explicit ConversionService(std::shared_ptr<domain::DoclingApi> api);

    domain::health::HealthCheckResponse checkHealth() const;

    /** @brief Asks the service to fetch and convert a remote document. */
    domain::convert::ConvertDocumentResponse convertUrl(const std::string& url,
                                                        const std::vector<domain::convert::OutputFormat>& formats) const;

    /** @brief Uploads a local document inline and converts it. */
    domain::convert::ConvertDocumentResponse convertFile(const std::string& path,
                                                         const std::vector<domain::convert::OutputFormat>& formats) const;

    /**
     * @brief Writes every representation present in @p document into @p outputDir.
     *
     * Files are named after the document's stem: .md, .html, .txt, .doctags and .json.
     * The JSON representation is written only when non-empty.
     * @return Paths of the written files.
     * @throws std::runtime_error if a file cannot be written.
     */
    std::vector<std::string> writeOutputs(const domain::convert::DocumentResponse& document,
                                          const std::string& outputDir) const;

private:
    domain::convert::ConvertDocumentResponse convert(domain::convert::Source source,
                                                     const std::vector<domain::convert::OutputFormat>& formats) const;

    std::shared_ptr<domain::DoclingApi> m_api;
};

} // namespace docling::application
