/**
 * @file ConversionService.cpp
 * @brief Implementation of ConversionService.
 */

#include "application/ConversionService.hpp"
#include "domain/ValidationUtils.hpp"
#include "infrastructure/FileSourceLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace docling::application {

using namespace docling::domain::convert;

namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content, std::vector<std::string>& written) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Write failed for " + path.string());
    }
    written.push_back(path.string());
}

} // namespace

ConversionService::ConversionService(std::shared_ptr<domain::DoclingApi> api)
    : m_api(domain::ValidationUtils::EnsureNotNull(api, "api")) {}

domain::health::HealthCheckResponse ConversionService::checkHealth() const {
    return m_api->health();
}

ConvertDocumentResponse ConversionService::convertUrl(const std::string& url,
                                                      const std::vector<OutputFormat>& formats) const {
    domain::ValidationUtils::EnsureNotBlank(url, "url");
    return convert(HttpSource(url), formats);
}

ConvertDocumentResponse ConversionService::convertFile(const std::string& path,
                                                       const std::vector<OutputFormat>& formats) const {
    return convert(infrastructure::FileSourceLoader::Load(path), formats);
}

ConvertDocumentResponse ConversionService::convert(Source source,
                                                   const std::vector<OutputFormat>& formats) const {
    auto options = ConvertDocumentOptions::builder();
    if (!formats.empty()) {
        options.toFormats(formats);
    }

    auto request = ConvertDocumentRequest::builder()
        .addSource(std::move(source))
        .options(options.build())
        .build();

    auto response = m_api->convertSource(request);
    for (const auto& error : response.getErrors()) {
        std::cerr << "[ConversionService] " << error.componentType << "/" << error.moduleName
                  << ": " << error.errorMessage << std::endl;
    }
    return response;
}

std::vector<std::string> ConversionService::writeOutputs(const DocumentResponse& document,
                                                         const std::string& outputDir) const {
    fs::path dir(outputDir);
    fs::create_directories(dir);

    std::string stem = fs::path(document.getFilename()).stem().string();
    if (stem.empty()) {
        stem = "document";
    }

    std::vector<std::string> written;
    if (document.getMarkdownContent()) {
        WriteFile(dir / (stem + ".md"), *document.getMarkdownContent(), written);
    }
    if (document.getHtmlContent()) {
        WriteFile(dir / (stem + ".html"), *document.getHtmlContent(), written);
    }
    if (document.getTextContent()) {
        WriteFile(dir / (stem + ".txt"), *document.getTextContent(), written);
    }
    if (document.getDoctagsContent()) {
        WriteFile(dir / (stem + ".doctags"), *document.getDoctagsContent(), written);
    }
    if (!document.getJsonContent().empty()) {
        nlohmann::json j(document.getJsonContent());
        WriteFile(dir / (stem + ".json"), j.dump(2), written);
    }

    for (const auto& path : written) {
        std::cout << "[ConversionService] Wrote " << path << std::endl;
    }
    return written;
}

} // namespace docling::application
