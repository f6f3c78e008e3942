/**
 * @file ConvertDocumentOptions.hpp
 * @brief Value Object with the conversion pipeline options.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ConversionFormats.hpp"

namespace docling::domain::convert {

/**
 * @class ConvertDocumentOptions
 * @brief Every option is optional; unset options are left to the service defaults.
 */
class ConvertDocumentOptions {
public:
    class Builder;

    ConvertDocumentOptions() = default;

    const std::optional<std::vector<InputFormat>>& getFromFormats() const { return m_fromFormats; }
    const std::optional<std::vector<OutputFormat>>& getToFormats() const { return m_toFormats; }
    const std::optional<ImageExportMode>& getImageExportMode() const { return m_imageExportMode; }
    const std::optional<bool>& getDoOcr() const { return m_doOcr; }
    const std::optional<bool>& getForceOcr() const { return m_forceOcr; }
    const std::optional<std::string>& getOcrEngine() const { return m_ocrEngine; }
    const std::optional<std::vector<std::string>>& getOcrLang() const { return m_ocrLang; }
    const std::optional<std::string>& getPdfBackend() const { return m_pdfBackend; }
    const std::optional<TableFormerMode>& getTableMode() const { return m_tableMode; }
    const std::optional<bool>& getAbortOnError() const { return m_abortOnError; }
    const std::optional<bool>& getDoTableStructure() const { return m_doTableStructure; }
    const std::optional<bool>& getIncludeImages() const { return m_includeImages; }
    const std::optional<double>& getImagesScale() const { return m_imagesScale; }
    const std::optional<std::string>& getMdPageBreakPlaceholder() const { return m_mdPageBreakPlaceholder; }
    const std::optional<bool>& getDoCodeEnrichment() const { return m_doCodeEnrichment; }
    const std::optional<bool>& getDoFormulaEnrichment() const { return m_doFormulaEnrichment; }
    const std::optional<bool>& getDoPictureClassification() const { return m_doPictureClassification; }
    const std::optional<bool>& getDoPictureDescription() const { return m_doPictureDescription; }

    /** @brief Per-document timeout in seconds. */
    const std::optional<double>& getDocumentTimeout() const { return m_documentTimeout; }

    static Builder builder();
    Builder toBuilder() const;

    bool operator==(const ConvertDocumentOptions& other) const {
        return m_fromFormats == other.m_fromFormats &&
               m_toFormats == other.m_toFormats &&
               m_imageExportMode == other.m_imageExportMode &&
               m_doOcr == other.m_doOcr &&
               m_forceOcr == other.m_forceOcr &&
               m_ocrEngine == other.m_ocrEngine &&
               m_ocrLang == other.m_ocrLang &&
               m_pdfBackend == other.m_pdfBackend &&
               m_tableMode == other.m_tableMode &&
               m_abortOnError == other.m_abortOnError &&
               m_doTableStructure == other.m_doTableStructure &&
               m_includeImages == other.m_includeImages &&
               m_imagesScale == other.m_imagesScale &&
               m_mdPageBreakPlaceholder == other.m_mdPageBreakPlaceholder &&
               m_doCodeEnrichment == other.m_doCodeEnrichment &&
               m_doFormulaEnrichment == other.m_doFormulaEnrichment &&
               m_doPictureClassification == other.m_doPictureClassification &&
               m_doPictureDescription == other.m_doPictureDescription &&
               m_documentTimeout == other.m_documentTimeout;
    }

    bool operator!=(const ConvertDocumentOptions& other) const { return !(*this == other); }

private:
    std::optional<std::vector<InputFormat>> m_fromFormats;
    std::optional<std::vector<OutputFormat>> m_toFormats;
    std::optional<ImageExportMode> m_imageExportMode;
    std::optional<bool> m_doOcr;
    std::optional<bool> m_forceOcr;
    std::optional<std::string> m_ocrEngine;
    std::optional<std::vector<std::string>> m_ocrLang;
    std::optional<std::string> m_pdfBackend;
    std::optional<TableFormerMode> m_tableMode;
    std::optional<bool> m_abortOnError;
    std::optional<bool> m_doTableStructure;
    std::optional<bool> m_includeImages;
    std::optional<double> m_imagesScale;
    std::optional<std::string> m_mdPageBreakPlaceholder;
    std::optional<bool> m_doCodeEnrichment;
    std::optional<bool> m_doFormulaEnrichment;
    std::optional<bool> m_doPictureClassification;
    std::optional<bool> m_doPictureDescription;
    std::optional<double> m_documentTimeout;
};

/**
 * @class ConvertDocumentOptions::Builder
 * @brief Holds a working copy of the options; build() returns a snapshot.
 */
class ConvertDocumentOptions::Builder {
public:
    Builder() = default;
    explicit Builder(const ConvertDocumentOptions& options) : m_options(options) {}

    Builder& fromFormats(std::vector<InputFormat> value) { m_options.m_fromFormats = std::move(value); return *this; }
    Builder& toFormats(std::vector<OutputFormat> value) { m_options.m_toFormats = std::move(value); return *this; }
    Builder& imageExportMode(ImageExportMode value) { m_options.m_imageExportMode = value; return *this; }
    Builder& doOcr(bool value) { m_options.m_doOcr = value; return *this; }
    Builder& forceOcr(bool value) { m_options.m_forceOcr = value; return *this; }
    Builder& ocrEngine(std::string value) { m_options.m_ocrEngine = std::move(value); return *this; }
    Builder& ocrLang(std::vector<std::string> value) { m_options.m_ocrLang = std::move(value); return *this; }
    Builder& pdfBackend(std::string value) { m_options.m_pdfBackend = std::move(value); return *this; }
    Builder& tableMode(TableFormerMode value) { m_options.m_tableMode = value; return *this; }
    Builder& abortOnError(bool value) { m_options.m_abortOnError = value; return *this; }
    Builder& doTableStructure(bool value) { m_options.m_doTableStructure = value; return *this; }
    Builder& includeImages(bool value) { m_options.m_includeImages = value; return *this; }
    Builder& imagesScale(double value) { m_options.m_imagesScale = value; return *this; }
    Builder& mdPageBreakPlaceholder(std::string value) { m_options.m_mdPageBreakPlaceholder = std::move(value); return *this; }
    Builder& doCodeEnrichment(bool value) { m_options.m_doCodeEnrichment = value; return *this; }
    Builder& doFormulaEnrichment(bool value) { m_options.m_doFormulaEnrichment = value; return *this; }
    Builder& doPictureClassification(bool value) { m_options.m_doPictureClassification = value; return *this; }
    Builder& doPictureDescription(bool value) { m_options.m_doPictureDescription = value; return *this; }
    Builder& documentTimeout(double seconds) { m_options.m_documentTimeout = seconds; return *this; }

    ConvertDocumentOptions build() const { return m_options; }

private:
    ConvertDocumentOptions m_options;
};

inline ConvertDocumentOptions::Builder ConvertDocumentOptions::builder() {
    return Builder();
}

inline ConvertDocumentOptions::Builder ConvertDocumentOptions::toBuilder() const {
    return Builder(*this);
}

} // namespace docling::domain::convert
