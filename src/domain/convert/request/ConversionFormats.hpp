/**
 * @file ConversionFormats.hpp
 * @brief Enumerations of the conversion options, with their wire names.
 */

#pragma once

#include <optional>
#include <string>

namespace docling::domain::convert {

enum class InputFormat {
    Docx,
    Pptx,
    Html,
    Image,
    Pdf,
    Asciidoc,
    Md,
    Csv,
    Xlsx,
    XmlUspto,
    XmlJats,
    JsonDocling
};

enum class OutputFormat {
    Markdown,
    Json,
    Html,
    Text,
    Doctags
};

enum class ImageExportMode {
    Placeholder,
    Embedded,
    Referenced
};

/** @brief Table structure model accuracy. */
enum class TableFormerMode {
    Fast,
    Accurate
};

inline std::string InputFormatToString(InputFormat format) {
    switch (format) {
        case InputFormat::Docx: return "docx";
        case InputFormat::Pptx: return "pptx";
        case InputFormat::Html: return "html";
        case InputFormat::Image: return "image";
        case InputFormat::Pdf: return "pdf";
        case InputFormat::Asciidoc: return "asciidoc";
        case InputFormat::Md: return "md";
        case InputFormat::Csv: return "csv";
        case InputFormat::Xlsx: return "xlsx";
        case InputFormat::XmlUspto: return "xml_uspto";
        case InputFormat::XmlJats: return "xml_jats";
        case InputFormat::JsonDocling: return "json_docling";
    }
    return "pdf";
}

inline std::string OutputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown: return "md";
        case OutputFormat::Json: return "json";
        case OutputFormat::Html: return "html";
        case OutputFormat::Text: return "text";
        case OutputFormat::Doctags: return "doctags";
    }
    return "md";
}

inline std::optional<OutputFormat> OutputFormatFromString(const std::string& value) {
    if (value == "md" || value == "markdown") return OutputFormat::Markdown;
    if (value == "json") return OutputFormat::Json;
    if (value == "html") return OutputFormat::Html;
    if (value == "text" || value == "txt") return OutputFormat::Text;
    if (value == "doctags") return OutputFormat::Doctags;
    return std::nullopt;
}

inline std::string ImageExportModeToString(ImageExportMode mode) {
    switch (mode) {
        case ImageExportMode::Placeholder: return "placeholder";
        case ImageExportMode::Embedded: return "embedded";
        case ImageExportMode::Referenced: return "referenced";
    }
    return "placeholder";
}

inline std::string TableFormerModeToString(TableFormerMode mode) {
    switch (mode) {
        case TableFormerMode::Fast: return "fast";
        case TableFormerMode::Accurate: return "accurate";
    }
    return "fast";
}

} // namespace docling::domain::convert
