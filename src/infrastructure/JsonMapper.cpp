/**
 * @file JsonMapper.cpp
 * @brief Implementation of JsonMapper.
 */

#include "infrastructure/JsonMapper.hpp"
#include "domain/DoclingErrors.hpp"
#include <initializer_list>
#include <type_traits>
#include <variant>

namespace docling::infrastructure {

using json = nlohmann::json;
using namespace docling::domain;
using namespace docling::domain::convert;

namespace {

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

void PutOptionalString(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

json ToJsonObject(const JsonObject& object) {
    json j = json::object();
    for (const auto& [key, value] : object) {
        j[key] = value;
    }
    return j;
}

void RequireObject(const json& j, const std::string& typeName) {
    if (!j.is_object()) {
        throw SerializationError(typeName + ": expected a JSON object but got " + std::string(j.type_name()));
    }
}

void CheckKnownFields(const json& j,
                      std::initializer_list<const char*> known,
                      const std::string& typeName,
                      bool failOnUnknown) {
    if (!failOnUnknown) return;
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool found = false;
        for (const char* k : known) {
            if (it.key() == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw SerializationError(typeName + ": unrecognized field '" + it.key() + "'");
        }
    }
}

/// Absent and null both read as "no value".
std::optional<std::string> ReadOptionalString(const json& j, const char* key, const std::string& typeName) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw SerializationError(typeName + "." + key + ": expected a string but got " + std::string(it->type_name()));
    }
    return it->get<std::string>();
}

std::string ReadRequiredString(const json& j, const char* key, const std::string& typeName) {
    auto value = ReadOptionalString(j, key, typeName);
    if (!value) {
        throw SerializationError(typeName + "." + key + ": required field is missing");
    }
    return *value;
}

JsonObject ReadJsonObject(const json& j, const char* key, const std::string& typeName) {
    JsonObject out;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return out;
    }
    if (!it->is_object()) {
        throw SerializationError(typeName + "." + key + ": expected an object but got " + std::string(it->type_name()));
    }
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        out.emplace(entry.key(), entry.value());
    }
    return out;
}

json SourceToJson(const Source& source) {
    return std::visit([](const auto& s) -> json {
        using T = std::decay_t<decltype(s)>;
        json j;
        j["kind"] = T::Kind;
        if constexpr (std::is_same_v<T, HttpSource>) {
            j["url"] = s.url;
            if (!s.headers.empty()) {
                j["headers"] = s.headers;
            }
        } else if constexpr (std::is_same_v<T, FileSource>) {
            j["base64_string"] = s.base64String;
            j["filename"] = s.filename;
        }
        return j;
    }, source);
}

json TargetToJson(const Target& target) {
    return std::visit([](const auto& t) -> json {
        using T = std::decay_t<decltype(t)>;
        json j;
        j["kind"] = T::Kind;
        if constexpr (std::is_same_v<T, PutTarget>) {
            j["url"] = t.url;
        }
        return j;
    }, target);
}

} // namespace

json JsonMapper::toJson(const ConvertDocumentOptions& options) const {
    json j = json::object();

    if (const auto& formats = options.getFromFormats()) {
        json list = json::array();
        for (auto f : *formats) list.push_back(InputFormatToString(f));
        j["from_formats"] = list;
    }
    if (const auto& formats = options.getToFormats()) {
        json list = json::array();
        for (auto f : *formats) list.push_back(OutputFormatToString(f));
        j["to_formats"] = list;
    }
    if (options.getImageExportMode()) {
        j["image_export_mode"] = ImageExportModeToString(*options.getImageExportMode());
    }
    PutOptional(j, "do_ocr", options.getDoOcr());
    PutOptional(j, "force_ocr", options.getForceOcr());
    PutOptionalString(j, "ocr_engine", options.getOcrEngine());
    PutOptional(j, "ocr_lang", options.getOcrLang());
    PutOptionalString(j, "pdf_backend", options.getPdfBackend());
    if (options.getTableMode()) {
        j["table_mode"] = TableFormerModeToString(*options.getTableMode());
    }
    PutOptional(j, "abort_on_error", options.getAbortOnError());
    PutOptional(j, "do_table_structure", options.getDoTableStructure());
    PutOptional(j, "include_images", options.getIncludeImages());
    PutOptional(j, "images_scale", options.getImagesScale());
    PutOptionalString(j, "md_page_break_placeholder", options.getMdPageBreakPlaceholder());
    PutOptional(j, "do_code_enrichment", options.getDoCodeEnrichment());
    PutOptional(j, "do_formula_enrichment", options.getDoFormulaEnrichment());
    PutOptional(j, "do_picture_classification", options.getDoPictureClassification());
    PutOptional(j, "do_picture_description", options.getDoPictureDescription());
    PutOptional(j, "document_timeout", options.getDocumentTimeout());
    return j;
}

json JsonMapper::toJson(const ConvertDocumentRequest& request) const {
    json j;
    j["options"] = toJson(request.getOptions());

    json sources = json::array();
    for (const auto& source : request.getSources()) {
        sources.push_back(SourceToJson(source));
    }
    j["sources"] = sources;

    if (request.getTarget()) {
        j["target"] = TargetToJson(*request.getTarget());
    }
    return j;
}

json JsonMapper::toJson(const DocumentResponse& document) const {
    json j;
    PutOptionalString(j, "doctags_content", document.getDoctagsContent());
    j["filename"] = document.getFilename();
    PutOptionalString(j, "html_content", document.getHtmlContent());
    j["json_content"] = ToJsonObject(document.getJsonContent());
    PutOptionalString(j, "md_content", document.getMarkdownContent());
    PutOptionalString(j, "text_content", document.getTextContent());
    return j;
}

json JsonMapper::toJson(const ConvertDocumentResponse& response) const {
    json j;
    j["document"] = toJson(response.getDocument());

    json errors = json::array();
    for (const auto& e : response.getErrors()) {
        errors.push_back({
            {"component_type", e.componentType},
            {"error_message", e.errorMessage},
            {"module_name", e.moduleName}
        });
    }
    j["errors"] = errors;
    j["processing_time"] = response.getProcessingTime();
    j["status"] = ConversionStatusToString(response.getStatus());
    j["timings"] = ToJsonObject(response.getTimings());
    return j;
}

json JsonMapper::toJson(const health::HealthCheckResponse& response) const {
    return ToJsonObject(response.getProperties());
}

DocumentResponse JsonMapper::readDocumentResponse(const json& j) const {
    static const std::string kType = "DocumentResponse";
    RequireObject(j, kType);
    CheckKnownFields(j, {"doctags_content", "filename", "html_content", "json_content", "md_content", "text_content"},
                     kType, m_config.failOnUnknownProperties);

    return DocumentResponse::builder()
        .doctagsContent(ReadOptionalString(j, "doctags_content", kType))
        .filename(ReadRequiredString(j, "filename", kType))
        .htmlContent(ReadOptionalString(j, "html_content", kType))
        .jsonContent(ReadJsonObject(j, "json_content", kType))
        .markdownContent(ReadOptionalString(j, "md_content", kType))
        .textContent(ReadOptionalString(j, "text_content", kType))
        .build();
}

ConvertDocumentResponse JsonMapper::readConvertDocumentResponse(const json& j) const {
    static const std::string kType = "ConvertDocumentResponse";
    RequireObject(j, kType);
    CheckKnownFields(j, {"document", "errors", "processing_time", "status", "timings"},
                     kType, m_config.failOnUnknownProperties);

    auto documentIt = j.find("document");
    if (documentIt == j.end() || documentIt->is_null()) {
        throw SerializationError(kType + ".document: required field is missing");
    }

    auto builder = ConvertDocumentResponse::builder();
    builder.document(readDocumentResponse(*documentIt));

    auto errorsIt = j.find("errors");
    if (errorsIt != j.end() && !errorsIt->is_null()) {
        if (!errorsIt->is_array()) {
            throw SerializationError(kType + ".errors: expected an array");
        }
        for (const auto& item : *errorsIt) {
            static const std::string kErrorType = "ErrorItem";
            RequireObject(item, kErrorType);
            CheckKnownFields(item, {"component_type", "error_message", "module_name"},
                             kErrorType, m_config.failOnUnknownProperties);
            builder.addError(ErrorItem{
                ReadOptionalString(item, "component_type", kErrorType).value_or(""),
                ReadOptionalString(item, "error_message", kErrorType).value_or(""),
                ReadOptionalString(item, "module_name", kErrorType).value_or("")
            });
        }
    }

    auto timeIt = j.find("processing_time");
    if (timeIt != j.end() && !timeIt->is_null()) {
        if (!timeIt->is_number()) {
            throw SerializationError(kType + ".processing_time: expected a number");
        }
        builder.processingTime(timeIt->get<double>());
    }

    if (auto status = ReadOptionalString(j, "status", kType)) {
        builder.status(ConversionStatusFromString(*status));
    }

    builder.timings(ReadJsonObject(j, "timings", kType));
    return builder.build();
}

health::HealthCheckResponse JsonMapper::readHealthCheckResponse(const json& j) const {
    static const std::string kType = "HealthCheckResponse";
    RequireObject(j, kType);

    JsonObject properties;
    for (auto it = j.begin(); it != j.end(); ++it) {
        properties.emplace(it.key(), it.value());
    }
    return health::HealthCheckResponse(std::move(properties));
}

json JsonMapper::parse(const std::string& text) const {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw SerializationError(std::string("Malformed JSON: ") + e.what());
    }
}

template <>
DocumentResponse JsonMapper::readValue<DocumentResponse>(const std::string& text) const {
    try {
        return readDocumentResponse(parse(text));
    } catch (const json::exception& e) {
        throw SerializationError(std::string("DocumentResponse: ") + e.what());
    }
}

template <>
ConvertDocumentResponse JsonMapper::readValue<ConvertDocumentResponse>(const std::string& text) const {
    try {
        return readConvertDocumentResponse(parse(text));
    } catch (const json::exception& e) {
        throw SerializationError(std::string("ConvertDocumentResponse: ") + e.what());
    }
}

template <>
health::HealthCheckResponse JsonMapper::readValue<health::HealthCheckResponse>(const std::string& text) const {
    try {
        return readHealthCheckResponse(parse(text));
    } catch (const json::exception& e) {
        throw SerializationError(std::string("HealthCheckResponse: ") + e.what());
    }
}

} // namespace docling::infrastructure
