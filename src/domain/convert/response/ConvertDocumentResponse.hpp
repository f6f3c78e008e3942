/**
 * @file ConvertDocumentResponse.hpp
 * @brief Result of a conversion call: the document plus processing metadata.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>
#include "domain/JsonObject.hpp"
#include "DocumentResponse.hpp"

namespace docling::domain::convert {

enum class ConversionStatus {
    Unknown,
    Pending,
    Started,
    Success,
    PartialSuccess,
    Failure,
    Skipped
};

inline std::string ConversionStatusToString(ConversionStatus status) {
    switch (status) {
        case ConversionStatus::Pending: return "pending";
        case ConversionStatus::Started: return "started";
        case ConversionStatus::Success: return "success";
        case ConversionStatus::PartialSuccess: return "partial_success";
        case ConversionStatus::Failure: return "failure";
        case ConversionStatus::Skipped: return "skipped";
        default: return "unknown";
    }
}

/** @brief Unrecognized values map to Unknown so newer servers stay readable. */
inline ConversionStatus ConversionStatusFromString(const std::string& value) {
    if (value == "pending") return ConversionStatus::Pending;
    if (value == "started") return ConversionStatus::Started;
    if (value == "success") return ConversionStatus::Success;
    if (value == "partial_success") return ConversionStatus::PartialSuccess;
    if (value == "failure") return ConversionStatus::Failure;
    if (value == "skipped") return ConversionStatus::Skipped;
    return ConversionStatus::Unknown;
}

/**
 * @struct ErrorItem
 * @brief A single error reported by one of the service's pipeline components.
 */
struct ErrorItem {
    std::string componentType; ///< E.g. "document_backend", "model".
    std::string errorMessage;
    std::string moduleName;

    bool operator==(const ErrorItem& other) const {
        return componentType == other.componentType &&
               errorMessage == other.errorMessage &&
               moduleName == other.moduleName;
    }
};

/**
 * @class ConvertDocumentResponse
 * @brief Immutable conversion result.
 *
 * Processing timings are kept as an open mapping since their shape varies between
 * service versions.
 */
class ConvertDocumentResponse {
public:
    class Builder;

    ConvertDocumentResponse(DocumentResponse document,
                            std::vector<ErrorItem> errors,
                            double processingTime,
                            ConversionStatus status,
                            JsonObject timings)
        : m_document(std::move(document)),
          m_errors(std::move(errors)),
          m_processingTime(processingTime),
          m_status(status),
          m_timings(std::move(timings)) {}

    const DocumentResponse& getDocument() const { return m_document; }
    const std::vector<ErrorItem>& getErrors() const { return m_errors; }

    /** @brief Server-side processing time in seconds. */
    double getProcessingTime() const { return m_processingTime; }

    ConversionStatus getStatus() const { return m_status; }
    const JsonObject& getTimings() const { return m_timings; }

    bool hasErrors() const { return !m_errors.empty(); }

    static Builder builder();
    Builder toBuilder() const;

    bool operator==(const ConvertDocumentResponse& other) const {
        return m_document == other.m_document &&
               m_errors == other.m_errors &&
               m_processingTime == other.m_processingTime &&
               m_status == other.m_status &&
               m_timings == other.m_timings;
    }

    bool operator!=(const ConvertDocumentResponse& other) const { return !(*this == other); }

private:
    DocumentResponse m_document;
    std::vector<ErrorItem> m_errors;
    double m_processingTime;
    ConversionStatus m_status;
    JsonObject m_timings;
};

class ConvertDocumentResponse::Builder {
public:
    Builder() : m_document(DocumentResponse::builder().build()) {}

    explicit Builder(const ConvertDocumentResponse& response)
        : m_document(response.m_document),
          m_errors(response.m_errors),
          m_processingTime(response.m_processingTime),
          m_status(response.m_status),
          m_timings(response.m_timings) {}

    Builder& document(DocumentResponse value) {
        m_document = std::move(value);
        return *this;
    }

    Builder& errors(std::vector<ErrorItem> value) {
        m_errors = std::move(value);
        return *this;
    }

    Builder& addError(ErrorItem value) {
        m_errors.push_back(std::move(value));
        return *this;
    }

    Builder& processingTime(double value) {
        m_processingTime = value;
        return *this;
    }

    Builder& status(ConversionStatus value) {
        m_status = value;
        return *this;
    }

    Builder& timings(JsonObject value) {
        m_timings = std::move(value);
        return *this;
    }

    ConvertDocumentResponse build() const {
        return ConvertDocumentResponse(m_document, m_errors, m_processingTime, m_status, m_timings);
    }

private:
    DocumentResponse m_document;
    std::vector<ErrorItem> m_errors;
    double m_processingTime = 0.0;
    ConversionStatus m_status = ConversionStatus::Unknown;
    JsonObject m_timings;
};

inline ConvertDocumentResponse::Builder ConvertDocumentResponse::builder() {
    return Builder();
}

inline ConvertDocumentResponse::Builder ConvertDocumentResponse::toBuilder() const {
    return Builder(*this);
}

} // namespace docling::domain::convert
