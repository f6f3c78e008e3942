/**
 * @file DocumentResponse.hpp
 * @brief Value Object holding a converted document in each requested representation.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include "domain/JsonObject.hpp"

namespace docling::domain::convert {

/**
 * @class DocumentResponse
 * @brief The converted document as returned by the service.
 *
 * Every textual representation is optional: an absent value means the format was not
 * requested or not produced, which is distinct from an empty string.
 * Invariant: the JSON representation is never absent and defaults to an empty mapping.
 */
class DocumentResponse {
public:
    class Builder;

    DocumentResponse(std::optional<std::string> doctagsContent,
                     std::string filename,
                     std::optional<std::string> htmlContent,
                     JsonObject jsonContent,
                     std::optional<std::string> markdownContent,
                     std::optional<std::string> textContent)
        : m_doctagsContent(std::move(doctagsContent)),
          m_filename(std::move(filename)),
          m_htmlContent(std::move(htmlContent)),
          m_jsonContent(std::move(jsonContent)),
          m_markdownContent(std::move(markdownContent)),
          m_textContent(std::move(textContent)) {}

    /** @brief DocTags representation, if produced. */
    const std::optional<std::string>& getDoctagsContent() const { return m_doctagsContent; }

    /** @brief Name of the source document. */
    const std::string& getFilename() const { return m_filename; }

    /** @brief HTML representation, if produced. */
    const std::optional<std::string>& getHtmlContent() const { return m_htmlContent; }

    /** @brief Docling JSON representation; empty when not produced. */
    const JsonObject& getJsonContent() const { return m_jsonContent; }

    /** @brief Markdown representation, if produced. */
    const std::optional<std::string>& getMarkdownContent() const { return m_markdownContent; }

    /** @brief Plain text representation, if produced. */
    const std::optional<std::string>& getTextContent() const { return m_textContent; }

    static Builder builder();
    Builder toBuilder() const;

    bool operator==(const DocumentResponse& other) const {
        return m_doctagsContent == other.m_doctagsContent &&
               m_filename == other.m_filename &&
               m_htmlContent == other.m_htmlContent &&
               m_jsonContent == other.m_jsonContent &&
               m_markdownContent == other.m_markdownContent &&
               m_textContent == other.m_textContent;
    }

    bool operator!=(const DocumentResponse& other) const { return !(*this == other); }

private:
    std::optional<std::string> m_doctagsContent;
    std::string m_filename;
    std::optional<std::string> m_htmlContent;
    JsonObject m_jsonContent;
    std::optional<std::string> m_markdownContent;
    std::optional<std::string> m_textContent;
};

/**
 * @class DocumentResponse::Builder
 * @brief Accumulates fields and produces independent DocumentResponse instances.
 */
class DocumentResponse::Builder {
public:
    Builder() = default;

    explicit Builder(const DocumentResponse& response)
        : m_doctagsContent(response.m_doctagsContent),
          m_filename(response.m_filename),
          m_htmlContent(response.m_htmlContent),
          m_jsonContent(response.m_jsonContent),
          m_markdownContent(response.m_markdownContent),
          m_textContent(response.m_textContent) {}

    Builder& doctagsContent(std::optional<std::string> value) {
        m_doctagsContent = std::move(value);
        return *this;
    }

    Builder& filename(std::string value) {
        m_filename = std::move(value);
        return *this;
    }

    Builder& htmlContent(std::optional<std::string> value) {
        m_htmlContent = std::move(value);
        return *this;
    }

    Builder& jsonContent(JsonObject value) {
        m_jsonContent = std::move(value);
        return *this;
    }

    Builder& markdownContent(std::optional<std::string> value) {
        m_markdownContent = std::move(value);
        return *this;
    }

    Builder& textContent(std::optional<std::string> value) {
        m_textContent = std::move(value);
        return *this;
    }

    /** @brief Builds a new instance; the builder stays usable and unchanged. */
    DocumentResponse build() const {
        return DocumentResponse(m_doctagsContent, m_filename, m_htmlContent,
                                m_jsonContent, m_markdownContent, m_textContent);
    }

private:
    std::optional<std::string> m_doctagsContent;
    std::string m_filename;
    std::optional<std::string> m_htmlContent;
    JsonObject m_jsonContent;
    std::optional<std::string> m_markdownContent;
    std::optional<std::string> m_textContent;
};

inline DocumentResponse::Builder DocumentResponse::builder() {
    return Builder();
}

inline DocumentResponse::Builder DocumentResponse::toBuilder() const {
    return Builder(*this);
}

} // namespace docling::domain::convert
