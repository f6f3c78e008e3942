/**
 * @file ConvertDocumentRequest.hpp
 * @brief Value Object sent to the conversion endpoint.
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>
#include "domain/DoclingErrors.hpp"
#include "ConvertDocumentOptions.hpp"
#include "Source.hpp"
#include "Target.hpp"

namespace docling::domain::convert {

/**
 * @class ConvertDocumentRequest
 * @brief Sources to convert, conversion options and an optional delivery target.
 *
 * Only constructible through its Builder. Invariant: at least one source.
 */
class ConvertDocumentRequest {
public:
    class Builder;

    const std::vector<Source>& getSources() const { return m_sources; }
    const ConvertDocumentOptions& getOptions() const { return m_options; }
    const std::optional<Target>& getTarget() const { return m_target; }

    static Builder builder();
    Builder toBuilder() const;

    bool operator==(const ConvertDocumentRequest& other) const {
        return m_sources == other.m_sources &&
               m_options == other.m_options &&
               m_target == other.m_target;
    }

    bool operator!=(const ConvertDocumentRequest& other) const { return !(*this == other); }

private:
    ConvertDocumentRequest(std::vector<Source> sources,
                           ConvertDocumentOptions options,
                           std::optional<Target> target)
        : m_sources(std::move(sources)),
          m_options(std::move(options)),
          m_target(std::move(target)) {}

    std::vector<Source> m_sources;
    ConvertDocumentOptions m_options;
    std::optional<Target> m_target;
};

class ConvertDocumentRequest::Builder {
public:
    Builder() = default;

    explicit Builder(const ConvertDocumentRequest& request)
        : m_sources(request.m_sources),
          m_options(request.m_options),
          m_target(request.m_target) {}

    Builder& addSource(Source value) {
        m_sources.push_back(std::move(value));
        return *this;
    }

    Builder& sources(std::vector<Source> value) {
        m_sources = std::move(value);
        return *this;
    }

    Builder& options(ConvertDocumentOptions value) {
        m_options = std::move(value);
        return *this;
    }

    Builder& target(Target value) {
        m_target = std::move(value);
        return *this;
    }

    /** @throws ConfigurationError if no source was added. */
    ConvertDocumentRequest build() const {
        if (m_sources.empty()) {
            throw ConfigurationError("ConvertDocumentRequest: at least one source is required");
        }
        return ConvertDocumentRequest(m_sources, m_options, m_target);
    }

private:
    std::vector<Source> m_sources;
    ConvertDocumentOptions m_options;
    std::optional<Target> m_target;
};

inline ConvertDocumentRequest::Builder ConvertDocumentRequest::builder() {
    return Builder();
}

inline ConvertDocumentRequest::Builder ConvertDocumentRequest::toBuilder() const {
    return Builder(*this);
}

} // namespace docling::domain::convert
