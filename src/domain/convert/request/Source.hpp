/**
 * @file Source.hpp
 * @brief Value Objects describing where a document to convert comes from.
 */

#pragma once

#include <map>
#include <string>
#include <utility>
#include <variant>

namespace docling::domain::convert {

/**
 * @struct HttpSource
 * @brief A document the service downloads itself.
 */
struct HttpSource {
    static constexpr const char* Kind = "http";

    std::string url;
    std::map<std::string, std::string> headers; ///< Sent by the service when fetching.

    explicit HttpSource(std::string u, std::map<std::string, std::string> h = {})
        : url(std::move(u)), headers(std::move(h)) {}

    bool operator==(const HttpSource& other) const {
        return url == other.url && headers == other.headers;
    }
};

/**
 * @struct FileSource
 * @brief A document uploaded inline, base64 encoded.
 */
struct FileSource {
    static constexpr const char* Kind = "file";

    std::string base64String;
    std::string filename;

    FileSource(std::string data, std::string name)
        : base64String(std::move(data)), filename(std::move(name)) {}

    bool operator==(const FileSource& other) const {
        return base64String == other.base64String && filename == other.filename;
    }
};

using Source = std::variant<HttpSource, FileSource>;

} // namespace docling::domain::convert
