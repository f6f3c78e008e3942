/**
 * @file Target.hpp
 * @brief Value Objects describing where conversion results are delivered.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

namespace docling::domain::convert {

/** @brief Results returned in the response body. */
struct InBodyTarget {
    static constexpr const char* Kind = "inbody";
    bool operator==(const InBodyTarget&) const { return true; }
};

/**
 * @brief Results returned as a zip archive.
 *
 * DoclingApi::convertSource decodes only JSON bodies, so a zip reply surfaces as
 * SerializationError.
 */
struct ZipTarget {
    static constexpr const char* Kind = "zip";
    bool operator==(const ZipTarget&) const { return true; }
};

/**
 * @brief Results uploaded by the service with an HTTP PUT.
 *
 * The service acknowledges the upload rather than returning a document, so
 * DoclingApi::convertSource reports the reply as SerializationError.
 */
struct PutTarget {
    static constexpr const char* Kind = "put";

    std::string url;

    explicit PutTarget(std::string u) : url(std::move(u)) {}

    bool operator==(const PutTarget& other) const { return url == other.url; }
};

using Target = std::variant<InBodyTarget, ZipTarget, PutTarget>;

} // namespace docling::domain::convert
