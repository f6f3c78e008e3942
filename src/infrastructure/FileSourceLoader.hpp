/**
 * @file FileSourceLoader.hpp
 * @brief Reads local documents into inline (base64) conversion sources.
 */

#pragma once

#include <climits>
#include <cstddef>
#include <string>
#include "domain/convert/request/Source.hpp"

namespace docling::infrastructure {

class FileSourceLoader {
public:
    /** @brief Largest input whose base64 form still fits EVP_EncodeBlock's int length. */
    static constexpr std::size_t kMaxEncodableBytes = static_cast<std::size_t>(INT_MAX / 4 * 3);

    /**
     * @brief Reads a file and wraps it as a FileSource named after the file.
     * @throws domain::ConfigurationError if the file cannot be read or exceeds kMaxEncodableBytes.
     */
    static domain::convert::FileSource Load(const std::string& path);

    /**
     * @brief Standard base64 (RFC 4648) with padding, no line breaks.
     * @throws domain::ConfigurationError if @p data exceeds kMaxEncodableBytes.
     */
    static std::string EncodeBase64(const std::string& data);
};

} // namespace docling::infrastructure
