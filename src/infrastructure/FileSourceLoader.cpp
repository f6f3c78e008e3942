/**
 * @file FileSourceLoader.cpp
 * @brief Implementation of FileSourceLoader.
 */

#include "infrastructure/FileSourceLoader.hpp"
#include "domain/DoclingErrors.hpp"
#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace docling::infrastructure {

namespace fs = std::filesystem;

domain::convert::FileSource FileSourceLoader::Load(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        throw domain::ConfigurationError("Not a readable file: " + path);
    }

    auto size = fs::file_size(p, ec);
    if (ec) {
        throw domain::ConfigurationError("Cannot stat file: " + path);
    }
    if (size > kMaxEncodableBytes) {
        throw domain::ConfigurationError("File too large to upload inline: " + path);
    }

    std::ifstream in(p, std::ios::binary);
    if (!in) {
        throw domain::ConfigurationError("Cannot open file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    return domain::convert::FileSource(EncodeBase64(buffer.str()), p.filename().string());
}

std::string FileSourceLoader::EncodeBase64(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    if (data.size() > kMaxEncodableBytes) {
        throw domain::ConfigurationError("Input too large to encode inline: " +
                                         std::to_string(data.size()) + " bytes");
    }
    // 4 output bytes per 3 input bytes, plus the terminating NUL EVP_EncodeBlock writes.
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

} // namespace docling::infrastructure
