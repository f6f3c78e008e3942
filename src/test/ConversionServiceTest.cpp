#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <variant>

#include "application/ConversionService.hpp"
#include "domain/DoclingErrors.hpp"
#include "infrastructure/FileSourceLoader.hpp"

using namespace docling::domain;
using namespace docling::domain::convert;
using namespace docling::application;
using docling::infrastructure::FileSourceLoader;

// Mock Docling API
class MockDoclingApi : public DoclingApi {
public:
    health::HealthCheckResponse health() const override {
        return health::HealthCheckResponse::builder().status("ok").build();
    }

    ConvertDocumentResponse convertSource(const ConvertDocumentRequest& request) const override {
        lastRequest = std::make_shared<ConvertDocumentRequest>(request);
        return ConvertDocumentResponse::builder()
            .document(DocumentResponse::builder()
                          .filename("report.pdf")
                          .markdownContent("# Report")
                          .textContent("Report")
                          .jsonContent({{"schema_name", "DoclingDocument"}})
                          .build())
            .status(ConversionStatus::Success)
            .build();
    }

    std::unique_ptr<DoclingApi::Builder> toBuilder() const override {
        return nullptr;
    }

    mutable std::shared_ptr<ConvertDocumentRequest> lastRequest;
};

int main() {
    std::cout << "[Test] Starting ConversionService Test..." << std::endl;

    bool threw = false;
    try {
        ConversionService invalid(nullptr);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "A null API must be rejected.");

    auto api = std::make_shared<MockDoclingApi>();
    ConversionService service(api);

    assert(service.checkHealth().getStatus() == std::string("ok"));

    // URL conversion
    auto response = service.convertUrl("https://example.com/report.pdf", {OutputFormat::Markdown, OutputFormat::Text});
    assert(response.getStatus() == ConversionStatus::Success);
    assert(api->lastRequest);
    const auto& source = api->lastRequest->getSources().at(0);
    assert(std::get<HttpSource>(source).url == "https://example.com/report.pdf");
    assert(api->lastRequest->getOptions().getToFormats()->size() == 2);

    // File conversion uploads the bytes inline.
    std::string testRoot = "test_conversion_root";
    std::filesystem::create_directories(testRoot);
    {
        std::ofstream f(testRoot + "/hello.txt", std::ios::binary);
        f << "hello";
    }
    service.convertFile(testRoot + "/hello.txt", {});
    const auto& fileSource = std::get<FileSource>(api->lastRequest->getSources().at(0));
    assert(fileSource.filename == "hello.txt");
    assert(fileSource.base64String == "aGVsbG8=");
    assert(!api->lastRequest->getOptions().getToFormats());

    threw = false;
    try {
        service.convertFile(testRoot + "/missing.pdf", {});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "A missing file must be reported before any call.");

    // Files beyond the inline upload limit are refused before reading.
    {
        std::ofstream f(testRoot + "/huge.bin", std::ios::binary);
    }
    std::filesystem::resize_file(testRoot + "/huge.bin", FileSourceLoader::kMaxEncodableBytes + 1);
    threw = false;
    try {
        service.convertFile(testRoot + "/huge.bin", {});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "Oversized files must be rejected.");

    // Base64 edge cases
    assert(FileSourceLoader::EncodeBase64("").empty());
    assert(FileSourceLoader::EncodeBase64("f") == "Zg==");
    assert(FileSourceLoader::EncodeBase64("fo") == "Zm8=");
    assert(FileSourceLoader::EncodeBase64("foo") == "Zm9v");

    // Writing outputs: only the present representations are written.
    auto written = service.writeOutputs(response.getDocument(), testRoot + "/out");
    assert(written.size() == 3);
    assert(std::filesystem::exists(testRoot + "/out/report.md"));
    assert(std::filesystem::exists(testRoot + "/out/report.txt"));
    assert(std::filesystem::exists(testRoot + "/out/report.json"));
    assert(!std::filesystem::exists(testRoot + "/out/report.html"));

    std::ifstream md(testRoot + "/out/report.md");
    std::string content((std::istreambuf_iterator<char>(md)), std::istreambuf_iterator<char>());
    assert(content == "# Report");

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConversionService Test." << std::endl;
    return 0;
}
