#include <cassert>
#include <iostream>
#include <string>

#include "domain/convert/response/DocumentResponse.hpp"

using namespace docling::domain;
using namespace docling::domain::convert;

namespace {

void createResponseWithAllFields() {
    JsonObject jsonContent = {
        {"title", "Test Document"},
        {"author", "Test Author"},
        {"pages", 5}
    };

    auto response = DocumentResponse::builder()
        .doctagsContent("doctags content")
        .filename("test-document.pdf")
        .htmlContent("<html><body>Test content</body></html>")
        .jsonContent(jsonContent)
        .markdownContent("# Test Document\n\nThis is a test document.")
        .textContent("Test Document\n\nThis is a test document.")
        .build();

    assert(response.getDoctagsContent() == std::string("doctags content"));
    assert(response.getFilename() == "test-document.pdf");
    assert(response.getHtmlContent() == std::string("<html><body>Test content</body></html>"));
    assert(response.getJsonContent() == jsonContent);
    assert(response.getMarkdownContent() == std::string("# Test Document\n\nThis is a test document."));
    assert(response.getTextContent() == std::string("Test Document\n\nThis is a test document."));
}

void createResponseWithUnsetFields() {
    auto response = DocumentResponse::builder().build();

    assert(!response.getDoctagsContent());
    assert(response.getFilename().empty());
    assert(!response.getHtmlContent());
    assert(response.getJsonContent().empty());
    assert(!response.getMarkdownContent());
    assert(!response.getTextContent());
}

void createResponseWithEmptyFields() {
    auto response = DocumentResponse::builder()
        .filename("empty-document.txt")
        .jsonContent({})
        .markdownContent("")
        .textContent("")
        .build();

    assert(!response.getDoctagsContent());
    assert(response.getFilename() == "empty-document.txt");
    assert(!response.getHtmlContent());
    assert(response.getJsonContent().empty());
    // Present but empty is not the same as absent.
    assert(response.getMarkdownContent().has_value() && response.getMarkdownContent()->empty());
    assert(response.getTextContent().has_value() && response.getTextContent()->empty());
}

void jsonContentIsCopiedIntoTheResponse() {
    JsonObject jsonContent = {
        {"original", "value"},
        {"count", 1}
    };

    auto builder = DocumentResponse::builder();
    builder.jsonContent(jsonContent);
    auto response = builder.build();

    assert(response.getJsonContent() == jsonContent);

    jsonContent["modified"] = "new value";

    assert(response.getJsonContent().size() == 2);
    assert(response.getJsonContent().at("original") == "value");
    assert(response.getJsonContent().at("count") == 1);
    assert(response.getJsonContent().count("modified") == 0);
}

void builderCanBeReusedAfterBuild() {
    auto builder = DocumentResponse::builder().filename("a.pdf").markdownContent("first");
    auto first = builder.build();

    builder.markdownContent("second").htmlContent("<p>second</p>");
    auto second = builder.build();

    assert(first.getMarkdownContent() == std::string("first"));
    assert(!first.getHtmlContent());
    assert(second.getMarkdownContent() == std::string("second"));
    assert(second.getHtmlContent() == std::string("<p>second</p>"));
    assert(first != second);
}

void toBuilderRoundTripsToAnEqualValue() {
    auto original = DocumentResponse::builder()
        .doctagsContent("<doctag>x</doctag>")
        .filename("report.docx")
        .jsonContent({{"schema_name", "DoclingDocument"}, {"pages", nlohmann::json::object()}})
        .textContent("x")
        .build();

    auto copy = original.toBuilder().build();
    assert(copy == original);

    auto modified = original.toBuilder().filename("other.docx").build();
    assert(modified != original);
    assert(original.getFilename() == "report.docx");
}

void fullArgumentsConstructorMatchesBuilder() {
    DocumentResponse direct(std::nullopt, "f.pdf", std::string("<p/>"), {}, std::nullopt, std::string(""));
    auto built = DocumentResponse::builder()
        .filename("f.pdf")
        .htmlContent("<p/>")
        .textContent("")
        .build();
    assert(direct == built);
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocumentResponse Test..." << std::endl;

    createResponseWithAllFields();
    createResponseWithUnsetFields();
    createResponseWithEmptyFields();
    jsonContentIsCopiedIntoTheResponse();
    builderCanBeReusedAfterBuild();
    toBuilderRoundTripsToAnEqualValue();
    fullArgumentsConstructorMatchesBuilder();

    std::cout << "[PASS] DocumentResponse Test." << std::endl;
    return 0;
}
