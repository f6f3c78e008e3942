#include <cassert>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "domain/DoclingErrors.hpp"
#include "infrastructure/DoclingClient.hpp"

using namespace docling::domain;
using namespace docling::domain::convert;
using namespace docling::infrastructure;
using json = nlohmann::json;

namespace {

/// In-process stand-in for Docling Serve that records what it receives.
class FakeDoclingServe {
public:
    FakeDoclingServe() {
        m_server.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            res.set_content(R"({"status":"ok"})", "application/json");
        });

        m_server.Post("/v1/convert/source", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            auto body = json::parse(req.body);
            if (body.contains("target") && body["target"].value("kind", "") == "zip") {
                res.set_content(std::string("PK\x03\x04", 4), "application/zip");
                return;
            }
            const auto& source = body.at("sources").at(0);
            if (source.value("url", "") == "https://example.com/missing.pdf") {
                res.status = 404;
                res.set_content(R"({"detail":"source not found"})", "application/json");
                return;
            }
            if (source.value("url", "") == "https://example.com/garbled.pdf") {
                res.set_content("<html>proxy error</html>", "text/html");
                return;
            }
            json document = {
                {"filename", "2206.01062v1.pdf"},
                {"md_content", "# DocLayNet"},
                {"json_content", json::object()}
            };
            res.set_content(json{
                {"document", document},
                {"errors", json::array()},
                {"processing_time", 0.5},
                {"status", "success"},
                {"timings", json::object()}
            }.dump(), "application/json");
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        m_server.wait_until_ready();
    }

    ~FakeDoclingServe() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(m_port); }

    struct Seen {
        std::string method;
        std::string path;
        std::string accept;
        std::string contentType;
        std::string version;
        std::string body;
    };

    Seen last() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_seen.back();
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_seen.size();
    }

private:
    void record(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_seen.push_back({req.method, req.path, req.get_header_value("Accept"),
                          req.get_header_value("Content-Type"), req.version, req.body});
    }

    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;
    std::mutex m_mutex;
    std::vector<Seen> m_seen;
};

ConvertDocumentRequest RequestFor(const std::string& url) {
    return ConvertDocumentRequest::builder()
        .addSource(HttpSource(url))
        .options(ConvertDocumentOptions::builder().toFormats({OutputFormat::Markdown}).build())
        .build();
}

} // namespace

int main() {
    std::cout << "[Test] Starting DoclingClient Round-Trip Test..." << std::endl;

    FakeDoclingServe serve;
    auto client = DoclingClient::builder().baseUrl(serve.baseUrl()).build();

    // Health
    auto health = client.health();
    assert(health.getStatus() == std::string("ok"));
    auto seen = serve.last();
    assert(seen.method == "GET");
    assert(seen.path == "/health");
    assert(seen.accept == "application/json");
    assert(seen.version == "HTTP/1.1");

    // Convert
    auto response = client.convertSource(RequestFor("https://arxiv.org/pdf/2206.01062"));
    assert(response.getStatus() == ConversionStatus::Success);
    assert(response.getDocument().getFilename() == "2206.01062v1.pdf");
    assert(response.getDocument().getMarkdownContent() == std::string("# DocLayNet"));
    assert(!response.getDocument().getHtmlContent());
    seen = serve.last();
    assert(seen.method == "POST");
    assert(seen.path == "/v1/convert/source");
    assert(seen.accept == "application/json");
    assert(seen.contentType == "application/json");
    auto sent = json::parse(seen.body);
    assert(sent.at("sources").at(0).at("kind") == "http");
    assert(sent.at("options").at("to_formats") == json::array({"md"}));

    // Non-2xx status surfaces as ProtocolError with the raw body.
    bool protocolError = false;
    try {
        client.convertSource(RequestFor("https://example.com/missing.pdf"));
    } catch (const ProtocolError& e) {
        protocolError = true;
        assert(e.getStatus() == 404);
        assert(e.getBody().find("source not found") != std::string::npos);
    }
    assert(protocolError && "404 must raise ProtocolError.");

    // A 2xx body that is not JSON surfaces as SerializationError.
    bool serializationError = false;
    try {
        client.convertSource(RequestFor("https://example.com/garbled.pdf"));
    } catch (const SerializationError&) {
        serializationError = true;
    }
    assert(serializationError && "Non-JSON body must raise SerializationError.");

    // A zip target answers with an archive, which is not a convert response.
    serializationError = false;
    try {
        client.convertSource(ConvertDocumentRequest::builder()
                                 .addSource(HttpSource("https://arxiv.org/pdf/2206.01062"))
                                 .target(ZipTarget{})
                                 .build());
    } catch (const SerializationError&) {
        serializationError = true;
    }
    assert(serializationError && "Zip replies must raise SerializationError.");

    // Endpoint paths are absolute, so a base path prefix is replaced.
    auto prefixed = DoclingClient::Builder(client).baseUrl(serve.baseUrl() + "/prefix").build();
    assert(prefixed.health().getStatus() == std::string("ok"));
    assert(serve.last().path == "/health");

    // Concurrent callers share one client.
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&client, &ok]() {
            if (client.health().getStatus() == std::string("ok")) ok++;
        });
    }
    for (auto& t : threads) t.join();
    assert(ok == 8);

    std::size_t before = serve.count();

    // Connection refused surfaces as TransportError; nothing is retried.
    auto unreachable = DoclingClient::builder()
        .baseUrl("http://127.0.0.1:1")
        .httpTransportBuilder(HttpTransport::builder().connectTimeout(std::chrono::seconds(2)))
        .build();
    bool transportError = false;
    try {
        unreachable.health();
    } catch (const TransportError&) {
        transportError = true;
    }
    assert(transportError && "Refused connection must raise TransportError.");
    assert(serve.count() == before);

    std::cout << "[PASS] DoclingClient Round-Trip Test." << std::endl;
    return 0;
}
