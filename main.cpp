#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "application/ConversionService.hpp"
#include "domain/DoclingErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DoclingClient.hpp"
#include "infrastructure/JsonMapper.hpp"

using namespace docling;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string configPath;
    std::string baseUrl;
    std::string command;
    std::string input;
    std::string formats;
    std::string outputDir;
};

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  docling-cli [--config FILE] [--base-url URL] health\n"
              << "  docling-cli [--config FILE] [--base-url URL] convert <http-url|file> [--to md,json,html,text,doctags] [--out DIR]\n";
}

bool ParseArgs(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) return false;
            target = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(opts.configPath)) return false;
        } else if (arg == "--base-url") {
            if (!next(opts.baseUrl)) return false;
        } else if (arg == "--to") {
            if (!next(opts.formats)) return false;
        } else if (arg == "--out") {
            if (!next(opts.outputDir)) return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            return false;
        }
    }

    if (opts.command == "health") return opts.input.empty();
    if (opts.command == "convert") return !opts.input.empty();
    return false;
}

std::vector<domain::convert::OutputFormat> ParseFormats(const std::string& list) {
    std::vector<domain::convert::OutputFormat> formats;
    std::stringstream ss(list);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (token.empty()) continue;
        auto format = domain::convert::OutputFormatFromString(token);
        if (!format) {
            throw domain::ConfigurationError("Unknown output format: " + token);
        }
        formats.push_back(*format);
    }
    return formats;
}

bool IsRemote(const std::string& input) {
    return input.rfind("http://", 0) == 0 || input.rfind("https://", 0) == 0;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage();
        return kExitUsage;
    }

    try {
        std::string configPath = opts.configPath.empty()
            ? infrastructure::ConfigLoader::DefaultSettingsPath()
            : opts.configPath;
        auto settings = infrastructure::ConfigLoader::LoadClientSettings(configPath);
        infrastructure::ConfigLoader::ApplyEnvironment(settings);
        if (!opts.baseUrl.empty()) {
            settings.baseUrl = opts.baseUrl;
        }

        auto client = std::make_shared<infrastructure::DoclingClient>(settings.toClientBuilder().build());
        std::cout << "[DoclingCli] Using " << client->getBaseUrl().toString() << std::endl;

        application::ConversionService service(client);
        auto mapper = infrastructure::JsonMapper::builder().indent(2).build();

        if (opts.command == "health") {
            std::cout << mapper.writeValueAsString(service.checkHealth()) << std::endl;
            return kExitOk;
        }

        auto formats = ParseFormats(opts.formats.empty() ? "md" : opts.formats);
        auto response = IsRemote(opts.input)
            ? service.convertUrl(opts.input, formats)
            : service.convertFile(opts.input, formats);

        std::cout << "[DoclingCli] Status: " << domain::convert::ConversionStatusToString(response.getStatus())
                  << " (" << response.getProcessingTime() << "s)" << std::endl;

        if (opts.outputDir.empty()) {
            std::cout << mapper.writeValueAsString(response.getDocument()) << std::endl;
        } else {
            service.writeOutputs(response.getDocument(), opts.outputDir);
        }

        return response.getStatus() == domain::convert::ConversionStatus::Failure ? kExitError : kExitOk;
    } catch (const domain::ProtocolError& e) {
        std::cerr << "[DoclingCli] Server answered " << e.getStatus() << ": " << e.getBody() << std::endl;
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[DoclingCli] Configuration error: " << e.what() << std::endl;
    } catch (const domain::DoclingError& e) {
        std::cerr << "[DoclingCli] " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DoclingCli] Unexpected error: " << e.what() << std::endl;
    }
    return kExitError;
}
