// drawlink_url: reads a diagram request and prints its draw.io link.
//
//   drawlink_url [--icons DIR] [--margin N] [--config FILE] [--log-level L]
//                [--decode] [request.json|-]
//
// With --decode the input is a link and the embedded XML is printed.
// Logs go to stderr; stdout carries only the result.

#include <drawlink/drawlink.h>
#include <drawlink/common/Logger.h>

#include <iostream>
#include <iterator>
#include <optional>
#include <string>

using namespace drawlink;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--icons DIR] [--margin N] [--config FILE] [--log-level L]"
                 " [--decode] [request.json|-]\n";
}

std::string readStdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> iconDir;
    std::optional<std::string> configPath;
    std::optional<std::string> margin;
    std::optional<std::string> logLevel;
    std::string input = "-";
    bool decode = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--icons" && i + 1 < argc) {
            iconDir = argv[++i];
        } else if (arg == "--margin" && i + 1 < argc) {
            margin = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--decode") {
            decode = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            printUsage(argv[0]);
            return 2;
        } else {
            input = arg;
        }
    }

    Logger::initialize();
    if (logLevel) {
        Logger::setLevel(Logger::parseLevel(*logLevel));
    }

    try {
        PipelineConfig config;
        if (configPath) {
            config = PipelineConfig::fromFile(*configPath);
        }
        if (margin) {
            config.options.layout.margin = std::stod(*margin);
        }
        if (iconDir) {
            config.iconBundle = *iconDir;
        }

        StyleCatalog& catalog = StyleCatalog::shared();
        if (config.iconBundle) {
            size_t added = catalog.loadIconBundle(*config.iconBundle);
            LOG_INFO("loaded {} icons from {}", added, *config.iconBundle);
        }

        DiagramPipeline pipeline(catalog, config.options);

        if (decode) {
            std::string url = input == "-" ? readStdin() : input;
            while (!url.empty() && (url.back() == '\n' || url.back() == '\r')) {
                url.pop_back();
            }
            std::cout << pipeline.decodeUrl(url) << std::endl;
        } else {
            DiagramRequest request = input == "-" ? RequestParser::fromJson(readStdin())
                                                  : RequestParser::fromJsonFile(input);
            std::cout << pipeline.generateUrl(request) << std::endl;
        }
    } catch (const DiagramError& e) {
        LOG_ERROR("{}", e.what());
        Logger::flush();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("unexpected failure: {}", e.what());
        Logger::flush();
        return 1;
    }

    Logger::flush();
    return 0;
}
