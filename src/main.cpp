#include "api_error.hpp"
#include "client.hpp"
#include "client_options.hpp"
#include "pagination.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

struct Config {
    std::string baseUrl   = "http://localhost:4000/v1";
    std::string path      = "/items";
    std::string apiKey;
    std::string bearerToken;
    int         timeoutMs  = 15000;
    int         maxRetries = 3;
    bool        debug      = false;
};

static void printUsage() {
    std::cout
        << "Usage: yourapi_fetch [options]\n\n"
        << "Options:\n"
        << "  --base-url URL       API base URL               "
           "(default: http://localhost:4000/v1)\n"
        << "  --path PATH          Cursor-paginated listing   (default: /items)\n"
        << "  --api-key KEY        Send X-API-Key\n"
        << "  --bearer-token TOK   Send Authorization: Bearer (wins over --api-key)\n"
        << "  --timeout-ms N       Per-attempt timeout in ms  (default: 15000)\n"
        << "  --max-retries N      Retries per request        (default: 3)\n"
        << "  --debug              Enable request diagnostics\n"
        << "  --help, -h           Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--base-url") && i + 1 < argc) {
            cfg.baseUrl = argv[++i];
        } else if ((arg == "--path") && i + 1 < argc) {
            cfg.path = argv[++i];
        } else if ((arg == "--api-key") && i + 1 < argc) {
            cfg.apiKey = argv[++i];
        } else if ((arg == "--bearer-token") && i + 1 < argc) {
            cfg.bearerToken = argv[++i];
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--max-retries") && i + 1 < argc) {
            cfg.maxRetries = std::stoi(argv[++i]);
        } else if (arg == "--debug") {
            cfg.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);
        if (cfg.maxRetries < 0) {
            std::cerr << "--max-retries must not be negative\n";
            return 1;
        }

        std::cout
            << "=== yourapi_fetch ===\n"
            << "Base URL:     " << cfg.baseUrl    << "\n"
            << "Path:         " << cfg.path       << "\n"
            << "Timeout:      " << cfg.timeoutMs  << " ms\n"
            << "Max retries:  " << cfg.maxRetries << "\n"
            << "Debug:        " << (cfg.debug ? "yes" : "no") << "\n"
            << "=====================\n\n";

        yourapi::ClientOptions options(cfg.baseUrl);
        options.withTimeout(std::chrono::milliseconds(cfg.timeoutMs))
               .withMaxRetries(static_cast<unsigned int>(cfg.maxRetries))
               .withDebug(cfg.debug);
        if (!cfg.apiKey.empty())      options.withApiKey(cfg.apiKey);
        if (!cfg.bearerToken.empty()) options.withBearerToken(cfg.bearerToken);

        yourapi::Client client(options);
        yourapi::CursorPaginator paginator(client);

        const auto items = paginator.fetchAll(cfg.path);

        std::cout << "--- Items (" << items.size() << ") ---\n";
        for (std::size_t i = 0; i < items.size(); ++i) {
            std::cout << std::setw(4) << (i + 1) << "  " << items[i].dump() << "\n";
        }

        const auto stats = paginator.getStats();
        std::cout
            << "\n=== Summary Report ===\n"
            << "Total items:  " << stats.totalItems << "\n"
            << "Total pages:  " << stats.totalPages << "\n"
            << "======================\n";

        return 0;

    } catch (const yourapi::APIError& e) {
        std::cerr << "API error: " << e.what() << "\n";
        if (e.details()) {
            std::cerr << "Details: " << e.details()->dump() << "\n";
        }
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
