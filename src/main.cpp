#include "api_client.hpp"
#include "config.hpp"
#include "models.hpp"
#include "pagination.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct CliOptions {
    fetch_engine::ClientConfig client;
    std::vector<std::string>   paths;
    std::optional<std::string> paginatePath;
    int                        pageSize = 100;
    std::optional<int>         maxPages;
};

static void printUsage() {
    std::cout
        << "Usage: fetch_engine [options] [PATH...]\n\n"
        << "Fetches every PATH as one concurrent batch, or walks a paginated\n"
        << "resource with --paginate.\n\n"
        << "Options:\n"
        << "  --config FILE      JSON client configuration\n"
        << "  --base-url URL     Prefix for relative paths\n"
        << "  --header K:V       Default header (repeatable)\n"
        << "  --rps N            Sustained requests per second  (default: 10)\n"
        << "  --burst N          Token-bucket burst size        (default: 50)\n"
        << "  --max-concurrent N Concurrent attempts            (default: 10)\n"
        << "  --max-retries N    Retries per request            (default: 3)\n"
        << "  --timeout-ms N     Per-request timeout in ms      (default: 30000)\n"
        << "  --paginate PATH    Walk PATH page by page\n"
        << "  --page-size N      Items per page                 (default: 100)\n"
        << "  --max-pages N      Stop after N pages\n"
        << "  --verbose          Enable verbose diagnostics\n"
        << "  --help, -h         Show this message\n";
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    // --config is applied first so explicit flags override the file.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            opts.client = fetch_engine::loadClientConfig(argv[i + 1]);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--base-url" && i + 1 < argc) {
            opts.client.baseUrl = argv[++i];
        } else if (arg == "--header" && i + 1 < argc) {
            std::string header = argv[++i];
            auto colon = header.find(':');
            if (colon == std::string::npos) {
                std::cerr << "Malformed header (expected K:V): " << header << "\n";
                std::exit(1);
            }
            std::string value = header.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            opts.client.defaultHeaders[header.substr(0, colon)] = value;
        } else if (arg == "--rps" && i + 1 < argc) {
            opts.client.rateLimit.requestsPerSecond = std::stod(argv[++i]);
        } else if (arg == "--burst" && i + 1 < argc) {
            opts.client.rateLimit.burstSize = std::stoi(argv[++i]);
        } else if (arg == "--max-concurrent" && i + 1 < argc) {
            opts.client.maxConcurrent = std::stoi(argv[++i]);
        } else if (arg == "--max-retries" && i + 1 < argc) {
            opts.client.retry.maxRetries = std::stoi(argv[++i]);
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            opts.client.timeout = std::chrono::milliseconds(std::stoi(argv[++i]));
        } else if (arg == "--paginate" && i + 1 < argc) {
            opts.paginatePath = argv[++i];
        } else if (arg == "--page-size" && i + 1 < argc) {
            opts.pageSize = std::stoi(argv[++i]);
        } else if (arg == "--max-pages" && i + 1 < argc) {
            opts.maxPages = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            opts.client.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        } else {
            opts.paths.push_back(arg);
        }
    }
    return opts;
}

// One JSON document per line so the output can be piped into jq.
static void printResults(const std::vector<fetch_engine::ResponseRecord>& results) {
    for (const auto& r : results) {
        std::cout << r.toJson().dump() << "\n";
    }
}

int main(int argc, char* argv[]) {
    try {
        CliOptions opts = parseArgs(argc, argv);
        const auto& cfg = opts.client;

        if (opts.paths.empty() && !opts.paginatePath) {
            printUsage();
            return 1;
        }

        // Records go to stdout, everything else to stderr.
        std::cerr
            << "=== fetch_engine ===\n"
            << "Base URL:        " << (cfg.baseUrl.empty() ? "(none)" : cfg.baseUrl) << "\n"
            << "Rate:            " << cfg.rateLimit.requestsPerSecond << " req/s, burst "
                                   << cfg.rateLimit.burstSize << "\n"
            << "Max concurrent:  " << cfg.maxConcurrent << "\n"
            << "Max retries:     " << cfg.retry.maxRetries << "\n"
            << "Timeout:         " << cfg.timeout.count() << " ms\n"
            << "Verbose:         " << (cfg.verbose ? "yes" : "no") << "\n"
            << "====================\n\n";

        fetch_engine::ApiClient client(cfg);
        client.open();

        std::vector<fetch_engine::ResponseRecord> results;
        if (opts.paginatePath) {
            fetch_engine::RequestDescriptor base;
            base.url = *opts.paginatePath;

            fetch_engine::PaginationOptions pagination;
            pagination.pageSize = opts.pageSize;
            pagination.maxPages = opts.maxPages;

            results = client.paginate(base, pagination);
            std::cerr << "--- Pages (" << results.size() << ") ---\n";
        } else {
            std::vector<fetch_engine::RequestDescriptor> requests;
            for (const auto& path : opts.paths) {
                fetch_engine::RequestDescriptor request;
                request.url = path;
                requests.push_back(std::move(request));
            }

            results = client.batch(std::move(requests),
                [verbose = cfg.verbose](std::size_t done, std::size_t total) {
                    if (verbose) {
                        std::cerr << "[main] Progress " << done << "/" << total << "\n";
                    }
                });
            std::cerr << "--- Responses (" << results.size() << ") ---\n";
        }
        printResults(results);

        const auto stats = client.stats();
        client.close();

        std::cerr
            << "\n=== Summary Report ===\n"
            << "Total requests:      " << stats.totalRequests      << "\n"
            << "Successful:          " << stats.successfulRequests << "\n"
            << "Failed:              " << stats.failedRequests     << "\n"
            << "Retried:             " << stats.retriedRequests    << "\n"
            << "Rate-limited waits:  " << stats.rateLimitedWaits   << "\n"
            << "Success rate (%):    " << std::fixed << std::setprecision(2)
                                       << stats.successRate()      << "\n"
            << "Avg response (s):    " << std::fixed << std::setprecision(3)
                                       << stats.averageResponseTime() << "\n"
            << "======================\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
