#include "beast_transport.hpp"
#include "client.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

struct Config {
    std::string              apiKey;
    std::string              baseUrl    = refyne::kDefaultBaseUrl;
    int                      timeoutMs  = 30000;
    int                      maxRetries = 3;
    bool                     noCache    = false;
    bool                     verbose    = false;
    bool                     merge      = false;
    std::string              command;
    std::vector<std::string> args;
};

static void printUsage() {
    std::cout
        << "Usage: refyne_cli [options] <command> [args]\n\n"
        << "Commands:\n"
        << "  usage                        Show usage for the billing period\n"
        << "  extract <url> <schema-json>  Extract data from one page\n"
        << "  crawl <url> <schema-json>    Start a crawl job\n"
        << "  analyze <url>                Suggest a schema for a site\n"
        << "  jobs                         List jobs\n"
        << "  job <id>                     Show one job\n"
        << "  results <id> [--merge]       Show job results\n"
        << "  schemas | sites | keys       List saved resources\n"
        << "  providers                    List LLM providers\n\n"
        << "Options:\n"
        << "  --api-key KEY      API key (default: $REFYNE_API_KEY)\n"
        << "  --base-url URL     API base URL    (default: https://api.refyne.uk)\n"
        << "  --timeout-ms N     Per-attempt timeout in ms (default: 30000)\n"
        << "  --max-retries N    Retries for transient errors (default: 3)\n"
        << "  --no-cache         Disable the response cache\n"
        << "  --verbose          Log requests and retries to stderr\n"
        << "  --help, -h         Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    if (const char* env = std::getenv("REFYNE_API_KEY")) {
        cfg.apiKey = env;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--api-key") && i + 1 < argc) {
            cfg.apiKey = argv[++i];
        } else if ((arg == "--base-url") && i + 1 < argc) {
            cfg.baseUrl = argv[++i];
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--max-retries") && i + 1 < argc) {
            cfg.maxRetries = std::stoi(argv[++i]);
        } else if (arg == "--no-cache") {
            cfg.noCache = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--merge") {
            cfg.merge = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        } else if (cfg.command.empty()) {
            cfg.command = arg;
        } else {
            cfg.args.push_back(arg);
        }
    }
    return cfg;
}

static const std::string& requireArg(const Config& cfg, std::size_t index,
                                     const char* name) {
    if (index >= cfg.args.size()) {
        throw std::invalid_argument(cfg.command + ": missing <" + name + ">");
    }
    return cfg.args[index];
}

static nlohmann::json runCommand(refyne::Client& client, const Config& cfg) {
    using nlohmann::json;

    if (cfg.command == "usage") {
        return client.executeRaw("GET", "/api/v1/usage");
    }
    if (cfg.command == "extract" || cfg.command == "crawl") {
        const json body = {
            {"url", requireArg(cfg, 0, "url")},
            {"schema", json::parse(requireArg(cfg, 1, "schema-json"))}
        };
        return client.executeRaw("POST", "/api/v1/" + cfg.command, body);
    }
    if (cfg.command == "analyze") {
        return client.executeRaw("POST", "/api/v1/analyze",
                                 {{"url", requireArg(cfg, 0, "url")}});
    }
    if (cfg.command == "jobs") {
        return client.executeRaw("GET", "/api/v1/jobs");
    }
    if (cfg.command == "job") {
        return client.executeRaw("GET", "/api/v1/jobs/" + requireArg(cfg, 0, "id"));
    }
    if (cfg.command == "results") {
        std::string path = "/api/v1/jobs/" + requireArg(cfg, 0, "id") + "/results";
        if (cfg.merge) path += "?merge=true";
        return client.executeRaw("GET", path);
    }
    if (cfg.command == "schemas" || cfg.command == "sites" || cfg.command == "keys") {
        return client.executeRaw("GET", "/api/v1/" + cfg.command);
    }
    if (cfg.command == "providers") {
        return client.executeRaw("GET", "/api/v1/llm/providers");
    }
    throw std::invalid_argument("Unknown command: " + cfg.command);
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.command.empty()) {
            printUsage();
            return 1;
        }
        if (cfg.apiKey.empty()) {
            std::cerr << "No API key: pass --api-key or set REFYNE_API_KEY\n";
            return 1;
        }

        if (cfg.verbose) {
            std::cerr
                << "=== refyne_cli ===\n"
                << "Base URL:    " << cfg.baseUrl    << "\n"
                << "Timeout:     " << cfg.timeoutMs  << " ms\n"
                << "Max retries: " << cfg.maxRetries << "\n"
                << "Cache:       " << (cfg.noCache ? "off" : "on") << "\n"
                << "==================\n\n";
        }

        refyne::ClientOptions options;
        options.baseUrl      = cfg.baseUrl;
        options.timeout      = std::chrono::milliseconds(cfg.timeoutMs);
        options.maxRetries   = cfg.maxRetries;
        options.cacheEnabled = !cfg.noCache;
        options.transport    = std::make_shared<refyne::BeastTransport>(cfg.verbose);
        options.logger       = std::make_shared<refyne::StderrLogger>(
            cfg.verbose ? refyne::StderrLogger::Level::Debug
                        : refyne::StderrLogger::Level::Warn);
        options.userAgentSuffix = "refyne-cli";

        refyne::Client client(cfg.apiKey, options);
        std::cout << std::setw(2) << runCommand(client, cfg) << "\n";
        return 0;

    } catch (const refyne::ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        for (const auto& [field, problem] : e.fields()) {
            std::cerr << "  - " << field << ": " << problem << "\n";
        }
        return 2;
    } catch (const refyne::RateLimitError& e) {
        std::cerr << "Error: " << e.what() << " (retry after "
                  << e.retryAfterSeconds() << "s)\n";
        return 2;
    } catch (const refyne::RefyneError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
