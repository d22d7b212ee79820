#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace bfs;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configPath = config::ConfigRegistry::DEFAULT_CONFIG_PATH;
    if (args.size() >= 2 && args[0] == "-c") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) return cli::usage(std::cerr);

    try {
        config::ConfigRegistry::init(configPath);
        const auto& cfg = config::ConfigRegistry::get();
        logging::LogRegistry::init(cfg.logging);
        logging::LogRegistry::config()->debug("[blobfs] Using configuration {} (storage root {}, container '{}')",
                                              configPath, cfg.storage.root.string(), cfg.storage.container);

        return cli::execute(cfg, args, std::cout, std::cerr);
    } catch (const std::exception& e) {
        fmt::print(stderr, "blobfs: failed to load configuration {}: {}\n", configPath, e.what());
        return cli::EXIT_ERROR;
    }
}
