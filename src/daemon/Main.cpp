#include "StatsDaemon.h"
#include <csignal>
#include <iostream>

// ===================================================================
// MAIN ENTRY POINT
// ===================================================================

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == "--config") {
            config_path = argv[i + 1];
            break;
        }
    }
    if (config_path.empty()) {
        std::cerr << "Usage: " << argv[0] << " --config <routerstats.yaml>\n"
                  << "  The config lists the routers to poll under 'devices:' and the\n"
                  << "  bearer token for the stats API under 'api:'.\n"
                  << "  Example: routerstatsd --config config/routerstats.example.yaml" << std::endl;
        return 1;
    }

    std::signal(SIGINT, StatsDaemon::signalHandler);
    std::signal(SIGTERM, StatsDaemon::signalHandler);

    try {
        StatsDaemon daemon(config_path);
        daemon.setRunning(true);
        daemon.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
