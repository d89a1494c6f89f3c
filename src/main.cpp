#include <iostream>
#include <string>
#include "core/Clock.h"
#include "core/Config.h"
#include "core/ConnectionStatsService.h"
#include "core/DhcpStatsService.h"
#include "core/Logger.h"
#include "core/SummaryJson.h"
#include "net/RestDeviceTransport.h"

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  -c, --config FILE   YAML configuration (devices, logging)\n"
              << "  -d, --device ID     Device id to query\n"
              << "      --dhcp          DHCP lease statistics instead of connections\n"
              << "  -h, --help          Show this help message\n\n"
              << "Exit status: 0 success, 1 usage or config error, 2 statistics unavailable\n\n"
              << "Examples:\n"
              << "  " << prog_name << " -c routerstats.yaml -d 1\n"
              << "  " << prog_name << " -c routerstats.yaml -d 1 --dhcp\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string device_arg;
    bool dhcp = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-d" || arg == "--device") && i + 1 < argc) {
            device_arg = argv[++i];
        } else if (arg == "--dhcp") {
            dhcp = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty() || device_arg.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        int64_t device_id = std::stoll(device_arg);
        AppConfig config = loadConfigFile(config_path);

        const DeviceConfig* device = config.findDevice(device_id);
        if (!device) {
            std::cerr << "Error: device " << device_id << " is not configured" << std::endl;
            return 1;
        }

        // Diagnostics go to stderr so stdout stays pure JSON
        Logger logger(config.logging.level, config.logging.file.empty() ? "/dev/stderr" : config.logging.file,
                      config.logging.timestamps);
        SystemClock clock;
        RestDeviceTransport transport(config.devices, logger);

        if (dhcp) {
            DhcpStatsService service(transport, clock, logger, std::chrono::seconds(config.dhcp_ttl_seconds));
            if (!device->pools.empty()) {
                service.setConfiguredPools(device_id, device->pools);
            }
            auto stats = service.getDHCPStats(device_id);
            if (!stats) {
                return 2;
            }
            std::cout << toJson(*stats).dump(2) << std::endl;
        } else {
            ConnectionStatsService service(transport, clock, logger,
                                           std::chrono::seconds(config.connection_ttl_seconds), config.top_n);
            auto stats = service.getConnectionStats(device_id);
            if (!stats) {
                return 2;
            }
            std::cout << toJson(*stats).dump(2) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
