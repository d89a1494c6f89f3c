#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include "core/Clock.h"
#include "core/ConnectionStatsAggregator.h"
#include "core/DeviceTransport.h"
#include "core/Logger.h"
#include "core/RecordSource.h"
#include "core/TtlCache.h"

// Connection-tracking statistics per device, cached for `ttl`.
class ConnectionStatsService {
public:
    static constexpr const char* kQuery = "/ip/firewall/connection/print";

    ConnectionStatsService(DeviceTransport& transport, const Clock& clock, Logger& logger,
                           std::chrono::seconds ttl = std::chrono::seconds(60),
                           size_t top_n = 10);

    // Cached summary when fresh, otherwise a new one from the device.
    // nullopt when the device could not be queried.
    std::optional<ConnectionSummary> getConnectionStats(int64_t device_id);

    // Force recomputation on the next request
    void clearCache(int64_t device_id);
    void clearAllCache();

private:
    RecordSource source_;
    const Clock& clock_;
    Logger& logger_;
    ConnectionStatsAggregator aggregator_;
    TtlCache<ConnectionSummary> cache_;
};
