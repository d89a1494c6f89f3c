#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "core/Clock.h"
#include "core/DeviceTransport.h"
#include "core/DhcpStatsAggregator.h"
#include "core/Logger.h"
#include "core/RecordSource.h"
#include "core/TtlCache.h"

// DHCP lease statistics per device, cached for `ttl`.
// Pools come from configuration when set for the device, otherwise
// from the device's own pool table.
class DhcpStatsService {
public:
    static constexpr const char* kLeaseQuery = "/ip/dhcp-server/lease/print";
    static constexpr const char* kPoolQuery = "/ip/pool/print";

    DhcpStatsService(DeviceTransport& transport, const Clock& clock, Logger& logger,
                     std::chrono::seconds ttl = std::chrono::seconds(60));

    void setConfiguredPools(int64_t device_id, std::vector<PoolRange> pools);

    std::optional<LeaseSummary> getDHCPStats(int64_t device_id);

    void clearCache(int64_t device_id);
    void clearAllCache();

private:
    std::optional<std::vector<PoolRange>> resolvePools(int64_t device_id);

    RecordSource source_;
    const Clock& clock_;
    Logger& logger_;
    DhcpStatsAggregator aggregator_;
    TtlCache<LeaseSummary> cache_;

    std::unordered_map<int64_t, std::vector<PoolRange>> configured_pools_;
    mutable std::shared_mutex pools_mutex_;
};
