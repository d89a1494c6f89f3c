#include "core/DhcpStatsService.h"
#include <mutex>

DhcpStatsService::DhcpStatsService(DeviceTransport& transport, const Clock& clock,
                                   Logger& logger, std::chrono::seconds ttl)
    : source_(transport, logger),
      clock_(clock),
      logger_(logger),
      cache_(ttl) {}

void DhcpStatsService::setConfiguredPools(int64_t device_id, std::vector<PoolRange> pools) {
    {
        std::unique_lock<std::shared_mutex> lock(pools_mutex_);
        configured_pools_[device_id] = std::move(pools);
    }
    // pool layout changed, old usage figures no longer apply
    cache_.invalidate(device_id);
}

std::optional<std::vector<PoolRange>> DhcpStatsService::resolvePools(int64_t device_id) {
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        auto it = configured_pools_.find(device_id);
        if (it != configured_pools_.end() && !it->second.empty()) {
            return it->second;
        }
    }

    auto records = source_.fetch(device_id, kPoolQuery);
    if (!records) {
        return std::nullopt;
    }

    std::vector<std::string> rejected;
    auto pools = poolsFromRecords(*records, &rejected);
    for (const auto& name : rejected) {
        logger_.warn("Skipping pool '" + name + "' on device " + std::to_string(device_id) +
                     ": unparsable ranges");
    }
    return pools;
}

std::optional<LeaseSummary> DhcpStatsService::getDHCPStats(int64_t device_id) {
    auto now = clock_.now();
    if (auto cached = cache_.get(device_id, now)) {
        return cached;
    }
    // Taken before fetching so an invalidation during the fetch wins
    const uint64_t generation = cache_.generation(device_id);

    auto leases = source_.fetch(device_id, kLeaseQuery);
    if (!leases) {
        return std::nullopt;
    }

    auto pools = resolvePools(device_id);
    if (!pools) {
        return std::nullopt;
    }

    now = clock_.now();
    LeaseSummary summary = aggregator_.aggregate(*leases, *pools, now);
    if (!cache_.put(device_id, summary, now, generation)) {
        logger_.debug("DHCP stats for device " + std::to_string(device_id) +
                      " invalidated during fetch, not cached");
    }

    logger_.debug("DHCP stats for device " + std::to_string(device_id) + ": " +
                  std::to_string(summary.active_leases) + "/" +
                  std::to_string(summary.pool_size) + " addresses in use");
    return summary;
}

void DhcpStatsService::clearCache(int64_t device_id) {
    cache_.invalidate(device_id);
}

void DhcpStatsService::clearAllCache() {
    cache_.invalidateAll();
}
