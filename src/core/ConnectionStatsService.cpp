#include "core/ConnectionStatsService.h"

ConnectionStatsService::ConnectionStatsService(DeviceTransport& transport, const Clock& clock,
                                               Logger& logger, std::chrono::seconds ttl,
                                               size_t top_n)
    : source_(transport, logger),
      clock_(clock),
      logger_(logger),
      aggregator_(top_n),
      cache_(ttl) {}

std::optional<ConnectionSummary> ConnectionStatsService::getConnectionStats(int64_t device_id) {
    auto now = clock_.now();
    if (auto cached = cache_.get(device_id, now)) {
        return cached;
    }
    // Taken before fetching so an invalidation during the fetch wins
    const uint64_t generation = cache_.generation(device_id);

    auto records = source_.fetch(device_id, kQuery);
    if (!records) {
        return std::nullopt;
    }

    // Stamp with the time the snapshot was taken
    now = clock_.now();
    ConnectionSummary summary = aggregator_.aggregate(*records, now);
    if (!cache_.put(device_id, summary, now, generation)) {
        logger_.debug("Connection stats for device " + std::to_string(device_id) +
                      " invalidated during fetch, not cached");
    }

    logger_.debug("Connection stats for device " + std::to_string(device_id) + ": " +
                  std::to_string(summary.total_connections) + " connections");
    return summary;
}

void ConnectionStatsService::clearCache(int64_t device_id) {
    cache_.invalidate(device_id);
}

void ConnectionStatsService::clearAllCache() {
    cache_.invalidateAll();
}
