#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "core/Records.h"

// Contiguous address range of a DHCP pool, host order, inclusive
struct PoolRange {
    std::string name;
    uint32_t start = 0;
    uint32_t end = 0;

    uint64_t size() const { return static_cast<uint64_t>(end) - start + 1; }
    bool contains(uint32_t address) const { return address >= start && address <= end; }
};

struct PoolUsage {
    std::string name;
    std::string start;
    std::string end;
    uint64_t size = 0;
    // Bound, enabled leases inside the range. Waiting, offered and disabled
    // leases are not counted, matching LeaseSummary::active_leases.
    uint64_t used = 0;
    double available_percentage = 0.0;  // used / size * 100
};

// Summary of one lease table snapshot
struct LeaseSummary {
    uint64_t total_leases = 0;
    uint64_t active_leases = 0;
    double usage_percentage = 0.0;
    uint64_t pool_size = 0;
    uint64_t available_ips = 0;
    std::vector<PoolUsage> pool_ranges;
    std::chrono::system_clock::time_point last_updated;
};

// Parse a pool "ranges" value: comma separated "A-B" ranges or single
// addresses. Returns false and leaves `out` untouched on any bad entry.
bool parsePoolRanges(const std::string& name, const std::string& ranges,
                     std::vector<PoolRange>& out);

// Pool definitions from an /ip/pool listing (fields: name, ranges).
// Entries that do not parse are returned in `rejected`.
std::vector<PoolRange> poolsFromRecords(const RecordSet& records,
                                        std::vector<std::string>* rejected = nullptr);

// A lease holds its address when bound and not disabled
bool isActiveLease(const RawRecord& lease);

class DhcpStatsAggregator {
public:
    LeaseSummary aggregate(const RecordSet& leases,
                           const std::vector<PoolRange>& pools,
                           std::chrono::system_clock::time_point now) const;
};
