#include "core/DhcpStatsAggregator.h"
#include "core/ConnectionStatsAggregator.h"
#include "core/IpClassifier.h"
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

bool parsePoolRanges(const std::string& name, const std::string& ranges,
                     std::vector<PoolRange>& out) {
    std::vector<PoolRange> parsed;
    std::istringstream iss(ranges);
    std::string item;

    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            return false;
        }

        PoolRange range;
        range.name = name;

        auto dash = item.find('-');
        if (dash == std::string::npos) {
            auto single = parseIpv4(item);
            if (!single) {
                return false;
            }
            range.start = range.end = *single;
        } else {
            auto start = parseIpv4(trim(item.substr(0, dash)));
            auto end = parseIpv4(trim(item.substr(dash + 1)));
            if (!start || !end || *start > *end) {
                return false;
            }
            range.start = *start;
            range.end = *end;
        }
        parsed.push_back(range);
    }

    if (parsed.empty()) {
        return false;
    }
    out.insert(out.end(), parsed.begin(), parsed.end());
    return true;
}

std::vector<PoolRange> poolsFromRecords(const RecordSet& records,
                                        std::vector<std::string>* rejected) {
    std::vector<PoolRange> pools;
    for (const auto& record : records) {
        const std::string* name = findField(record, "name");
        const std::string* ranges = findField(record, "ranges");
        std::string pool_name = name ? *name : "";

        if (!ranges || !parsePoolRanges(pool_name, *ranges, pools)) {
            if (rejected) {
                rejected->push_back(pool_name.empty() ? "<unnamed>" : pool_name);
            }
        }
    }
    return pools;
}

bool isActiveLease(const RawRecord& lease) {
    const std::string* status = findField(lease, "status");
    const std::string* disabled = findField(lease, "disabled");
    return status && *status == "bound" && !(disabled && *disabled == "true");
}

LeaseSummary DhcpStatsAggregator::aggregate(const RecordSet& leases,
                                            const std::vector<PoolRange>& pools,
                                            std::chrono::system_clock::time_point now) const {
    LeaseSummary summary;
    summary.last_updated = now;
    summary.total_leases = leases.size();

    std::vector<uint64_t> used(pools.size(), 0);

    for (const auto& lease : leases) {
        if (!isActiveLease(lease)) {
            continue;
        }
        summary.active_leases++;

        const std::string* address = findField(lease, "address");
        if (!address) {
            continue;
        }
        auto parsed = parseIpv4(*address);
        if (!parsed) {
            continue;
        }

        // First matching pool wins; unmatched leases stay in the totals only
        for (size_t i = 0; i < pools.size(); ++i) {
            if (pools[i].contains(*parsed)) {
                used[i]++;
                break;
            }
        }
    }

    for (size_t i = 0; i < pools.size(); ++i) {
        PoolUsage row;
        row.name = pools[i].name;
        row.start = formatIpv4(pools[i].start);
        row.end = formatIpv4(pools[i].end);
        row.size = pools[i].size();
        row.used = used[i];
        row.available_percentage = percentageOf(row.used, row.size);
        summary.pool_size += row.size;
        summary.pool_ranges.push_back(std::move(row));
    }

    summary.usage_percentage = percentageOf(summary.active_leases, summary.pool_size);
    summary.available_ips = summary.pool_size > summary.active_leases
                                ? summary.pool_size - summary.active_leases
                                : 0;
    return summary;
}
