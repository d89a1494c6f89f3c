#include <gtest/gtest.h>
#include "core/ConnectionStatsAggregator.h"

static const auto kNow = std::chrono::system_clock::time_point{} + std::chrono::seconds(1700000000);

static RawRecord make_conn(const std::string& protocol, const std::string& src,
                           const std::string& dst, const std::string& dst_port = "") {
    RawRecord r;
    if (!protocol.empty()) r["protocol"] = protocol;
    if (!src.empty()) r["src-address"] = src;
    if (!dst.empty()) r["dst-address"] = dst;
    if (!dst_port.empty()) r["dst-port"] = dst_port;
    return r;
}

// =================================
// Test suite
// =================================

// TEST Single TCP connection to a public DNS server
TEST(ConnectionStatsAggregatorTest, SingleRecordScenario) {
    ConnectionStatsAggregator agg;
    auto s = agg.aggregate({make_conn("tcp", "192.168.1.5:1234", "8.8.8.8:53", "53")}, kNow);

    EXPECT_EQ(s.total_connections, 1u);
    EXPECT_EQ(s.active_connections, 1u);
    EXPECT_EQ(s.tcp_connections, 1u);
    EXPECT_EQ(s.udp_connections, 0u);
    EXPECT_EQ(s.icmp_connections, 0u);
    EXPECT_EQ(s.other_connections, 0u);

    ASSERT_EQ(s.top_sources.size(), 1u);
    EXPECT_EQ(s.top_sources[0].ip_address, "192.168.1.5");
    EXPECT_EQ(s.top_sources[0].connection_count, 1u);
    EXPECT_DOUBLE_EQ(s.top_sources[0].percentage, 100.0);

    ASSERT_EQ(s.top_destinations.size(), 1u);
    EXPECT_EQ(s.top_destinations[0].ip_address, "8.8.8.8");
    EXPECT_DOUBLE_EQ(s.top_destinations[0].percentage, 100.0);

    ASSERT_EQ(s.top_ports.size(), 1u);
    EXPECT_EQ(s.top_ports[0].port, 53);
    // protocol shown is the record's, service name comes from the port alone
    EXPECT_EQ(s.top_ports[0].protocol, "tcp");
    EXPECT_EQ(s.top_ports[0].connection_count, 1u);
    EXPECT_DOUBLE_EQ(s.top_ports[0].percentage, 100.0);
    ASSERT_TRUE(s.top_ports[0].service_name.has_value());
    EXPECT_EQ(*s.top_ports[0].service_name, "DNS");

    EXPECT_EQ(s.internal_connections, 0u);
    EXPECT_EQ(s.external_connections, 1u);
    EXPECT_EQ(s.last_updated, kNow);
}

// TEST Empty snapshot yields zeros and no rankings
TEST(ConnectionStatsAggregatorTest, EmptySnapshot) {
    ConnectionStatsAggregator agg;
    auto s = agg.aggregate({}, kNow);

    EXPECT_EQ(s.total_connections, 0u);
    EXPECT_EQ(s.active_connections, 0u);
    EXPECT_EQ(s.other_connections, 0u);
    EXPECT_TRUE(s.top_sources.empty());
    EXPECT_TRUE(s.top_destinations.empty());
    EXPECT_TRUE(s.top_ports.empty());
    EXPECT_EQ(s.internal_connections + s.external_connections, 0u);
}

TEST(ConnectionStatsAggregatorTest, PercentageOfZeroTotalIsZero) {
    EXPECT_DOUBLE_EQ(percentageOf(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(percentageOf(5, 0), 0.0);
    EXPECT_DOUBLE_EQ(percentageOf(1, 4), 25.0);
}

// TEST Protocol buckets always sum to total
TEST(ConnectionStatsAggregatorTest, ProtocolBucketsSumToTotal) {
    RecordSet records = {
        make_conn("tcp", "10.0.0.1", "10.0.0.2"),
        make_conn("udp", "10.0.0.1", "10.0.0.2"),
        make_conn("udp", "10.0.0.1", "10.0.0.2"),
        make_conn("icmp", "10.0.0.1", "10.0.0.2"),
        make_conn("gre", "10.0.0.1", "10.0.0.2"),
        make_conn("", "10.0.0.1", "10.0.0.2"),
        make_conn("TCP", "10.0.0.1", "10.0.0.2"),
    };

    ConnectionStatsAggregator agg;
    auto s = agg.aggregate(records, kNow);

    EXPECT_EQ(s.total_connections, 7u);
    EXPECT_EQ(s.tcp_connections, 1u);
    EXPECT_EQ(s.udp_connections, 2u);
    EXPECT_EQ(s.icmp_connections, 1u);
    EXPECT_EQ(s.other_connections, 3u);
    EXPECT_EQ(s.tcp_connections + s.udp_connections + s.icmp_connections + s.other_connections,
              s.total_connections);
}

// TEST Missing dst-address still counts protocol and source
TEST(ConnectionStatsAggregatorTest, MissingDestinationSkipsClassification) {
    ConnectionStatsAggregator agg;
    auto s = agg.aggregate({make_conn("udp", "192.168.1.9:5000", "")}, kNow);

    EXPECT_EQ(s.total_connections, 1u);
    EXPECT_EQ(s.udp_connections, 1u);
    ASSERT_EQ(s.top_sources.size(), 1u);
    EXPECT_EQ(s.top_sources[0].ip_address, "192.168.1.9");
    EXPECT_TRUE(s.top_destinations.empty());
    EXPECT_EQ(s.internal_connections, 0u);
    EXPECT_EQ(s.external_connections, 0u);
}

TEST(ConnectionStatsAggregatorTest, InternalAndExternalClassification) {
    RecordSet records = {
        make_conn("tcp", "192.168.1.2:1000", "10.0.0.5:22"),     // internal
        make_conn("tcp", "172.16.0.1:1000", "192.168.0.1:80"),   // internal
        make_conn("tcp", "192.168.1.2:1000", "1.1.1.1:443"),     // external
        make_conn("tcp", "8.8.4.4:53", "192.168.1.2:5353"),      // external
        make_conn("tcp", "", "1.1.1.1:443"),                     // unclassified
    };

    ConnectionStatsAggregator agg;
    auto s = agg.aggregate(records, kNow);

    EXPECT_EQ(s.internal_connections, 2u);
    EXPECT_EQ(s.external_connections, 2u);
    EXPECT_LE(s.internal_connections + s.external_connections, s.total_connections);
}

// TEST Rankings are descending, ties keep first-seen order
TEST(ConnectionStatsAggregatorTest, RankingIsStableOnTies) {
    RecordSet records = {
        make_conn("tcp", "10.0.0.3", "1.1.1.1"),
        make_conn("tcp", "10.0.0.1", "1.1.1.1"),
        make_conn("tcp", "10.0.0.2", "1.1.1.1"),
        make_conn("tcp", "10.0.0.2", "1.1.1.1"),
        make_conn("tcp", "10.0.0.4", "1.1.1.1"),
    };

    ConnectionStatsAggregator agg;
    auto s = agg.aggregate(records, kNow);

    ASSERT_EQ(s.top_sources.size(), 4u);
    EXPECT_EQ(s.top_sources[0].ip_address, "10.0.0.2");
    EXPECT_EQ(s.top_sources[0].connection_count, 2u);
    EXPECT_DOUBLE_EQ(s.top_sources[0].percentage, 40.0);
    EXPECT_EQ(s.top_sources[1].ip_address, "10.0.0.3");
    EXPECT_EQ(s.top_sources[2].ip_address, "10.0.0.1");
    EXPECT_EQ(s.top_sources[3].ip_address, "10.0.0.4");
}

TEST(ConnectionStatsAggregatorTest, RankingsTruncateToTopN) {
    RecordSet records;
    for (int i = 0; i < 15; ++i) {
        std::string src = "10.0.0." + std::to_string(i);
        // source i appears i+1 times
        for (int k = 0; k <= i; ++k) {
            records.push_back(make_conn("tcp", src + ":1000", "8.8.8.8:443", std::to_string(1000 + i)));
        }
    }

    ConnectionStatsAggregator agg;
    auto s = agg.aggregate(records, kNow);

    ASSERT_EQ(s.top_sources.size(), 10u);
    ASSERT_EQ(s.top_ports.size(), 10u);
    EXPECT_EQ(s.top_sources.front().ip_address, "10.0.0.14");
    EXPECT_EQ(s.top_sources.back().ip_address, "10.0.0.5");
    for (size_t i = 1; i < s.top_sources.size(); ++i) {
        EXPECT_GT(s.top_sources[i - 1].connection_count, s.top_sources[i].connection_count);
    }
    for (const auto& row : s.top_ports) {
        EXPECT_GE(row.percentage, 0.0);
        EXPECT_LE(row.percentage, 100.0);
    }

    ConnectionStatsAggregator top3(3);
    EXPECT_EQ(top3.aggregate(records, kNow).top_destinations.size(), 1u);
    EXPECT_EQ(top3.aggregate(records, kNow).top_sources.size(), 3u);
}

TEST(ConnectionStatsAggregatorTest, ZeroTopNIsRejected) {
    EXPECT_THROW(ConnectionStatsAggregator(0), std::invalid_argument);
}

// TEST Port ranking keyed by port and protocol
TEST(ConnectionStatsAggregatorTest, PortsKeyedByPortAndProtocol) {
    RecordSet records = {
        make_conn("udp", "10.0.0.1:4000", "8.8.8.8:53", "53"),
        make_conn("udp", "10.0.0.1:4001", "8.8.8.8:53", "53"),
        make_conn("tcp", "10.0.0.1:4002", "8.8.8.8:53", "53"),
        make_conn("tcp", "10.0.0.1:4003", "9.9.9.9:31337", "31337"),
        make_conn("", "10.0.0.1:4004", "9.9.9.9:443", "443"),
    };

    ConnectionStatsAggregator agg;
    auto s = agg.aggregate(records, kNow);

    ASSERT_EQ(s.top_ports.size(), 4u);
    EXPECT_EQ(s.top_ports[0].port, 53);
    EXPECT_EQ(s.top_ports[0].protocol, "udp");
    EXPECT_EQ(s.top_ports[0].connection_count, 2u);
    EXPECT_DOUBLE_EQ(s.top_ports[0].percentage, 40.0);

    EXPECT_EQ(s.top_ports[1].port, 53);
    EXPECT_EQ(s.top_ports[1].protocol, "tcp");

    EXPECT_EQ(s.top_ports[2].port, 31337);
    EXPECT_FALSE(s.top_ports[2].service_name.has_value());

    EXPECT_EQ(s.top_ports[3].port, 443);
    EXPECT_EQ(s.top_ports[3].protocol, "unknown");
    EXPECT_EQ(s.top_ports[3].service_name.value_or(""), "HTTPS");
}

// TEST Only positive integer ports are counted
TEST(ConnectionStatsAggregatorTest, InvalidPortsAreSkipped) {
    RecordSet records = {
        make_conn("tcp", "10.0.0.1", "8.8.8.8", "0"),
        make_conn("tcp", "10.0.0.1", "8.8.8.8", "-5"),
        make_conn("tcp", "10.0.0.1", "8.8.8.8", "http"),
        make_conn("tcp", "10.0.0.1", "8.8.8.8", "70000"),
        make_conn("tcp", "10.0.0.1", "8.8.8.8", "22"),
    };

    ConnectionStatsAggregator agg;
    auto s = agg.aggregate(records, kNow);

    ASSERT_EQ(s.top_ports.size(), 1u);
    EXPECT_EQ(s.top_ports[0].port, 22);
    EXPECT_DOUBLE_EQ(s.top_ports[0].percentage, 20.0);
}
