#include "core/PortRegistry.h"
#include <unordered_map>

namespace {

const std::unordered_map<uint16_t, ServiceInfo>& serviceTable() {
    static const std::unordered_map<uint16_t, ServiceInfo> table = {
        {21,   {"tcp", "FTP"}},
        {22,   {"tcp", "SSH"}},
        {23,   {"tcp", "Telnet"}},
        {25,   {"tcp", "SMTP"}},
        {53,   {"udp", "DNS"}},
        {67,   {"udp", "DHCP"}},
        {80,   {"tcp", "HTTP"}},
        {110,  {"tcp", "POP3"}},
        {123,  {"udp", "NTP"}},
        {143,  {"tcp", "IMAP"}},
        {161,  {"udp", "SNMP"}},
        {443,  {"tcp", "HTTPS"}},
        {465,  {"tcp", "SMTPS"}},
        {587,  {"tcp", "SMTP Submission"}},
        {993,  {"tcp", "IMAPS"}},
        {995,  {"tcp", "POP3S"}},
        {1194, {"udp", "OpenVPN"}},
        {1723, {"tcp", "PPTP"}},
        {3389, {"tcp", "RDP"}},
        {5060, {"udp", "SIP"}},
        {8080, {"tcp", "HTTP Proxy"}},
        {8291, {"tcp", "Winbox"}},
        {8443, {"tcp", "HTTPS Alternate"}},
        {8728, {"tcp", "RouterOS API"}},
    };
    return table;
}

} // namespace

std::optional<ServiceInfo> lookupService(uint16_t port) {
    const auto& table = serviceTable();
    auto it = table.find(port);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}
