#pragma once
#include <string>
#include <cstdint>
#include <optional>

// Parse a dotted quad (exactly four decimal octets, 0-255) into host order.
std::optional<uint32_t> parseIpv4(const std::string& address);

// Format a host-order IPv4 address as a dotted quad
std::string formatIpv4(uint32_t address);

// RFC 1918 check: 10/8, 172.16/12, 192.168/16.
// Malformed input is never private.
bool isPrivate(const std::string& address);

// Strip a trailing ":port" from "a.b.c.d:port"
std::string stripPort(const std::string& address);
