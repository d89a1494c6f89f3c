#include "core/IpClassifier.h"
#include <cctype>
#include <sstream>

std::optional<uint32_t> parseIpv4(const std::string& address) {
    uint32_t result = 0;
    int octets = 0;
    size_t pos = 0;

    while (octets < 4) {
        if (pos >= address.size() || !std::isdigit(static_cast<unsigned char>(address[pos]))) {
            return std::nullopt;
        }

        unsigned value = 0;
        size_t digits = 0;
        while (pos < address.size() && std::isdigit(static_cast<unsigned char>(address[pos]))) {
            value = value * 10 + static_cast<unsigned>(address[pos] - '0');
            if (++digits > 3 || value > 255) {
                return std::nullopt;
            }
            ++pos;
        }

        result = (result << 8) | value;
        ++octets;

        if (octets < 4) {
            if (pos >= address.size() || address[pos] != '.') {
                return std::nullopt;
            }
            ++pos;
        }
    }

    if (pos != address.size()) {
        return std::nullopt;
    }
    return result;
}

std::string formatIpv4(uint32_t address) {
    std::ostringstream oss;
    oss << ((address >> 24) & 0xFF) << "."
        << ((address >> 16) & 0xFF) << "."
        << ((address >> 8) & 0xFF) << "."
        << (address & 0xFF);
    return oss.str();
}

bool isPrivate(const std::string& address) {
    auto parsed = parseIpv4(address);
    if (!parsed) {
        return false;
    }

    uint32_t first = (*parsed >> 24) & 0xFF;
    uint32_t second = (*parsed >> 16) & 0xFF;

    return first == 10 ||
           (first == 172 && second >= 16 && second <= 31) ||
           (first == 192 && second == 168);
}

std::string stripPort(const std::string& address) {
    auto colon = address.find(':');
    if (colon == std::string::npos) {
        return address;
    }
    return address.substr(0, colon);
}
