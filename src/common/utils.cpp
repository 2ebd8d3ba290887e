#include "common/utils.h"

#include <arpa/inet.h>

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace ctlwire {
namespace utils {

std::string bytesToHex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string bytesToHex(const Bytes& data) {
    return bytesToHex(data.data(), data.size());
}

Bytes hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }

    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument(std::string("invalid hex character '") + c + "'");
    };

    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return bytes;
}

std::string tbcdToString(const uint8_t* data, size_t len) {
    std::string digits;
    digits.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        uint8_t low = data[i] & 0x0F;
        if (low == 0x0F) {
            break;
        }
        if (low <= 9) {
            digits.push_back(static_cast<char>('0' + low));
        }

        uint8_t high = (data[i] >> 4) & 0x0F;
        if (high == 0x0F) {
            break;
        }
        if (high <= 9) {
            digits.push_back(static_cast<char>('0' + high));
        }
    }

    return digits;
}

Bytes stringToTbcd(const std::string& digits) {
    Bytes encoded;
    encoded.reserve((digits.size() + 1) / 2);

    for (size_t i = 0; i < digits.size(); i += 2) {
        if (!std::isdigit(static_cast<unsigned char>(digits[i])) ||
            (i + 1 < digits.size() && !std::isdigit(static_cast<unsigned char>(digits[i + 1])))) {
            throw std::invalid_argument("TBCD input must be decimal digits: " + digits);
        }

        uint8_t byte = static_cast<uint8_t>(digits[i] - '0');
        if (i + 1 < digits.size()) {
            byte |= static_cast<uint8_t>((digits[i + 1] - '0') << 4);
        } else {
            byte |= 0xF0;  // Filler
        }
        encoded.push_back(byte);
    }

    return encoded;
}

std::string ipv4ToString(const uint8_t* addr) {
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, addr, buf, sizeof(buf));
    return std::string(buf);
}

std::string ipv6ToString(const uint8_t* addr) {
    char buf[INET6_ADDRSTRLEN];
    inet_ntop(AF_INET6, addr, buf, sizeof(buf));
    return std::string(buf);
}

std::optional<std::array<uint8_t, 4>> parseIpv4(const std::string& text) {
    std::array<uint8_t, 4> addr{};
    if (inet_pton(AF_INET, text.c_str(), addr.data()) != 1) {
        return std::nullopt;
    }
    return addr;
}

std::optional<std::array<uint8_t, 16>> parseIpv6(const std::string& text) {
    std::array<uint8_t, 16> addr{};
    if (inet_pton(AF_INET6, text.c_str(), addr.data()) != 1) {
        return std::nullopt;
    }
    return addr;
}

}  // namespace utils
}  // namespace ctlwire
