#pragma once

#include <array>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ctlwire {
namespace utils {

using Bytes = std::vector<uint8_t>;

/**
 * Convert bytes to lower-case hex string (no separators)
 */
std::string bytesToHex(const uint8_t* data, size_t len);
std::string bytesToHex(const Bytes& data);

/**
 * Convert hex string to bytes
 * @throws std::invalid_argument on odd length or non-hex characters
 */
Bytes hexToBytes(const std::string& hex);

/**
 * Convert integer to fixed-width upper-case hex string
 */
template <typename T>
std::string toHexString(T val) {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0') << std::setw(sizeof(T) * 2)
       << static_cast<uint64_t>(val);
    return ss.str();
}

/**
 * Decode TBCD digits (low nibble first); stops at the first 0xF filler
 */
std::string tbcdToString(const uint8_t* data, size_t len);

/**
 * Encode a decimal digit string as TBCD, padding an odd count with 0xF
 * @throws std::invalid_argument if a character is not a decimal digit
 */
Bytes stringToTbcd(const std::string& digits);

/**
 * Dotted-quad / RFC 5952 text for raw network-order address bytes
 */
std::string ipv4ToString(const uint8_t* addr);
std::string ipv6ToString(const uint8_t* addr);

/**
 * Parse textual addresses into network-order bytes
 */
std::optional<std::array<uint8_t, 4>> parseIpv4(const std::string& text);
std::optional<std::array<uint8_t, 16>> parseIpv6(const std::string& text);

}  // namespace utils
}  // namespace ctlwire
