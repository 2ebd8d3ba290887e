#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/bit_field.h"
#include "protocols/gtp/gtp_types.h"

namespace ctlwire {
namespace gtp {

/**
 * Scalar value encodings shared by GTPv1 and GTPv2 IEs
 */
class GtpValueCodec {
public:
    /**
     * TBCD digits (IMSI, MSISDN, MEI): low nibble first, 0xF filler
     * @throws PackError on a non-digit character
     */
    static std::vector<uint8_t> encodeDigits(const std::string& digits);
    static std::string decodeDigits(const std::vector<uint8_t>& value);

    /**
     * APN as length-prefixed labels, without a root terminator
     * @throws PackError on an empty or over-long label
     */
    static std::vector<uint8_t> encodeApn(const std::string& apn);

    /**
     * @throws DecodeError when a label overruns the value
     */
    static std::string decodeApn(const std::vector<uint8_t>& value);

    /**
     * Big-endian unsigned integer of exactly `width` bytes (1..8)
     */
    static std::vector<uint8_t> encodeUint(uint64_t value, size_t width);

    /**
     * @throws DecodeError if the value is not exactly `width` bytes
     */
    static uint64_t decodeUint(const std::vector<uint8_t>& value, size_t width, const char* what);

    /**
     * EPS Bearer ID in the low 4 bits of one octet
     */
    static std::vector<uint8_t> encodeEbi(uint8_t ebi);
    static uint8_t decodeEbi(const std::vector<uint8_t>& value);
};

/**
 * Aggregate Maximum Bit Rate, kbps
 */
struct GtpV2Ambr {
    uint32_t uplink_kbps = 0;
    uint32_t downlink_kbps = 0;

    std::vector<uint8_t> encode() const;
    static GtpV2Ambr decode(const std::vector<uint8_t>& value);
    nlohmann::json toJson() const;
};

/**
 * Allocation/Retention Priority flags octet: PCI (bit 7), PL (bits 6-3), PVI (bit 1)
 */
struct GtpV2Arp {
    using PciFlag = BitFlag<uint8_t, 6>;
    using PriorityBits = BitField<uint8_t, 2, 4>;
    using PviFlag = BitFlag<uint8_t, 0>;

    bool pci = false;
    uint8_t priority_level = 15;
    bool pvi = false;

    uint8_t toOctet() const;
    static GtpV2Arp fromOctet(uint8_t octet);

    std::vector<uint8_t> encode() const;
    static GtpV2Arp decode(const std::vector<uint8_t>& value);
    nlohmann::json toJson() const;
};

/**
 * Bearer QoS (22 octets): ARP octet, QCI, then MBR UL/DL and GBR UL/DL as
 * 40-bit kbps values
 */
struct GtpV2BearerQos {
    static constexpr size_t kLength = 22;

    GtpV2Arp arp;
    uint8_t qci = 9;
    uint64_t mbr_uplink = 0;
    uint64_t mbr_downlink = 0;
    uint64_t gbr_uplink = 0;
    uint64_t gbr_downlink = 0;

    std::vector<uint8_t> encode() const;
    static GtpV2BearerQos decode(const std::vector<uint8_t>& value);
    nlohmann::json toJson() const;
};

/**
 * GTPv2 Cause: value octet plus PCE/BCE/CS flags
 */
struct GtpV2Cause {
    using PceFlag = BitFlag<uint8_t, 2>;
    using BceFlag = BitFlag<uint8_t, 1>;
    using CsFlag = BitFlag<uint8_t, 0>;

    uint8_t cause = kGtpV2CauseRequestAccepted;
    bool pce = false;
    bool bce = false;
    bool cs = false;

    std::vector<uint8_t> encode() const;
    static GtpV2Cause decode(const std::vector<uint8_t>& value);
    nlohmann::json toJson() const;
};

/**
 * PDN Address Allocation
 */
struct GtpV2Paa {
    PdnType pdn_type = PdnType::IPV4;
    std::optional<std::string> ipv4_address;
    uint8_t ipv6_prefix_length = 64;
    std::optional<std::string> ipv6_address;

    /**
     * @throws PackError when the addresses present do not match the PDN type
     */
    std::vector<uint8_t> encode() const;
    static GtpV2Paa decode(const std::vector<uint8_t>& value);
    nlohmann::json toJson() const;
};

/**
 * Typed JSON view of an IE value through the per-type describer table
 * @return nullopt when the type has no describer
 */
std::optional<nlohmann::json> describeV2Value(uint8_t type, const std::vector<uint8_t>& value);
std::optional<nlohmann::json> describeV1Value(uint8_t type, const std::vector<uint8_t>& value);

}  // namespace gtp
}  // namespace ctlwire
