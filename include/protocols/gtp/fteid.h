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
 * Fully Qualified TEID (TS 29.274 section 8.22)
 *
 * Octet 1:     V4 (bit 8) | V6 (bit 7) | interface type (bits 6-1)
 * Octets 2-5:  TEID / GRE key
 * then IPv4 (4 octets) if V4, then IPv6 (16 octets) if V6
 */
struct Fteid {
    using V4Flag = BitFlag<uint8_t, 7>;
    using V6Flag = BitFlag<uint8_t, 6>;
    using InterfaceBits = BitField<uint8_t, 0, 6>;

    static constexpr size_t kMinLength = 5;

    FteidInterfaceType interface_type = FteidInterfaceType::S11_MME_GTP_C;
    uint32_t teid = 0;
    std::optional<std::string> ipv4_address;
    std::optional<std::string> ipv6_address;

    /**
     * @throws PackError when neither address is set, an address does not
     *         parse, or the interface type does not fit 6 bits
     */
    std::vector<uint8_t> encode() const;

    /**
     * @throws DecodeError when shorter than 5 bytes or a flagged address is truncated
     */
    static Fteid decode(const uint8_t* data, size_t length);
    static Fteid decode(const std::vector<uint8_t>& data);

    nlohmann::json toJson() const;
};

}  // namespace gtp
}  // namespace ctlwire
