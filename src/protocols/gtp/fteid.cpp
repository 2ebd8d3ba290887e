#include "protocols/gtp/fteid.h"

#include "codec/byte_buffer.h"
#include "common/codec_error.h"
#include "common/logger.h"
#include "common/utils.h"

namespace ctlwire {
namespace gtp {

std::vector<uint8_t> Fteid::encode() const {
    if (!ipv4_address.has_value() && !ipv6_address.has_value()) {
        throw PackError("F-TEID needs an IPv4 or IPv6 address");
    }

    uint8_t iface = static_cast<uint8_t>(interface_type);
    if (iface > InterfaceBits::kMask) {
        throw PackError("F-TEID interface type " + std::to_string(iface) +
                        " does not fit 6 bits");
    }

    uint8_t flags = 0;
    V4Flag::assign(flags, ipv4_address.has_value());
    V6Flag::assign(flags, ipv6_address.has_value());
    InterfaceBits::assign(flags, iface);

    ByteWriter out;
    out.writeU8(flags);
    out.writeU32(teid);

    if (ipv4_address.has_value()) {
        auto addr = utils::parseIpv4(ipv4_address.value());
        if (!addr.has_value()) {
            throw PackError("invalid F-TEID IPv4 address '" + ipv4_address.value() + "'");
        }
        out.writeBytes(addr->data(), addr->size());
    }

    if (ipv6_address.has_value()) {
        auto addr = utils::parseIpv6(ipv6_address.value());
        if (!addr.has_value()) {
            throw PackError("invalid F-TEID IPv6 address '" + ipv6_address.value() + "'");
        }
        out.writeBytes(addr->data(), addr->size());
    }

    return out.release();
}

Fteid Fteid::decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

Fteid Fteid::decode(const uint8_t* data, size_t length) {
    if (length < kMinLength) {
        throw DecodeError("F-TEID needs at least 5 bytes, got " + std::to_string(length));
    }

    Fteid fteid;
    uint8_t flags = data[0];
    bool has_v4 = V4Flag::get(flags);
    bool has_v6 = V6Flag::get(flags);
    fteid.interface_type = static_cast<FteidInterfaceType>(InterfaceBits::get(flags));

    ByteReader reader(data, length, 1);
    fteid.teid = reader.readU32();

    if (has_v4) {
        if (reader.remaining() < 4) {
            throw DecodeError("F-TEID IPv4 address truncated");
        }
        fteid.ipv4_address = utils::ipv4ToString(data + reader.offset());
        reader.skip(4);
    }

    if (has_v6) {
        if (reader.remaining() < 16) {
            throw DecodeError("F-TEID IPv6 address truncated");
        }
        fteid.ipv6_address = utils::ipv6ToString(data + reader.offset());
        reader.skip(16);
    }

    LOG_TRACE("Decoded F-TEID teid=0x{:08x} interface={}", fteid.teid,
              getInterfaceTypeName(fteid.interface_type));
    return fteid;
}

nlohmann::json Fteid::toJson() const {
    nlohmann::json j;
    j["interface_type"] = static_cast<int>(interface_type);
    j["interface_name"] = getInterfaceTypeName(interface_type);
    j["teid"] = teid;
    j["teid_hex"] = "0x" + utils::toHexString(teid);
    if (ipv4_address.has_value()) {
        j["ipv4"] = ipv4_address.value();
    }
    if (ipv6_address.has_value()) {
        j["ipv6"] = ipv6_address.value();
    }
    return j;
}

}  // namespace gtp
}  // namespace ctlwire
