#include "protocols/gtp/gtp_ie_values.h"

#include <stdexcept>
#include <unordered_map>

#include "codec/byte_buffer.h"
#include "common/codec_error.h"
#include "common/logger.h"
#include "common/utils.h"
#include "protocols/gtp/fteid.h"

namespace ctlwire {
namespace gtp {

// ============================================================================
// Scalar encodings
// ============================================================================

std::vector<uint8_t> GtpValueCodec::encodeDigits(const std::string& digits) {
    try {
        return utils::stringToTbcd(digits);
    } catch (const std::invalid_argument& e) {
        throw PackError(e.what());
    }
}

std::string GtpValueCodec::decodeDigits(const std::vector<uint8_t>& value) {
    return utils::tbcdToString(value.data(), value.size());
}

std::vector<uint8_t> GtpValueCodec::encodeApn(const std::string& apn) {
    ByteWriter out;
    size_t start = 0;
    while (start <= apn.size()) {
        size_t dot = apn.find('.', start);
        size_t end = (dot == std::string::npos) ? apn.size() : dot;
        size_t label_length = end - start;

        if (label_length == 0 || label_length > 63) {
            throw PackError("invalid APN label in '" + apn + "'");
        }
        out.writeU8(static_cast<uint8_t>(label_length));
        out.writeBytes(reinterpret_cast<const uint8_t*>(apn.data() + start), label_length);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return out.release();
}

std::string GtpValueCodec::decodeApn(const std::vector<uint8_t>& value) {
    std::string apn;
    size_t offset = 0;

    while (offset < value.size()) {
        size_t label_length = value[offset++];
        if (label_length == 0) {
            break;  // tolerate a DNS-style root terminator
        }
        if (label_length > value.size() - offset) {
            throw DecodeError("APN label overruns IE value");
        }
        if (!apn.empty()) {
            apn.push_back('.');
        }
        apn.append(reinterpret_cast<const char*>(value.data() + offset), label_length);
        offset += label_length;
    }

    return apn;
}

std::vector<uint8_t> GtpValueCodec::encodeUint(uint64_t value, size_t width) {
    if (width == 0 || width > 8) {
        throw PackError("integer width must be 1..8 bytes");
    }
    if (width < 8 && value >= (1ULL << (width * 8))) {
        throw PackError("value " + std::to_string(value) + " does not fit in " +
                        std::to_string(width) + " bytes");
    }
    std::vector<uint8_t> out(width);
    for (size_t i = 0; i < width; ++i) {
        out[width - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return out;
}

uint64_t GtpValueCodec::decodeUint(const std::vector<uint8_t>& value, size_t width,
                                   const char* what) {
    if (value.size() != width) {
        throw DecodeError(std::string(what) + " needs " + std::to_string(width) +
                          " bytes, got " + std::to_string(value.size()));
    }
    uint64_t result = 0;
    for (uint8_t byte : value) {
        result = (result << 8) | byte;
    }
    return result;
}

std::vector<uint8_t> GtpValueCodec::encodeEbi(uint8_t ebi) {
    if (ebi > 0x0F) {
        throw PackError("EPS bearer id " + std::to_string(ebi) + " does not fit 4 bits");
    }
    return {ebi};
}

uint8_t GtpValueCodec::decodeEbi(const std::vector<uint8_t>& value) {
    if (value.empty()) {
        throw DecodeError("empty EPS bearer id");
    }
    return value[0] & 0x0F;
}

// ============================================================================
// AMBR
// ============================================================================

std::vector<uint8_t> GtpV2Ambr::encode() const {
    ByteWriter out;
    out.writeU32(uplink_kbps);
    out.writeU32(downlink_kbps);
    return out.release();
}

GtpV2Ambr GtpV2Ambr::decode(const std::vector<uint8_t>& value) {
    if (value.size() < 8) {
        throw DecodeError("AMBR needs 8 bytes, got " + std::to_string(value.size()));
    }
    ByteReader reader(value);
    GtpV2Ambr ambr;
    ambr.uplink_kbps = reader.readU32();
    ambr.downlink_kbps = reader.readU32();
    return ambr;
}

nlohmann::json GtpV2Ambr::toJson() const {
    return {{"uplink_kbps", uplink_kbps}, {"downlink_kbps", downlink_kbps}};
}

// ============================================================================
// ARP
// ============================================================================

uint8_t GtpV2Arp::toOctet() const {
    uint8_t octet = 0;
    PciFlag::assign(octet, pci);
    PriorityBits::assign(octet, priority_level);
    PviFlag::assign(octet, pvi);
    return octet;
}

GtpV2Arp GtpV2Arp::fromOctet(uint8_t octet) {
    GtpV2Arp arp;
    arp.pci = PciFlag::get(octet);
    arp.priority_level = PriorityBits::get(octet);
    arp.pvi = PviFlag::get(octet);
    return arp;
}

std::vector<uint8_t> GtpV2Arp::encode() const {
    if (priority_level > PriorityBits::kMask) {
        throw PackError("ARP priority level must be 0..15");
    }
    return {toOctet()};
}

GtpV2Arp GtpV2Arp::decode(const std::vector<uint8_t>& value) {
    if (value.empty()) {
        throw DecodeError("empty ARP value");
    }
    return fromOctet(value[0]);
}

nlohmann::json GtpV2Arp::toJson() const {
    return {{"pci", pci}, {"priority_level", priority_level}, {"pvi", pvi}};
}

// ============================================================================
// Bearer QoS
// ============================================================================

std::vector<uint8_t> GtpV2BearerQos::encode() const {
    if (arp.priority_level > GtpV2Arp::PriorityBits::kMask) {
        throw PackError("bearer QoS priority level must be 0..15");
    }
    ByteWriter out;
    out.writeU8(arp.toOctet());
    out.writeU8(qci);
    out.writeU40(mbr_uplink);
    out.writeU40(mbr_downlink);
    out.writeU40(gbr_uplink);
    out.writeU40(gbr_downlink);
    return out.release();
}

GtpV2BearerQos GtpV2BearerQos::decode(const std::vector<uint8_t>& value) {
    if (value.size() < kLength) {
        throw DecodeError("bearer QoS needs 22 bytes, got " + std::to_string(value.size()));
    }
    ByteReader reader(value);
    GtpV2BearerQos qos;
    qos.arp = GtpV2Arp::fromOctet(reader.readU8());
    qos.qci = reader.readU8();
    qos.mbr_uplink = reader.readU40();
    qos.mbr_downlink = reader.readU40();
    qos.gbr_uplink = reader.readU40();
    qos.gbr_downlink = reader.readU40();
    return qos;
}

nlohmann::json GtpV2BearerQos::toJson() const {
    nlohmann::json j = arp.toJson();
    j["qci"] = qci;
    j["mbr_uplink_kbps"] = mbr_uplink;
    j["mbr_downlink_kbps"] = mbr_downlink;
    j["gbr_uplink_kbps"] = gbr_uplink;
    j["gbr_downlink_kbps"] = gbr_downlink;
    return j;
}

// ============================================================================
// Cause
// ============================================================================

std::vector<uint8_t> GtpV2Cause::encode() const {
    uint8_t flags = 0;
    PceFlag::assign(flags, pce);
    BceFlag::assign(flags, bce);
    CsFlag::assign(flags, cs);
    return {cause, flags};
}

GtpV2Cause GtpV2Cause::decode(const std::vector<uint8_t>& value) {
    if (value.size() < 2) {
        throw DecodeError("cause needs 2 bytes, got " + std::to_string(value.size()));
    }
    GtpV2Cause result;
    result.cause = value[0];
    result.pce = PceFlag::get(value[1]);
    result.bce = BceFlag::get(value[1]);
    result.cs = CsFlag::get(value[1]);
    return result;
}

nlohmann::json GtpV2Cause::toJson() const {
    return {{"cause", cause},
            {"accepted", cause == kGtpV2CauseRequestAccepted},
            {"pce", pce},
            {"bce", bce},
            {"cs", cs}};
}

// ============================================================================
// PAA
// ============================================================================

std::vector<uint8_t> GtpV2Paa::encode() const {
    bool needs_v4 = pdn_type == PdnType::IPV4 || pdn_type == PdnType::IPV4V6;
    bool needs_v6 = pdn_type == PdnType::IPV6 || pdn_type == PdnType::IPV4V6;

    if (needs_v4 != ipv4_address.has_value() || needs_v6 != ipv6_address.has_value()) {
        throw PackError("PAA addresses do not match PDN type " +
                        getPdnTypeName(static_cast<uint8_t>(pdn_type)));
    }

    ByteWriter out;
    out.writeU8(static_cast<uint8_t>(pdn_type) & 0x07);

    if (needs_v6) {
        auto addr = utils::parseIpv6(ipv6_address.value());
        if (!addr.has_value()) {
            throw PackError("invalid PAA IPv6 address '" + ipv6_address.value() + "'");
        }
        out.writeU8(ipv6_prefix_length);
        out.writeBytes(addr->data(), addr->size());
    }
    if (needs_v4) {
        auto addr = utils::parseIpv4(ipv4_address.value());
        if (!addr.has_value()) {
            throw PackError("invalid PAA IPv4 address '" + ipv4_address.value() + "'");
        }
        out.writeBytes(addr->data(), addr->size());
    }
    return out.release();
}

GtpV2Paa GtpV2Paa::decode(const std::vector<uint8_t>& value) {
    if (value.empty()) {
        throw DecodeError("empty PAA value");
    }

    GtpV2Paa paa;
    paa.pdn_type = static_cast<PdnType>(value[0] & 0x07);
    size_t offset = 1;

    if (paa.pdn_type == PdnType::IPV6 || paa.pdn_type == PdnType::IPV4V6) {
        if (value.size() - offset < 17) {
            throw DecodeError("PAA IPv6 prefix truncated");
        }
        paa.ipv6_prefix_length = value[offset];
        paa.ipv6_address = utils::ipv6ToString(value.data() + offset + 1);
        offset += 17;
    }
    if (paa.pdn_type == PdnType::IPV4 || paa.pdn_type == PdnType::IPV4V6) {
        if (value.size() - offset < 4) {
            throw DecodeError("PAA IPv4 address truncated");
        }
        paa.ipv4_address = utils::ipv4ToString(value.data() + offset);
    }
    return paa;
}

nlohmann::json GtpV2Paa::toJson() const {
    nlohmann::json j;
    j["pdn_type"] = getPdnTypeName(static_cast<uint8_t>(pdn_type));
    if (ipv4_address.has_value()) {
        j["ipv4"] = ipv4_address.value();
    }
    if (ipv6_address.has_value()) {
        j["ipv6"] = ipv6_address.value();
        j["ipv6_prefix_length"] = ipv6_prefix_length;
    }
    return j;
}

// ============================================================================
// Describer tables
// ============================================================================

namespace {

using ValueDescriber = nlohmann::json (*)(const std::vector<uint8_t>& value);

nlohmann::json describeDigits(const std::vector<uint8_t>& value) {
    return GtpValueCodec::decodeDigits(value);
}

nlohmann::json describeApn(const std::vector<uint8_t>& value) {
    return GtpValueCodec::decodeApn(value);
}

nlohmann::json describeU8(const std::vector<uint8_t>& value) {
    return GtpValueCodec::decodeUint(value, 1, "octet");
}

nlohmann::json describeU16(const std::vector<uint8_t>& value) {
    return GtpValueCodec::decodeUint(value, 2, "16-bit value");
}

nlohmann::json describeU32(const std::vector<uint8_t>& value) {
    return GtpValueCodec::decodeUint(value, 4, "32-bit value");
}

nlohmann::json describeEbi(const std::vector<uint8_t>& value) {
    return GtpValueCodec::decodeEbi(value);
}

nlohmann::json describeRat(const std::vector<uint8_t>& value) {
    uint8_t rat = static_cast<uint8_t>(GtpValueCodec::decodeUint(value, 1, "RAT type"));
    return {{"value", rat}, {"name", getRatTypeName(rat)}};
}

nlohmann::json describePdnType(const std::vector<uint8_t>& value) {
    if (value.empty()) {
        throw DecodeError("empty PDN type");
    }
    uint8_t pdn = value[0] & 0x07;
    return {{"value", pdn}, {"name", getPdnTypeName(pdn)}};
}

nlohmann::json describeTimer(const std::vector<uint8_t>& value) {
    if (value.empty()) {
        throw DecodeError("empty timer value");
    }
    return {{"unit", BitField<uint8_t, 5, 3>::get(value[0])},
            {"value", BitField<uint8_t, 0, 5>::get(value[0])}};
}

nlohmann::json describeThrottling(const std::vector<uint8_t>& value) {
    if (value.size() < 2) {
        throw DecodeError("throttling needs 2 bytes");
    }
    return {{"delay_unit", BitField<uint8_t, 5, 3>::get(value[0])},
            {"delay_value", BitField<uint8_t, 0, 5>::get(value[0])},
            {"factor", value[1]}};
}

nlohmann::json describeAmbr(const std::vector<uint8_t>& value) {
    return GtpV2Ambr::decode(value).toJson();
}

nlohmann::json describeArp(const std::vector<uint8_t>& value) {
    return GtpV2Arp::decode(value).toJson();
}

nlohmann::json describeBearerQos(const std::vector<uint8_t>& value) {
    return GtpV2BearerQos::decode(value).toJson();
}

nlohmann::json describeV2Cause(const std::vector<uint8_t>& value) {
    return GtpV2Cause::decode(value).toJson();
}

nlohmann::json describePaa(const std::vector<uint8_t>& value) {
    return GtpV2Paa::decode(value).toJson();
}

nlohmann::json describeFteid(const std::vector<uint8_t>& value) {
    return Fteid::decode(value).toJson();
}

nlohmann::json describeV1Cause(const std::vector<uint8_t>& value) {
    uint8_t cause = static_cast<uint8_t>(GtpValueCodec::decodeUint(value, 1, "cause"));
    return {{"cause", cause}, {"accepted", cause == kGtpV1CauseRequestAccepted}};
}

nlohmann::json describeTeidDataII(const std::vector<uint8_t>& value) {
    if (value.size() != 5) {
        throw DecodeError("TEID Data II needs 5 bytes");
    }
    ByteReader reader(value);
    uint8_t nsapi = reader.readU8() & 0x0F;
    return {{"nsapi", nsapi}, {"teid", reader.readU32()}};
}

nlohmann::json describeNsapi(const std::vector<uint8_t>& value) {
    return static_cast<uint8_t>(GtpValueCodec::decodeUint(value, 1, "NSAPI") & 0x0F);
}

nlohmann::json describeGsnAddress(const std::vector<uint8_t>& value) {
    if (value.size() == 4) {
        return utils::ipv4ToString(value.data());
    }
    if (value.size() == 16) {
        return utils::ipv6ToString(value.data());
    }
    throw DecodeError("GSN address must be 4 or 16 bytes");
}

nlohmann::json describeEndUserAddress(const std::vector<uint8_t>& value) {
    if (value.size() < 2) {
        throw DecodeError("end user address needs 2 bytes");
    }
    nlohmann::json j;
    j["organization"] = value[0] & 0x0F;
    j["pdp_type"] = value[1];
    if (value.size() == 6) {
        j["ipv4"] = utils::ipv4ToString(value.data() + 2);
    } else if (value.size() == 18) {
        j["ipv6"] = utils::ipv6ToString(value.data() + 2);
    }
    return j;
}

nlohmann::json describeV1Msisdn(const std::vector<uint8_t>& value) {
    if (value.empty()) {
        throw DecodeError("empty MSISDN");
    }
    // First octet holds extension, nature of address and numbering plan
    return utils::tbcdToString(value.data() + 1, value.size() - 1);
}

const std::unordered_map<uint8_t, ValueDescriber>& v2Describers() {
    static const std::unordered_map<uint8_t, ValueDescriber> table = {
        {static_cast<uint8_t>(GtpV2IEType::IMSI), describeDigits},
        {static_cast<uint8_t>(GtpV2IEType::MSISDN), describeDigits},
        {static_cast<uint8_t>(GtpV2IEType::MEI), describeDigits},
        {static_cast<uint8_t>(GtpV2IEType::CAUSE), describeV2Cause},
        {static_cast<uint8_t>(GtpV2IEType::RECOVERY), describeU8},
        {static_cast<uint8_t>(GtpV2IEType::APN), describeApn},
        {static_cast<uint8_t>(GtpV2IEType::AMBR), describeAmbr},
        {static_cast<uint8_t>(GtpV2IEType::EPS_BEARER_ID), describeEbi},
        {static_cast<uint8_t>(GtpV2IEType::PAA), describePaa},
        {static_cast<uint8_t>(GtpV2IEType::BEARER_QOS), describeBearerQos},
        {static_cast<uint8_t>(GtpV2IEType::RAT_TYPE), describeRat},
        {static_cast<uint8_t>(GtpV2IEType::F_TEID), describeFteid},
        {static_cast<uint8_t>(GtpV2IEType::CHARGING_ID), describeU32},
        {static_cast<uint8_t>(GtpV2IEType::PDN_TYPE), describePdnType},
        {static_cast<uint8_t>(GtpV2IEType::THROTTLING), describeThrottling},
        {static_cast<uint8_t>(GtpV2IEType::ARP), describeArp},
        {static_cast<uint8_t>(GtpV2IEType::EPC_TIMER), describeTimer},
    };
    return table;
}

const std::unordered_map<uint8_t, ValueDescriber>& v1Describers() {
    static const std::unordered_map<uint8_t, ValueDescriber> table = {
        {static_cast<uint8_t>(GtpV1IEType::CAUSE), describeV1Cause},
        {static_cast<uint8_t>(GtpV1IEType::IMSI), describeDigits},
        {static_cast<uint8_t>(GtpV1IEType::RECOVERY), describeU8},
        {static_cast<uint8_t>(GtpV1IEType::SELECTION_MODE), describeU8},
        {static_cast<uint8_t>(GtpV1IEType::TEID_DATA_I), describeU32},
        {static_cast<uint8_t>(GtpV1IEType::TEID_CONTROL_PLANE), describeU32},
        {static_cast<uint8_t>(GtpV1IEType::TEID_DATA_II), describeTeidDataII},
        {static_cast<uint8_t>(GtpV1IEType::TEARDOWN_IND), describeU8},
        {static_cast<uint8_t>(GtpV1IEType::NSAPI), describeNsapi},
        {static_cast<uint8_t>(GtpV1IEType::CHARGING_CHARACTERISTICS), describeU16},
        {static_cast<uint8_t>(GtpV1IEType::CHARGING_ID), describeU32},
        {static_cast<uint8_t>(GtpV1IEType::END_USER_ADDRESS), describeEndUserAddress},
        {static_cast<uint8_t>(GtpV1IEType::APN), describeApn},
        {static_cast<uint8_t>(GtpV1IEType::GSN_ADDRESS), describeGsnAddress},
        {static_cast<uint8_t>(GtpV1IEType::MSISDN), describeV1Msisdn},
    };
    return table;
}

std::optional<nlohmann::json> describe(const std::unordered_map<uint8_t, ValueDescriber>& table,
                                       uint8_t type, const std::vector<uint8_t>& value) {
    auto it = table.find(type);
    if (it == table.end()) {
        return std::nullopt;
    }
    try {
        return it->second(value);
    } catch (const CodecError& e) {
        LOG_DEBUG("IE type {} value not decodable: {}", type, e.what());
        return nlohmann::json{{"error", e.what()}};
    }
}

}  // namespace

std::optional<nlohmann::json> describeV2Value(uint8_t type, const std::vector<uint8_t>& value) {
    return describe(v2Describers(), type, value);
}

std::optional<nlohmann::json> describeV1Value(uint8_t type, const std::vector<uint8_t>& value) {
    return describe(v1Describers(), type, value);
}

}  // namespace gtp
}  // namespace ctlwire
