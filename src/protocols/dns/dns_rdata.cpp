#include "protocols/dns/dns_rdata.h"

#include <unordered_map>

#include "common/codec_error.h"
#include "common/utils.h"

namespace ctlwire {
namespace dns {

std::string DnsAddressRdata::toString() const {
    if (address.size() == 4) {
        return utils::ipv4ToString(address.data());
    }
    if (address.size() == 16) {
        return utils::ipv6ToString(address.data());
    }
    return utils::bytesToHex(address);
}

namespace {

// ============================================================================
// Decode helpers
// ============================================================================

/**
 * Decode a name that must start and end inside [offset, end)
 */
std::string nameInRdata(const uint8_t* message, size_t message_length, size_t& offset,
                        size_t end) {
    if (offset >= end) {
        throw DecodeError("rdata too short for domain name");
    }
    std::string name = DnsNameCodec::unpackName(message, message_length, offset);
    if (offset > end) {
        throw DecodeError("domain name overruns rdata");
    }
    return name;
}

ByteReader fixedFields(const uint8_t* message, size_t offset, size_t end, size_t needed,
                       const char* what) {
    if (end < offset || end - offset < needed) {
        throw DecodeError(std::string("rdata too short for ") + what);
    }
    return ByteReader(message, end, offset);
}

template <typename T>
const T& expect(const DnsRdata& rdata, const char* type_name) {
    const T* value = std::get_if<T>(&rdata);
    if (value == nullptr) {
        throw PackError(std::string("rdata payload does not match record type ") + type_name);
    }
    return *value;
}

void writeName(const std::string& name, size_t offset, LabelPointerTable* table,
               ByteWriter& out) {
    out.writeBytes(DnsNameCodec::packName(name, offset + out.size(), table));
}

// ============================================================================
// Per-type codecs
// ============================================================================

DnsRdata decodeAddress(const uint8_t* message, size_t, size_t offset, size_t rdlength) {
    return DnsAddressRdata{std::vector<uint8_t>(message + offset, message + offset + rdlength)};
}

void encodeAddress(const DnsRdata& rdata, size_t, LabelPointerTable*, ByteWriter& out) {
    out.writeBytes(expect<DnsAddressRdata>(rdata, "A/AAAA").address);
}

DnsRdata decodeName(const uint8_t* message, size_t message_length, size_t offset,
                    size_t rdlength) {
    size_t cursor = offset;
    return DnsNameRdata{nameInRdata(message, message_length, cursor, offset + rdlength)};
}

void encodeName(const DnsRdata& rdata, size_t offset, LabelPointerTable* table,
                ByteWriter& out) {
    writeName(expect<DnsNameRdata>(rdata, "NS/CNAME/PTR").name, offset, table, out);
}

DnsRdata decodeSoa(const uint8_t* message, size_t message_length, size_t offset,
                   size_t rdlength) {
    size_t end = offset + rdlength;
    size_t cursor = offset;

    DnsSoaRdata soa;
    soa.mname = nameInRdata(message, message_length, cursor, end);
    soa.rname = nameInRdata(message, message_length, cursor, end);

    ByteReader reader = fixedFields(message, cursor, end, 20, "SOA counters");
    soa.serial = reader.readU32();
    soa.refresh = reader.readU32();
    soa.retry = reader.readU32();
    soa.expire = reader.readU32();
    soa.minimum = reader.readU32();
    return soa;
}

void encodeSoa(const DnsRdata& rdata, size_t offset, LabelPointerTable* table,
               ByteWriter& out) {
    const auto& soa = expect<DnsSoaRdata>(rdata, "SOA");
    writeName(soa.mname, offset, table, out);
    writeName(soa.rname, offset, table, out);
    out.writeU32(soa.serial);
    out.writeU32(soa.refresh);
    out.writeU32(soa.retry);
    out.writeU32(soa.expire);
    out.writeU32(soa.minimum);
}

DnsRdata decodeMx(const uint8_t* message, size_t message_length, size_t offset,
                  size_t rdlength) {
    size_t end = offset + rdlength;
    ByteReader reader = fixedFields(message, offset, end, 2, "MX preference");

    DnsMxRdata mx;
    mx.preference = reader.readU16();
    size_t cursor = reader.offset();
    mx.exchange = nameInRdata(message, message_length, cursor, end);
    return mx;
}

void encodeMx(const DnsRdata& rdata, size_t offset, LabelPointerTable* table, ByteWriter& out) {
    const auto& mx = expect<DnsMxRdata>(rdata, "MX");
    out.writeU16(mx.preference);
    writeName(mx.exchange, offset, table, out);
}

DnsRdata decodeText(const uint8_t* message, size_t, size_t offset, size_t rdlength) {
    size_t end = offset + rdlength;
    size_t cursor = offset;

    DnsTextRdata text;
    while (cursor < end) {
        size_t n = message[cursor++];
        if (n > end - cursor) {
            throw DecodeError("character-string overruns rdata");
        }
        text.strings.emplace_back(reinterpret_cast<const char*>(message + cursor), n);
        cursor += n;
    }
    return text;
}

void encodeText(const DnsRdata& rdata, size_t, LabelPointerTable*, ByteWriter& out) {
    for (const auto& segment : expect<DnsTextRdata>(rdata, "TXT/HINFO").strings) {
        if (segment.size() > 255) {
            throw PackError("character-string longer than 255 bytes");
        }
        out.writeU8(static_cast<uint8_t>(segment.size()));
        out.writeBytes(reinterpret_cast<const uint8_t*>(segment.data()), segment.size());
    }
}

DnsRdata decodeSrv(const uint8_t* message, size_t message_length, size_t offset,
                   size_t rdlength) {
    size_t end = offset + rdlength;
    ByteReader reader = fixedFields(message, offset, end, 6, "SRV fields");

    DnsSrvRdata srv;
    srv.priority = reader.readU16();
    srv.weight = reader.readU16();
    srv.port = reader.readU16();
    size_t cursor = reader.offset();
    srv.target = nameInRdata(message, message_length, cursor, end);
    return srv;
}

void encodeSrv(const DnsRdata& rdata, size_t offset, LabelPointerTable* table,
               ByteWriter& out) {
    const auto& srv = expect<DnsSrvRdata>(rdata, "SRV");
    out.writeU16(srv.priority);
    out.writeU16(srv.weight);
    out.writeU16(srv.port);
    writeName(srv.target, offset, table, out);
}

DnsRdata decodeOpaque(const uint8_t* message, size_t, size_t offset, size_t rdlength) {
    return DnsOpaqueRdata{std::vector<uint8_t>(message + offset, message + offset + rdlength)};
}

void encodeOpaque(const DnsRdata& rdata, size_t, LabelPointerTable*, ByteWriter& out) {
    out.writeBytes(expect<DnsOpaqueRdata>(rdata, "NULL/OPT").data);
}

const std::unordered_map<uint16_t, DnsRdataCodec>& rdataCodecs() {
    static const std::unordered_map<uint16_t, DnsRdataCodec> codecs = {
        {static_cast<uint16_t>(DnsType::A), {decodeAddress, encodeAddress}},
        {static_cast<uint16_t>(DnsType::AAAA), {decodeAddress, encodeAddress}},
        {static_cast<uint16_t>(DnsType::NS), {decodeName, encodeName}},
        {static_cast<uint16_t>(DnsType::CNAME), {decodeName, encodeName}},
        {static_cast<uint16_t>(DnsType::PTR), {decodeName, encodeName}},
        {static_cast<uint16_t>(DnsType::SOA), {decodeSoa, encodeSoa}},
        {static_cast<uint16_t>(DnsType::MX), {decodeMx, encodeMx}},
        {static_cast<uint16_t>(DnsType::TXT), {decodeText, encodeText}},
        {static_cast<uint16_t>(DnsType::HINFO), {decodeText, encodeText}},
        {static_cast<uint16_t>(DnsType::SRV), {decodeSrv, encodeSrv}},
        {static_cast<uint16_t>(DnsType::NULL_RECORD), {decodeOpaque, encodeOpaque}},
        {static_cast<uint16_t>(DnsType::OPT), {decodeOpaque, encodeOpaque}},
    };
    return codecs;
}

}  // namespace

// ============================================================================
// Public dispatch
// ============================================================================

const DnsRdataCodec* findRdataCodec(DnsType type) {
    const auto& codecs = rdataCodecs();
    auto it = codecs.find(static_cast<uint16_t>(type));
    return it == codecs.end() ? nullptr : &it->second;
}

DnsRdata decodeRdata(DnsType type, const uint8_t* message, size_t message_length, size_t offset,
                     size_t rdlength) {
    const DnsRdataCodec* codec = findRdataCodec(type);
    if (codec == nullptr) {
        throw DecodeError("unsupported resource record type " + getTypeName(type));
    }
    if (offset + rdlength > message_length) {
        throw NeedData("rdata runs past end of message");
    }
    return codec->decode(message, message_length, offset, rdlength);
}

void encodeRdata(DnsType type, const DnsRdata& rdata, LabelPointerTable* table, ByteWriter& out) {
    const DnsRdataCodec* codec = findRdataCodec(type);
    if (codec == nullptr) {
        throw PackError("cannot encode resource record type " + getTypeName(type));
    }
    codec->encode(rdata, 0, table, out);
}

nlohmann::json rdataToJson(const DnsRdata& rdata) {
    nlohmann::json j;

    if (const auto* address = std::get_if<DnsAddressRdata>(&rdata)) {
        j["address"] = address->toString();
    } else if (const auto* name = std::get_if<DnsNameRdata>(&rdata)) {
        j["name"] = name->name;
    } else if (const auto* soa = std::get_if<DnsSoaRdata>(&rdata)) {
        j["mname"] = soa->mname;
        j["rname"] = soa->rname;
        j["serial"] = soa->serial;
        j["refresh"] = soa->refresh;
        j["retry"] = soa->retry;
        j["expire"] = soa->expire;
        j["minimum"] = soa->minimum;
    } else if (const auto* mx = std::get_if<DnsMxRdata>(&rdata)) {
        j["preference"] = mx->preference;
        j["exchange"] = mx->exchange;
    } else if (const auto* text = std::get_if<DnsTextRdata>(&rdata)) {
        j["strings"] = text->strings;
    } else if (const auto* srv = std::get_if<DnsSrvRdata>(&rdata)) {
        j["priority"] = srv->priority;
        j["weight"] = srv->weight;
        j["port"] = srv->port;
        j["target"] = srv->target;
    } else if (const auto* opaque = std::get_if<DnsOpaqueRdata>(&rdata)) {
        j["hex"] = utils::bytesToHex(opaque->data);
    }

    return j;
}

}  // namespace dns
}  // namespace ctlwire
