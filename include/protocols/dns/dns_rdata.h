#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/byte_buffer.h"
#include "protocols/dns/dns_name.h"
#include "protocols/dns/dns_types.h"

namespace ctlwire {
namespace dns {

/**
 * A / AAAA: network-order address bytes kept exactly as received
 */
struct DnsAddressRdata {
    std::vector<uint8_t> address;

    /// Dotted or RFC 5952 text when the length is 4 or 16, hex otherwise
    std::string toString() const;

    bool operator==(const DnsAddressRdata& other) const { return address == other.address; }
};

/**
 * NS / CNAME / PTR
 */
struct DnsNameRdata {
    std::string name;

    bool operator==(const DnsNameRdata& other) const { return name == other.name; }
};

struct DnsSoaRdata {
    std::string mname;
    std::string rname;
    uint32_t serial = 0;
    uint32_t refresh = 0;
    uint32_t retry = 0;
    uint32_t expire = 0;
    uint32_t minimum = 0;

    bool operator==(const DnsSoaRdata& other) const {
        return mname == other.mname && rname == other.rname && serial == other.serial &&
               refresh == other.refresh && retry == other.retry && expire == other.expire &&
               minimum == other.minimum;
    }
};

struct DnsMxRdata {
    uint16_t preference = 0;
    std::string exchange;

    bool operator==(const DnsMxRdata& other) const {
        return preference == other.preference && exchange == other.exchange;
    }
};

/**
 * TXT / HINFO: sequence of <character-string>s
 */
struct DnsTextRdata {
    std::vector<std::string> strings;

    bool operator==(const DnsTextRdata& other) const { return strings == other.strings; }
};

struct DnsSrvRdata {
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint16_t port = 0;
    std::string target;

    bool operator==(const DnsSrvRdata& other) const {
        return priority == other.priority && weight == other.weight && port == other.port &&
               target == other.target;
    }
};

/**
 * NULL / OPT payloads, and untagged rdata of unknown types
 */
struct DnsOpaqueRdata {
    std::vector<uint8_t> data;

    bool operator==(const DnsOpaqueRdata& other) const { return data == other.data; }
};

using DnsRdata = std::variant<DnsOpaqueRdata, DnsAddressRdata, DnsNameRdata, DnsSoaRdata,
                              DnsMxRdata, DnsTextRdata, DnsSrvRdata>;

/**
 * Decoder/encoder pair for one record type.
 *
 * decode() reads `rdlength` bytes at absolute `offset` of the whole message
 * (names inside rdata may point anywhere earlier in the message).
 * encode() serializes rdata that will land at absolute `offset`.
 */
struct DnsRdataCodec {
    using DecodeFn = DnsRdata (*)(const uint8_t* message, size_t message_length, size_t offset,
                                  size_t rdlength);
    using EncodeFn = void (*)(const DnsRdata& rdata, size_t offset, LabelPointerTable* table,
                              ByteWriter& out);

    DecodeFn decode;
    EncodeFn encode;
};

/**
 * Dispatch table lookup
 * @return Codec for the type or nullptr when the type is not supported
 */
const DnsRdataCodec* findRdataCodec(DnsType type);

/**
 * @throws DecodeError for unsupported types or rdata inconsistent with its type
 */
DnsRdata decodeRdata(DnsType type, const uint8_t* message, size_t message_length, size_t offset,
                     size_t rdlength);

/**
 * Append rdata to `out`, which holds the message from its first byte, so
 * out.size() is the absolute offset used for compression pointers.
 * @throws PackError for unsupported types or a payload of the wrong kind
 */
void encodeRdata(DnsType type, const DnsRdata& rdata, LabelPointerTable* table, ByteWriter& out);

nlohmann::json rdataToJson(const DnsRdata& rdata);

}  // namespace dns
}  // namespace ctlwire
