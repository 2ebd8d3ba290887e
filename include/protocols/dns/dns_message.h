#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/bit_field.h"
#include "codec/field_codec.h"
#include "protocols/dns/dns_rdata.h"
#include "protocols/dns/dns_types.h"

namespace ctlwire {
namespace dns {

/**
 * DNS header: 16-bit id and the 16-bit flags/op word.
 *
 * Section counts are not stored; they are taken from the message lists on
 * encode.
 *
 *   15  14-11   10  9  8  7  6  5  4  3-0
 *   QR  OPCODE  AA TC RD RA  Z AD CD  RCODE
 */
struct DnsHeader {
    using QrBit = BitFlag<uint16_t, 15>;
    using OpcodeBits = BitField<uint16_t, 11, 4>;
    using AaBit = BitFlag<uint16_t, 10>;
    using TcBit = BitFlag<uint16_t, 9>;
    using RdBit = BitFlag<uint16_t, 8>;
    using RaBit = BitFlag<uint16_t, 7>;
    using ZBit = BitFlag<uint16_t, 6>;
    using AdBit = BitFlag<uint16_t, 5>;
    using CdBit = BitFlag<uint16_t, 4>;
    using RcodeBits = BitField<uint16_t, 0, 4>;

    uint16_t id = 0;
    uint16_t op = 0x0100;  // standard query, recursion desired

    bool qr() const { return QrBit::get(op); }
    void setQr(bool on) { QrBit::assign(op, on); }

    DnsOpcode opcode() const { return static_cast<DnsOpcode>(OpcodeBits::get(op)); }
    void setOpcode(DnsOpcode opcode) { OpcodeBits::assign(op, static_cast<uint16_t>(opcode)); }

    bool aa() const { return AaBit::get(op); }
    void setAa(bool on) { AaBit::assign(op, on); }

    bool tc() const { return TcBit::get(op); }
    void setTc(bool on) { TcBit::assign(op, on); }

    bool rd() const { return RdBit::get(op); }
    void setRd(bool on) { RdBit::assign(op, on); }

    bool ra() const { return RaBit::get(op); }
    void setRa(bool on) { RaBit::assign(op, on); }

    bool z() const { return ZBit::get(op); }
    void setZ(bool on) { ZBit::assign(op, on); }

    bool ad() const { return AdBit::get(op); }
    void setAd(bool on) { AdBit::assign(op, on); }

    bool cd() const { return CdBit::get(op); }
    void setCd(bool on) { CdBit::assign(op, on); }

    DnsRcode rcode() const { return static_cast<DnsRcode>(RcodeBits::get(op)); }
    void setRcode(DnsRcode rcode) { RcodeBits::assign(op, static_cast<uint16_t>(rcode)); }

    nlohmann::json toJson() const;
};

struct DnsQuestion {
    std::string name;
    DnsType type = DnsType::A;
    DnsClass cls = DnsClass::IN;

    nlohmann::json toJson() const;
};

/**
 * Resource record with its type-tagged rdata.
 *
 * For OPT pseudo-records (RFC 6891) the class carries the requestor's UDP
 * payload size and the TTL carries extended RCODE, EDNS version and DO bit;
 * the accessors below read those views.
 */
struct DnsResourceRecord {
    std::string name;
    DnsType type = DnsType::A;
    DnsClass cls = DnsClass::IN;
    uint32_t ttl = 0;
    DnsRdata rdata;

    uint16_t udpPayloadSize() const { return static_cast<uint16_t>(cls); }
    void setUdpPayloadSize(uint16_t size) { cls = static_cast<DnsClass>(size); }

    uint8_t extendedRcode() const { return static_cast<uint8_t>(BitField<uint32_t, 24, 8>::get(ttl)); }
    void setExtendedRcode(uint8_t rcode) { BitField<uint32_t, 24, 8>::assign(ttl, rcode); }

    uint8_t ednsVersion() const { return static_cast<uint8_t>(BitField<uint32_t, 16, 8>::get(ttl)); }
    void setEdnsVersion(uint8_t version) { BitField<uint32_t, 16, 8>::assign(ttl, version); }

    bool dnssecOk() const { return BitFlag<uint32_t, 15>::get(ttl); }
    void setDnssecOk(bool on) { BitFlag<uint32_t, 15>::assign(ttl, on); }

    nlohmann::json toJson() const;
};

/**
 * DNS message codec (RFC 1035 section 4, EDNS0 OPT per RFC 6891).
 *
 * Example:
 *   DnsMessage msg = DnsMessage::decode(data, len);
 *   msg.header.setRd(false);
 *   std::vector<uint8_t> wire = msg.encode();
 */
class DnsMessage {
public:
    static constexpr size_t kHeaderLength = 12;

    DnsHeader header;
    std::vector<DnsQuestion> questions;
    std::vector<DnsResourceRecord> answers;
    std::vector<DnsResourceRecord> authorities;
    std::vector<DnsResourceRecord> additionals;

    /**
     * Decode a complete message
     * @throws NeedData if the buffer ends inside a fixed field
     * @throws DecodeError on malformed names or rdata, or unknown record types
     */
    static DnsMessage decode(const uint8_t* data, size_t len, const DnsCodecOptions& options = {});
    static DnsMessage decode(const std::vector<uint8_t>& data,
                             const DnsCodecOptions& options = {});

    /**
     * Encode with counts taken from the lists and a fresh compression table
     * @throws PackError on unsupported record types or unencodable names
     */
    std::vector<uint8_t> encode(const DnsCodecOptions& options = {}) const;

    nlohmann::json toJson() const;

    /**
     * Fixed header layout shared by decode and encode
     */
    static const FieldCodec& headerCodec();

private:
    static DnsResourceRecord decodeRecord(const uint8_t* data, size_t len, size_t& offset,
                                          const DnsCodecOptions& options);
    static void encodeRecord(const DnsResourceRecord& rr, LabelPointerTable* table,
                             ByteWriter& out);
};

}  // namespace dns
}  // namespace ctlwire
