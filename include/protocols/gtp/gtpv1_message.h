#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/bit_field.h"
#include "codec/field_codec.h"
#include "protocols/gtp/gtp_ie.h"
#include "protocols/gtp/gtp_types.h"

namespace ctlwire {
namespace gtp {

/**
 * GTPv1-C header (3GPP TS 29.060 section 6)
 *
 *   flags: version(3) | PT(1) | spare(1) | E(1) | S(1) | PN(1)
 *   type(8) length(16) TEID(32)
 *   [sequence(16) N-PDU(8) next-extension(8)] when any of E/S/PN is set
 *
 * The length counts every byte after the 8-byte fixed part, including the
 * optional 4-byte block. It is recomputed on encode.
 */
struct GtpV1Header {
    using VersionBits = BitField<uint8_t, 5, 3>;
    using ProtocolTypeFlag = BitFlag<uint8_t, 4>;
    using ExtensionFlag = BitFlag<uint8_t, 2>;
    using SequenceFlag = BitFlag<uint8_t, 1>;
    using NpduFlag = BitFlag<uint8_t, 0>;
    using AdditionalBits = BitField<uint8_t, 0, 3>;

    static constexpr size_t kFixedLength = 8;
    static constexpr size_t kOptionalLength = 4;

    uint8_t flags = 0x32;  // version 1, GTP (not GTP'), sequence present
    uint8_t message_type = 0;
    uint16_t length = 0;
    uint32_t teid = 0;
    uint16_t sequence_number = 0;
    uint8_t npdu_number = 0;
    uint8_t next_extension_type = 0;

    uint8_t version() const { return VersionBits::get(flags); }
    void setVersion(uint8_t version) { VersionBits::assign(flags, version); }

    bool protocolType() const { return ProtocolTypeFlag::get(flags); }
    void setProtocolType(bool on) { ProtocolTypeFlag::assign(flags, on); }

    bool extensionFlag() const { return ExtensionFlag::get(flags); }
    void setExtensionFlag(bool on) { ExtensionFlag::assign(flags, on); }

    bool sequenceFlag() const { return SequenceFlag::get(flags); }
    void setSequenceFlag(bool on) { SequenceFlag::assign(flags, on); }

    bool npduFlag() const { return NpduFlag::get(flags); }
    void setNpduFlag(bool on) { NpduFlag::assign(flags, on); }

    /**
     * Combined E/S/PN mask; non-zero means the optional 4-byte block is present
     */
    uint8_t additionalFields() const { return AdditionalBits::get(flags); }
    bool hasOptionalFields() const { return additionalFields() != 0; }

    nlohmann::json toJson() const;
};

/**
 * GTPv1-C message: header plus the ordered IE list.
 *
 * Example:
 *   GtpV1Message msg = GtpV1Message::decode(data, len);
 *   if (const GtpV1IE* imsi = msg.findIE(GtpV1IEType::IMSI)) { ... }
 */
class GtpV1Message {
public:
    GtpV1Header header;
    std::vector<GtpV1IE> ies;

    /**
     * @throws NeedData if the buffer is shorter than the declared length
     * @throws DecodeError on a version mismatch, a malformed IE, or trailing
     *         bytes when options.strict_length is set
     */
    static GtpV1Message decode(const uint8_t* data, size_t len,
                               const GtpCodecOptions& options = {});
    static GtpV1Message decode(const std::vector<uint8_t>& data,
                               const GtpCodecOptions& options = {});

    /**
     * Encode with the length field recomputed from the serialized body
     * @throws PackError if an IE cannot be encoded or the body exceeds 65535 bytes
     */
    std::vector<uint8_t> encode() const;

    const GtpV1IE* findIE(GtpV1IEType type) const;

    nlohmann::json toJson() const;

    static const FieldCodec& headerCodec();
};

}  // namespace gtp
}  // namespace ctlwire
