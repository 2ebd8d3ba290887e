#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/bit_field.h"
#include "codec/byte_buffer.h"
#include "protocols/gtp/gtp_types.h"

namespace ctlwire {
namespace gtp {

/**
 * GTPv1 Information Element.
 *
 * TV form (type < 0x80): [type][value], value length from the static table.
 * TLV form (type >= 0x80): [type][length:16][value].
 */
struct GtpV1IE {
    uint8_t type = 0;
    std::vector<uint8_t> value;

    static GtpV1IE make(GtpV1IEType type, std::vector<uint8_t> value);

    bool isTlv() const { return isGtpV1TlvType(type); }

    /**
     * On-wire size: type byte, length field when TLV, value
     */
    size_t encodedLength() const;

    /**
     * @throws PackError for a TV type missing from the length table, a TV
     *         value of the wrong size, or a TLV value over 65535 bytes
     */
    void encode(ByteWriter& out) const;
    std::vector<uint8_t> encode() const;

    /**
     * Decode one IE at `offset` and advance it
     * @throws DecodeError on an unknown TV type or a truncated IE
     */
    static GtpV1IE decode(const uint8_t* data, size_t length, size_t& offset);

    /**
     * Decode IEs back to back until `length` is consumed exactly
     */
    static std::vector<GtpV1IE> decodeList(const uint8_t* data, size_t length);
    static std::vector<uint8_t> encodeList(const std::vector<GtpV1IE>& ies);

    nlohmann::json toJson() const;

    bool operator==(const GtpV1IE& other) const {
        return type == other.type && value == other.value;
    }
};

/**
 * GTPv2 Information Element: [type][length:16][flags][value].
 *
 * The flags octet carries the CR flag in its high nibble and the instance in
 * its low nibble. The length field is always recomputed from the value.
 *
 * Grouped IEs (e.g. Bearer Context) keep their inner IEs as the serialized
 * value; call children() to decode them.
 */
struct GtpV2IE {
    using CrFlagBits = BitField<uint8_t, 4, 4>;
    using InstanceBits = BitField<uint8_t, 0, 4>;

    static constexpr size_t kHeaderLength = 4;
    /** Grouped IEs nested deeper than this are dumped as hex */
    static constexpr size_t kMaxGroupedDepth = 8;

    uint8_t type = 0;
    uint8_t flags = 0;
    std::vector<uint8_t> value;

    static GtpV2IE make(GtpV2IEType type, std::vector<uint8_t> value, uint8_t instance = 0);

    /**
     * Build a grouped IE whose value is the concatenation of the serialized inner IEs
     */
    static GtpV2IE grouped(GtpV2IEType type, const std::vector<GtpV2IE>& inner,
                           uint8_t instance = 0);

    uint8_t crFlag() const { return CrFlagBits::get(flags); }
    void setCrFlag(uint8_t cr) { CrFlagBits::assign(flags, cr); }

    uint8_t instance() const { return InstanceBits::get(flags); }
    void setInstance(uint8_t instance) { InstanceBits::assign(flags, instance); }

    size_t encodedLength() const { return kHeaderLength + value.size(); }

    /**
     * @throws PackError if the value exceeds 65535 bytes
     */
    void encode(ByteWriter& out) const;
    std::vector<uint8_t> encode() const;

    /**
     * Decode one IE at `offset` and advance it
     * @throws DecodeError on a truncated IE
     */
    static GtpV2IE decode(const uint8_t* data, size_t length, size_t& offset);

    static std::vector<GtpV2IE> decodeList(const uint8_t* data, size_t length);
    static std::vector<uint8_t> encodeList(const std::vector<GtpV2IE>& ies);

    /**
     * Second decode phase for grouped IEs
     * @throws DecodeError if the value is not a well-formed IE list
     */
    std::vector<GtpV2IE> children() const;

    /**
     * JSON view; grouped types listed in the options are expanded recursively
     * up to kMaxGroupedDepth levels. A grouped value that is not a well-formed
     * IE list, or sits below that depth, is kept as value_hex with an "error".
     */
    nlohmann::json toJson(const GtpCodecOptions& options = {}) const;

    bool operator==(const GtpV2IE& other) const {
        return type == other.type && flags == other.flags && value == other.value;
    }
};

/**
 * First IE of the given type and instance, or nullptr
 */
const GtpV2IE* findIE(const std::vector<GtpV2IE>& ies, GtpV2IEType type, uint8_t instance = 0);
const GtpV1IE* findIE(const std::vector<GtpV1IE>& ies, GtpV1IEType type);

}  // namespace gtp
}  // namespace ctlwire
