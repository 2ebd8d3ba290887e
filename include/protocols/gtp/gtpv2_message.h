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
 * GTPv2-C header (3GPP TS 29.274 section 5.1)
 *
 *   flags: version(3) | P(1) | T(1) | MP(1) | spare(2)
 *   type(8) length(16)
 *   T=1: TEID(32) sequence(24) priority(4)|spare(4)
 *   T=0: sequence(24) spare(8)
 *
 * The length counts every byte after the first four.
 */
struct GtpV2Header {
    using VersionBits = BitField<uint8_t, 5, 3>;
    using PiggybackFlag = BitFlag<uint8_t, 4>;
    using TeidFlag = BitFlag<uint8_t, 3>;
    using PriorityFlag = BitFlag<uint8_t, 2>;
    using PriorityBits = BitField<uint8_t, 4, 4>;

    static constexpr size_t kFixedLength = 4;

    uint8_t flags = 0x48;  // version 2, TEID present
    uint8_t message_type = 0;
    uint16_t length = 0;
    uint32_t teid = 0;
    uint32_t sequence_number = 0;  // 24 bits
    uint8_t message_priority = 0;  // 4 bits, carried only with a TEID

    uint8_t version() const { return VersionBits::get(flags); }
    void setVersion(uint8_t version) { VersionBits::assign(flags, version); }

    bool piggyback() const { return PiggybackFlag::get(flags); }
    void setPiggyback(bool on) { PiggybackFlag::assign(flags, on); }

    bool teidPresent() const { return TeidFlag::get(flags); }
    void setTeidPresent(bool on) { TeidFlag::assign(flags, on); }

    bool priorityPresent() const { return PriorityFlag::get(flags); }
    void setPriorityPresent(bool on) { PriorityFlag::assign(flags, on); }

    nlohmann::json toJson() const;
};

/**
 * GTPv2-C message: header plus the ordered top-level IE list.
 *
 * Grouped IEs stay serialized inside their parent; use GtpV2IE::children()
 * to walk them.
 */
class GtpV2Message {
public:
    GtpV2Header header;
    std::vector<GtpV2IE> ies;

    /**
     * @throws NeedData if the buffer is shorter than the declared length
     * @throws DecodeError on a version mismatch, a malformed IE, or trailing
     *         bytes when options.strict_length is set
     */
    static GtpV2Message decode(const uint8_t* data, size_t len,
                               const GtpCodecOptions& options = {});
    static GtpV2Message decode(const std::vector<uint8_t>& data,
                               const GtpCodecOptions& options = {});

    /**
     * @throws PackError if the sequence number exceeds 24 bits, the priority
     *         exceeds 4 bits, or the body exceeds 65535 bytes
     */
    std::vector<uint8_t> encode() const;

    const GtpV2IE* findIE(GtpV2IEType type, uint8_t instance = 0) const;

    nlohmann::json toJson(const GtpCodecOptions& options = {}) const;

    static const FieldCodec& headerCodec();
};

}  // namespace gtp
}  // namespace ctlwire
