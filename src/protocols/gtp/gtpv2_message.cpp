#include "protocols/gtp/gtpv2_message.h"

#include <limits>
#include <string>

#include "common/codec_error.h"
#include "common/logger.h"

namespace ctlwire {
namespace gtp {

// ============================================================================
// GtpV2Header Methods
// ============================================================================

nlohmann::json GtpV2Header::toJson() const {
    nlohmann::json j;
    j["version"] = version();
    j["piggybacked"] = piggyback();
    j["teid_present"] = teidPresent();
    j["message_type"] = message_type;
    j["message_type_name"] = getV2MessageTypeName(message_type);
    j["message_length"] = length;
    if (teidPresent()) {
        j["teid"] = teid;
    }
    j["sequence_number"] = sequence_number;
    if (priorityPresent()) {
        j["message_priority"] = message_priority;
    }
    return j;
}

// ============================================================================
// GtpV2Message Methods
// ============================================================================

const FieldCodec& GtpV2Message::headerCodec() {
    static const FieldCodec codec({
        {"flags", FieldFormat::U8, 0x48},
        {"type", FieldFormat::U8, 0},
        {"len", FieldFormat::U16, 0},
    });
    return codec;
}

GtpV2Message GtpV2Message::decode(const std::vector<uint8_t>& data,
                                  const GtpCodecOptions& options) {
    return decode(data.data(), data.size(), options);
}

GtpV2Message GtpV2Message::decode(const uint8_t* data, size_t len,
                                  const GtpCodecOptions& options) {
    ByteReader reader(data, len);
    FieldValues fields = headerCodec().decodeHeader(reader);

    GtpV2Message msg;
    msg.header.flags = static_cast<uint8_t>(fields.at("flags"));
    msg.header.message_type = static_cast<uint8_t>(fields.at("type"));
    msg.header.length = static_cast<uint16_t>(fields.at("len"));

    if (msg.header.version() != 2) {
        LOG_DEBUG("GTPv2 decoder got version {}", msg.header.version());
        throw DecodeError("not a GTPv2 header (version " +
                          std::to_string(msg.header.version()) + ")");
    }

    reader.require(msg.header.length, "GTPv2 message body");
    size_t body_end = GtpV2Header::kFixedLength + msg.header.length;

    if (body_end < len) {
        if (options.strict_length) {
            throw DecodeError(std::to_string(len - body_end) +
                              " bytes after the GTPv2 declared length");
        }
        LOG_TRACE("Ignoring {} bytes after GTPv2 message", len - body_end);
    }

    ByteReader body(data, body_end, reader.offset());
    if (msg.header.teidPresent()) {
        msg.header.teid = body.readU32();
    }
    msg.header.sequence_number = body.readU24();
    uint8_t spare = body.readU8();
    if (msg.header.teidPresent()) {
        msg.header.message_priority = GtpV2Header::PriorityBits::get(spare);
    }

    msg.ies = GtpV2IE::decodeList(data + body.offset(), body.remaining());

    LOG_DEBUG("Decoded GTPv2 {} seq={} with {} IEs",
              getV2MessageTypeName(msg.header.message_type), msg.header.sequence_number,
              msg.ies.size());
    return msg;
}

std::vector<uint8_t> GtpV2Message::encode() const {
    if (header.message_priority > GtpV2Header::PriorityBits::kMask) {
        throw PackError("GTPv2 message priority must be 0..15");
    }

    ByteWriter body;
    if (header.teidPresent()) {
        body.writeU32(header.teid);
    }
    body.writeU24(header.sequence_number);

    uint8_t spare = 0;
    if (header.teidPresent()) {
        GtpV2Header::PriorityBits::assign(spare, header.message_priority);
    }
    body.writeU8(spare);

    for (const auto& ie : ies) {
        ie.encode(body);
    }

    if (body.size() > std::numeric_limits<uint16_t>::max()) {
        throw PackError("GTPv2 body longer than 65535 bytes");
    }

    FieldValues fields;
    fields["flags"] = header.flags;
    fields["type"] = header.message_type;
    fields["len"] = static_cast<uint32_t>(body.size());

    ByteWriter out;
    headerCodec().encodeHeader(fields, out);
    out.writeBytes(body.bytes());

    LOG_TRACE("Encoded GTPv2 {} into {} bytes", getV2MessageTypeName(header.message_type),
              out.size());
    return out.release();
}

const GtpV2IE* GtpV2Message::findIE(GtpV2IEType type, uint8_t instance) const {
    return gtp::findIE(ies, type, instance);
}

nlohmann::json GtpV2Message::toJson(const GtpCodecOptions& options) const {
    nlohmann::json j;
    j["header"] = header.toJson();
    j["ies"] = nlohmann::json::array();
    for (const auto& ie : ies) {
        j["ies"].push_back(ie.toJson(options));
    }
    return j;
}

}  // namespace gtp
}  // namespace ctlwire
