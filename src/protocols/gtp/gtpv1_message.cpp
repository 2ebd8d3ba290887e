#include "protocols/gtp/gtpv1_message.h"

#include <limits>
#include <string>

#include "common/codec_error.h"
#include "common/logger.h"

namespace ctlwire {
namespace gtp {

// ============================================================================
// GtpV1Header Methods
// ============================================================================

nlohmann::json GtpV1Header::toJson() const {
    nlohmann::json j;
    j["version"] = version();
    j["protocol_type"] = protocolType();
    j["extension_header"] = extensionFlag();
    j["sequence_number_flag"] = sequenceFlag();
    j["n_pdu_number_flag"] = npduFlag();
    j["message_type"] = message_type;
    j["message_type_name"] = getV1MessageTypeName(message_type);
    j["message_length"] = length;
    j["teid"] = teid;

    if (hasOptionalFields()) {
        j["sequence_number"] = sequence_number;
        j["n_pdu_number"] = npdu_number;
        j["next_extension_header"] = next_extension_type;
    }

    return j;
}

// ============================================================================
// GtpV1Message Methods
// ============================================================================

const FieldCodec& GtpV1Message::headerCodec() {
    static const FieldCodec codec({
        {"flags", FieldFormat::U8, 0x32},
        {"type", FieldFormat::U8, 0},
        {"len", FieldFormat::U16, 0},
        {"teid", FieldFormat::U32, 0},
    });
    return codec;
}

GtpV1Message GtpV1Message::decode(const std::vector<uint8_t>& data,
                                  const GtpCodecOptions& options) {
    return decode(data.data(), data.size(), options);
}

GtpV1Message GtpV1Message::decode(const uint8_t* data, size_t len,
                                  const GtpCodecOptions& options) {
    ByteReader reader(data, len);
    FieldValues fields = headerCodec().decodeHeader(reader);

    GtpV1Message msg;
    msg.header.flags = static_cast<uint8_t>(fields.at("flags"));
    msg.header.message_type = static_cast<uint8_t>(fields.at("type"));
    msg.header.length = static_cast<uint16_t>(fields.at("len"));
    msg.header.teid = fields.at("teid");

    if (msg.header.version() != 1) {
        LOG_DEBUG("GTPv1 decoder got version {}", msg.header.version());
        throw DecodeError("not a GTPv1 header (version " +
                          std::to_string(msg.header.version()) + ")");
    }

    reader.require(msg.header.length, "GTPv1 message body");
    size_t body_end = GtpV1Header::kFixedLength + msg.header.length;

    if (body_end < len) {
        if (options.strict_length) {
            throw DecodeError(std::to_string(len - body_end) +
                              " bytes after the GTPv1 declared length");
        }
        LOG_TRACE("Ignoring {} bytes after GTPv1 message", len - body_end);
    }

    ByteReader body(data, body_end, reader.offset());
    if (msg.header.hasOptionalFields()) {
        msg.header.sequence_number = body.readU16();
        msg.header.npdu_number = body.readU8();
        msg.header.next_extension_type = body.readU8();
    }

    msg.ies = GtpV1IE::decodeList(data + body.offset(), body.remaining());

    LOG_DEBUG("Decoded GTPv1 {} teid=0x{:08x} with {} IEs",
              getV1MessageTypeName(msg.header.message_type), msg.header.teid, msg.ies.size());
    return msg;
}

std::vector<uint8_t> GtpV1Message::encode() const {
    ByteWriter body;
    if (header.hasOptionalFields()) {
        body.writeU16(header.sequence_number);
        body.writeU8(header.npdu_number);
        body.writeU8(header.next_extension_type);
    }
    for (const auto& ie : ies) {
        ie.encode(body);
    }

    if (body.size() > std::numeric_limits<uint16_t>::max()) {
        throw PackError("GTPv1 body longer than 65535 bytes");
    }

    FieldValues fields;
    fields["flags"] = header.flags;
    fields["type"] = header.message_type;
    fields["len"] = static_cast<uint32_t>(body.size());
    fields["teid"] = header.teid;

    ByteWriter out;
    headerCodec().encodeHeader(fields, out);
    out.writeBytes(body.bytes());

    LOG_TRACE("Encoded GTPv1 {} into {} bytes", getV1MessageTypeName(header.message_type),
              out.size());
    return out.release();
}

const GtpV1IE* GtpV1Message::findIE(GtpV1IEType type) const {
    return gtp::findIE(ies, type);
}

nlohmann::json GtpV1Message::toJson() const {
    nlohmann::json j;
    j["header"] = header.toJson();
    j["ies"] = nlohmann::json::array();
    for (const auto& ie : ies) {
        j["ies"].push_back(ie.toJson());
    }
    return j;
}

}  // namespace gtp
}  // namespace ctlwire
