#include "protocols/gtp/gtp_ie.h"

#include <limits>
#include <string>

#include "common/codec_error.h"
#include "common/logger.h"
#include "common/utils.h"
#include "protocols/gtp/gtp_ie_values.h"

namespace ctlwire {
namespace gtp {

namespace {

// Typed value view, when the IE type has one
void addDecodedValue(nlohmann::json& j, const std::optional<nlohmann::json>& decoded) {
    if (decoded.has_value()) {
        j["decoded"] = decoded.value();
    }
}

}  // namespace

// ============================================================================
// GtpV1IE
// ============================================================================

GtpV1IE GtpV1IE::make(GtpV1IEType type, std::vector<uint8_t> value) {
    GtpV1IE ie;
    ie.type = static_cast<uint8_t>(type);
    ie.value = std::move(value);
    return ie;
}

size_t GtpV1IE::encodedLength() const {
    return 1 + (isTlv() ? 2 : 0) + value.size();
}

void GtpV1IE::encode(ByteWriter& out) const {
    if (isTlv()) {
        if (value.size() > std::numeric_limits<uint16_t>::max()) {
            throw PackError("GTPv1 TLV value longer than 65535 bytes");
        }
        out.writeU8(type);
        out.writeU16(static_cast<uint16_t>(value.size()));
        out.writeBytes(value);
        return;
    }

    auto expected = getGtpV1TvLength(type);
    if (!expected.has_value()) {
        throw PackError("unknown GTPv1 TV type " + std::to_string(type));
    }
    if (value.size() != expected.value()) {
        throw PackError("GTPv1 TV type " + std::to_string(type) + " needs " +
                        std::to_string(expected.value()) + " value bytes, got " +
                        std::to_string(value.size()));
    }
    out.writeU8(type);
    out.writeBytes(value);
}

std::vector<uint8_t> GtpV1IE::encode() const {
    ByteWriter out;
    encode(out);
    return out.release();
}

GtpV1IE GtpV1IE::decode(const uint8_t* data, size_t length, size_t& offset) {
    if (offset >= length) {
        throw DecodeError("no bytes left for GTPv1 IE at offset " + std::to_string(offset));
    }

    GtpV1IE ie;
    ie.type = data[offset];
    size_t cursor = offset + 1;
    size_t value_length = 0;

    if (isGtpV1TlvType(ie.type)) {
        if (length - cursor < 2) {
            throw DecodeError("truncated GTPv1 TLV length for type " + std::to_string(ie.type));
        }
        value_length = (static_cast<size_t>(data[cursor]) << 8) | data[cursor + 1];
        cursor += 2;
    } else {
        auto tv_length = getGtpV1TvLength(ie.type);
        if (!tv_length.has_value()) {
            LOG_DEBUG("Unknown GTPv1 TV type {} at offset {}", ie.type, offset);
            throw DecodeError("unknown GTPv1 TV type " + std::to_string(ie.type));
        }
        value_length = tv_length.value();
    }

    if (length - cursor < value_length) {
        throw DecodeError("truncated GTPv1 IE type " + std::to_string(ie.type) + ": need " +
                          std::to_string(value_length) + " value bytes, have " +
                          std::to_string(length - cursor));
    }

    ie.value.assign(data + cursor, data + cursor + value_length);
    offset = cursor + value_length;

    LOG_TRACE("Decoded GTPv1 IE {} ({}) with {} value bytes", ie.type, getV1IETypeName(ie.type),
              value_length);
    return ie;
}

std::vector<GtpV1IE> GtpV1IE::decodeList(const uint8_t* data, size_t length) {
    std::vector<GtpV1IE> ies;
    size_t offset = 0;
    while (offset < length) {
        ies.push_back(decode(data, length, offset));
    }
    return ies;
}

std::vector<uint8_t> GtpV1IE::encodeList(const std::vector<GtpV1IE>& ies) {
    ByteWriter out;
    for (const auto& ie : ies) {
        ie.encode(out);
    }
    return out.release();
}

nlohmann::json GtpV1IE::toJson() const {
    nlohmann::json j;
    j["type"] = type;
    j["type_name"] = getV1IETypeName(type);
    j["format"] = isTlv() ? "TLV" : "TV";
    j["length"] = value.size();
    j["value_hex"] = utils::bytesToHex(value);
    addDecodedValue(j, describeV1Value(type, value));
    return j;
}

const GtpV1IE* findIE(const std::vector<GtpV1IE>& ies, GtpV1IEType type) {
    for (const auto& ie : ies) {
        if (ie.type == static_cast<uint8_t>(type)) {
            return &ie;
        }
    }
    return nullptr;
}

// ============================================================================
// GtpV2IE
// ============================================================================

GtpV2IE GtpV2IE::make(GtpV2IEType type, std::vector<uint8_t> value, uint8_t instance) {
    GtpV2IE ie;
    ie.type = static_cast<uint8_t>(type);
    ie.setInstance(instance);
    ie.value = std::move(value);
    return ie;
}

GtpV2IE GtpV2IE::grouped(GtpV2IEType type, const std::vector<GtpV2IE>& inner, uint8_t instance) {
    return make(type, encodeList(inner), instance);
}

void GtpV2IE::encode(ByteWriter& out) const {
    if (value.size() > std::numeric_limits<uint16_t>::max()) {
        throw PackError("GTPv2 IE value longer than 65535 bytes");
    }
    out.writeU8(type);
    out.writeU16(static_cast<uint16_t>(value.size()));
    out.writeU8(flags);
    out.writeBytes(value);
}

std::vector<uint8_t> GtpV2IE::encode() const {
    ByteWriter out;
    encode(out);
    return out.release();
}

GtpV2IE GtpV2IE::decode(const uint8_t* data, size_t length, size_t& offset) {
    // IE header is 4 bytes minimum
    if (offset > length || length - offset < kHeaderLength) {
        throw DecodeError("truncated GTPv2 IE header at offset " + std::to_string(offset));
    }

    GtpV2IE ie;
    ie.type = data[offset];
    size_t value_length = (static_cast<size_t>(data[offset + 1]) << 8) | data[offset + 2];
    ie.flags = data[offset + 3];

    size_t cursor = offset + kHeaderLength;
    if (length - cursor < value_length) {
        LOG_DEBUG("GTPv2 IE {} declares {} bytes, {} available", ie.type, value_length,
                  length - cursor);
        throw DecodeError("truncated GTPv2 IE type " + std::to_string(ie.type) + ": need " +
                          std::to_string(value_length) + " value bytes, have " +
                          std::to_string(length - cursor));
    }

    ie.value.assign(data + cursor, data + cursor + value_length);
    offset = cursor + value_length;

    LOG_TRACE("Decoded GTPv2 IE {} ({}) instance={} length={}", ie.type,
              getV2IETypeName(ie.type), ie.instance(), value_length);
    return ie;
}

std::vector<GtpV2IE> GtpV2IE::decodeList(const uint8_t* data, size_t length) {
    std::vector<GtpV2IE> ies;
    size_t offset = 0;
    while (offset < length) {
        ies.push_back(decode(data, length, offset));
    }
    return ies;
}

std::vector<uint8_t> GtpV2IE::encodeList(const std::vector<GtpV2IE>& ies) {
    ByteWriter out;
    for (const auto& ie : ies) {
        ie.encode(out);
    }
    return out.release();
}

std::vector<GtpV2IE> GtpV2IE::children() const {
    return decodeList(value.data(), value.size());
}

namespace {

nlohmann::json v2IEToJson(const GtpV2IE& ie, const GtpCodecOptions& options, size_t depth) {
    nlohmann::json j;
    j["type"] = ie.type;
    j["type_name"] = getV2IETypeName(ie.type);
    j["instance"] = ie.instance();
    j["cr_flag"] = ie.crFlag();
    j["length"] = ie.value.size();

    if (options.isGroupedV2Type(ie.type)) {
        if (depth >= GtpV2IE::kMaxGroupedDepth) {
            LOG_DEBUG("Grouped IE {} nested past {} levels, not expanded", ie.type,
                      GtpV2IE::kMaxGroupedDepth);
            j["value_hex"] = utils::bytesToHex(ie.value);
            j["error"] = "grouped IEs nested deeper than " +
                         std::to_string(GtpV2IE::kMaxGroupedDepth) + " levels";
            return j;
        }
        try {
            nlohmann::json inner = nlohmann::json::array();
            for (const auto& child : ie.children()) {
                inner.push_back(v2IEToJson(child, options, depth + 1));
            }
            j["ies"] = inner;
        } catch (const DecodeError& e) {
            LOG_DEBUG("Grouped IE {} value not decodable: {}", ie.type, e.what());
            j["value_hex"] = utils::bytesToHex(ie.value);
            j["error"] = e.what();
        }
        return j;
    }

    j["value_hex"] = utils::bytesToHex(ie.value);
    addDecodedValue(j, describeV2Value(ie.type, ie.value));
    return j;
}

}  // namespace

nlohmann::json GtpV2IE::toJson(const GtpCodecOptions& options) const {
    return v2IEToJson(*this, options, 0);
}

const GtpV2IE* findIE(const std::vector<GtpV2IE>& ies, GtpV2IEType type, uint8_t instance) {
    for (const auto& ie : ies) {
        if (ie.type == static_cast<uint8_t>(type) && ie.instance() == instance) {
            return &ie;
        }
    }
    return nullptr;
}

}  // namespace gtp
}  // namespace ctlwire
