#include "protocols/dns/dns_message.h"

#include <algorithm>
#include <limits>

#include "common/codec_error.h"
#include "common/logger.h"

namespace ctlwire {
namespace dns {

// ============================================================================
// JSON views
// ============================================================================

nlohmann::json DnsHeader::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["qr"] = qr();
    j["opcode"] = getOpcodeName(opcode());
    j["aa"] = aa();
    j["tc"] = tc();
    j["rd"] = rd();
    j["ra"] = ra();
    j["z"] = z();
    j["ad"] = ad();
    j["cd"] = cd();
    j["rcode"] = getRcodeName(rcode());
    return j;
}

nlohmann::json DnsQuestion::toJson() const {
    nlohmann::json j;
    j["name"] = name;
    j["type"] = getTypeName(type);
    j["class"] = getClassName(cls);
    return j;
}

nlohmann::json DnsResourceRecord::toJson() const {
    nlohmann::json j;
    j["name"] = name;
    j["type"] = getTypeName(type);

    if (type == DnsType::OPT) {
        j["udp_payload_size"] = udpPayloadSize();
        j["extended_rcode"] = extendedRcode();
        j["edns_version"] = ednsVersion();
        j["dnssec_ok"] = dnssecOk();
    } else {
        j["class"] = getClassName(cls);
        j["ttl"] = ttl;
    }

    j["rdata"] = rdataToJson(rdata);
    return j;
}

nlohmann::json DnsMessage::toJson() const {
    nlohmann::json j;
    j["header"] = header.toJson();

    auto section = [](const std::vector<DnsResourceRecord>& records) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& rr : records) {
            arr.push_back(rr.toJson());
        }
        return arr;
    };

    j["questions"] = nlohmann::json::array();
    for (const auto& q : questions) {
        j["questions"].push_back(q.toJson());
    }
    j["answers"] = section(answers);
    j["authorities"] = section(authorities);
    j["additionals"] = section(additionals);
    return j;
}

// ============================================================================
// Header layout
// ============================================================================

const FieldCodec& DnsMessage::headerCodec() {
    static const FieldCodec codec({
        {"id", FieldFormat::U16, 0},
        {"op", FieldFormat::U16, 0x0100},
        {"qdcount", FieldFormat::U16, 0},
        {"ancount", FieldFormat::U16, 0},
        {"nscount", FieldFormat::U16, 0},
        {"arcount", FieldFormat::U16, 0},
    });
    return codec;
}

// ============================================================================
// Decode
// ============================================================================

namespace {

// Smallest encodings: root name + type + class, plus ttl + rdlength for an RR
constexpr size_t kMinQuestionLength = 5;
constexpr size_t kMinRecordLength = 11;

// Never reserve more entries than the remaining bytes could hold
size_t reserveHint(uint32_t count, size_t len, size_t offset, size_t min_length) {
    size_t remaining = offset < len ? len - offset : 0;
    return std::min<size_t>(count, remaining / min_length);
}

}  // namespace

DnsMessage DnsMessage::decode(const std::vector<uint8_t>& data, const DnsCodecOptions& options) {
    return decode(data.data(), data.size(), options);
}

DnsMessage DnsMessage::decode(const uint8_t* data, size_t len, const DnsCodecOptions& options) {
    ByteReader reader(data, len);
    FieldValues fields = headerCodec().decodeHeader(reader);

    DnsMessage msg;
    msg.header.id = static_cast<uint16_t>(fields.at("id"));
    msg.header.op = static_cast<uint16_t>(fields.at("op"));

    size_t offset = reader.offset();

    uint32_t qdcount = fields.at("qdcount");
    msg.questions.reserve(reserveHint(qdcount, len, offset, kMinQuestionLength));
    for (uint32_t i = 0; i < qdcount; ++i) {
        DnsQuestion q;
        q.name = DnsNameCodec::unpackName(data, len, offset);

        ByteReader fixed(data, len, offset);
        q.type = static_cast<DnsType>(fixed.readU16());
        q.cls = static_cast<DnsClass>(fixed.readU16());
        offset = fixed.offset();

        msg.questions.push_back(std::move(q));
    }

    auto decodeSection = [&](uint32_t count, std::vector<DnsResourceRecord>& records) {
        records.reserve(reserveHint(count, len, offset, kMinRecordLength));
        for (uint32_t i = 0; i < count; ++i) {
            records.push_back(decodeRecord(data, len, offset, options));
        }
    };

    decodeSection(fields.at("ancount"), msg.answers);
    decodeSection(fields.at("nscount"), msg.authorities);
    decodeSection(fields.at("arcount"), msg.additionals);

    if (offset < len) {
        LOG_TRACE("Ignoring {} trailing bytes after DNS message", len - offset);
    }

    LOG_DEBUG("Decoded DNS message id={} qd={} an={} ns={} ar={}", msg.header.id,
              msg.questions.size(), msg.answers.size(), msg.authorities.size(),
              msg.additionals.size());
    return msg;
}

DnsResourceRecord DnsMessage::decodeRecord(const uint8_t* data, size_t len, size_t& offset,
                                           const DnsCodecOptions& options) {
    DnsResourceRecord rr;
    rr.name = DnsNameCodec::unpackName(data, len, offset);

    ByteReader fixed(data, len, offset);
    rr.type = static_cast<DnsType>(fixed.readU16());
    rr.cls = static_cast<DnsClass>(fixed.readU16());
    rr.ttl = fixed.readU32();
    uint16_t rdlength = fixed.readU16();
    fixed.require(rdlength, "rdata");

    size_t rdata_offset = fixed.offset();

    if (findRdataCodec(rr.type) != nullptr) {
        rr.rdata = decodeRdata(rr.type, data, len, rdata_offset, rdlength);
    } else if (options.accept_unknown_rr_types) {
        LOG_DEBUG("Keeping untagged rdata for unknown type {}", static_cast<uint16_t>(rr.type));
        rr.rdata = DnsOpaqueRdata{
            std::vector<uint8_t>(data + rdata_offset, data + rdata_offset + rdlength)};
    } else {
        LOG_DEBUG("Unknown resource record type {} at offset {}",
                  static_cast<uint16_t>(rr.type), offset);
        throw DecodeError("unsupported resource record type " + getTypeName(rr.type));
    }

    offset = rdata_offset + rdlength;
    return rr;
}

// ============================================================================
// Encode
// ============================================================================

std::vector<uint8_t> DnsMessage::encode(const DnsCodecOptions& options) const {
    auto count = [](size_t n, const char* section) -> uint32_t {
        if (n > std::numeric_limits<uint16_t>::max()) {
            throw PackError(std::string("too many entries in ") + section + " section");
        }
        return static_cast<uint32_t>(n);
    };

    FieldValues fields;
    fields["id"] = header.id;
    fields["op"] = header.op;
    fields["qdcount"] = count(questions.size(), "question");
    fields["ancount"] = count(answers.size(), "answer");
    fields["nscount"] = count(authorities.size(), "authority");
    fields["arcount"] = count(additionals.size(), "additional");

    ByteWriter out;
    headerCodec().encodeHeader(fields, out);

    // Compression state lives only for this call
    LabelPointerTable table;
    LabelPointerTable* pointers = options.compress_names ? &table : nullptr;

    for (const auto& q : questions) {
        out.writeBytes(DnsNameCodec::packName(q.name, out.size(), pointers));
        out.writeU16(static_cast<uint16_t>(q.type));
        out.writeU16(static_cast<uint16_t>(q.cls));
    }

    for (const auto* section : {&answers, &authorities, &additionals}) {
        for (const auto& rr : *section) {
            encodeRecord(rr, pointers, out);
        }
    }

    LOG_DEBUG("Encoded DNS message id={} into {} bytes ({} compressed suffixes)", header.id,
              out.size(), table.size());
    return out.release();
}

void DnsMessage::encodeRecord(const DnsResourceRecord& rr, LabelPointerTable* table,
                              ByteWriter& out) {
    out.writeBytes(DnsNameCodec::packName(rr.name, out.size(), table));
    out.writeU16(static_cast<uint16_t>(rr.type));
    out.writeU16(static_cast<uint16_t>(rr.cls));
    out.writeU32(rr.ttl);

    size_t rdlength_pos = out.reserveU16();
    encodeRdata(rr.type, rr.rdata, table, out);

    size_t rdlength = out.size() - rdlength_pos - 2;
    if (rdlength > std::numeric_limits<uint16_t>::max()) {
        throw PackError("rdata longer than 65535 bytes");
    }
    out.patchU16(rdlength_pos, static_cast<uint16_t>(rdlength));
}

}  // namespace dns
}  // namespace ctlwire
