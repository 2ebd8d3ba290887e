#include "codec/field_codec.h"

#include <string>

#include "common/codec_error.h"
#include "common/logger.h"

namespace ctlwire {

size_t fieldFormatWidth(FieldFormat format) {
    return static_cast<size_t>(format);
}

FieldCodec::FieldCodec(std::initializer_list<FieldSpec> fields)
    : FieldCodec(std::vector<FieldSpec>(fields)) {}

FieldCodec::FieldCodec(std::vector<FieldSpec> fields) : fields_(std::move(fields)) {
    for (const auto& field : fields_) {
        header_length_ += fieldFormatWidth(field.format);
    }
}

FieldValues FieldCodec::defaults() const {
    FieldValues values;
    for (const auto& field : fields_) {
        values[field.name] = field.default_value;
    }
    return values;
}

FieldValues FieldCodec::decodeHeader(const uint8_t* data, size_t len) const {
    ByteReader reader(data, len);
    return decodeHeader(reader);
}

FieldValues FieldCodec::decodeHeader(ByteReader& reader) const {
    reader.require(header_length_, "fixed header");

    FieldValues values;
    for (const auto& field : fields_) {
        switch (field.format) {
            case FieldFormat::U8:
                values[field.name] = reader.readU8();
                break;
            case FieldFormat::U16:
                values[field.name] = reader.readU16();
                break;
            case FieldFormat::U24:
                values[field.name] = reader.readU24();
                break;
            case FieldFormat::U32:
                values[field.name] = reader.readU32();
                break;
        }
    }

    return values;
}

void FieldCodec::encodeHeader(const FieldValues& values, ByteWriter& writer) const {
    for (const auto& field : fields_) {
        auto it = values.find(field.name);
        uint32_t value = (it != values.end()) ? it->second : field.default_value;

        size_t width = fieldFormatWidth(field.format);
        if (width < 4 && value >= (1U << (width * 8))) {
            LOG_DEBUG("Header field {} value {} exceeds {} bytes", field.name, value, width);
            throw PackError("header field '" + field.name + "' value " + std::to_string(value) +
                            " does not fit in " + std::to_string(width) + " bytes");
        }

        switch (field.format) {
            case FieldFormat::U8:
                writer.writeU8(static_cast<uint8_t>(value));
                break;
            case FieldFormat::U16:
                writer.writeU16(static_cast<uint16_t>(value));
                break;
            case FieldFormat::U24:
                writer.writeU24(value);
                break;
            case FieldFormat::U32:
                writer.writeU32(value);
                break;
        }
    }
}

std::vector<uint8_t> FieldCodec::encodeHeader(const FieldValues& values) const {
    ByteWriter writer;
    encodeHeader(values, writer);
    return writer.release();
}

}  // namespace ctlwire
