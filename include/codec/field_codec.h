#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

#include "codec/byte_buffer.h"

namespace ctlwire {

/**
 * Fixed binary formats a header field may use (all network byte order)
 */
enum class FieldFormat : uint8_t { U8 = 1, U16 = 2, U24 = 3, U32 = 4 };

size_t fieldFormatWidth(FieldFormat format);

/**
 * One (name, binary-format, default) triple of a fixed header layout
 */
struct FieldSpec {
    std::string name;
    FieldFormat format;
    uint32_t default_value = 0;
};

using FieldValues = std::unordered_map<std::string, uint32_t>;

/**
 * Generic fixed-width header packer/unpacker.
 *
 * The layout is an ordered list of FieldSpec. Its byte length is the sum of
 * the field widths; everything after that length is the variable payload
 * that the format-specific codec walks on its own.
 *
 * Example:
 *   static const FieldCodec codec({{"flags", FieldFormat::U8, 0},
 *                                  {"type", FieldFormat::U8, 0},
 *                                  {"len", FieldFormat::U16, 0}});
 *   auto values = codec.decodeHeader(data, len);
 *   const uint8_t* payload = data + codec.headerLength();
 */
class FieldCodec {
public:
    FieldCodec(std::initializer_list<FieldSpec> fields);
    explicit FieldCodec(std::vector<FieldSpec> fields);

    const std::vector<FieldSpec>& fields() const { return fields_; }

    /**
     * Total fixed header size in bytes
     */
    size_t headerLength() const { return header_length_; }

    /**
     * Field values holding every declared default
     */
    FieldValues defaults() const;

    /**
     * Read all declared fields from the start of data
     * @throws NeedData if len < headerLength()
     */
    FieldValues decodeHeader(const uint8_t* data, size_t len) const;
    FieldValues decodeHeader(ByteReader& reader) const;

    /**
     * Serialize the fields in declaration order. Missing names take their
     * default value.
     * @throws PackError if a value does not fit its declared width
     */
    void encodeHeader(const FieldValues& values, ByteWriter& writer) const;
    std::vector<uint8_t> encodeHeader(const FieldValues& values) const;

private:
    std::vector<FieldSpec> fields_;
    size_t header_length_ = 0;
};

}  // namespace ctlwire
