#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ctlwire {

/**
 * Bounds-checked big-endian reader over a borrowed byte range.
 *
 * Every read advances the cursor; a read past the end throws NeedData and
 * leaves the cursor where it was.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t length, size_t offset = 0);
    explicit ByteReader(const std::vector<uint8_t>& data, size_t offset = 0);

    const uint8_t* data() const { return data_; }
    size_t size() const { return length_; }
    size_t offset() const { return offset_; }
    size_t remaining() const { return length_ - offset_; }
    bool empty() const { return offset_ >= length_; }

    void skip(size_t count);

    uint8_t readU8();
    uint16_t readU16();
    uint32_t readU24();
    uint32_t readU32();
    uint64_t readU40();
    std::vector<uint8_t> readBytes(size_t count);

    /**
     * Throw NeedData unless count more bytes are available
     */
    void require(size_t count, const char* what) const;

private:
    const uint8_t* data_;
    size_t length_;
    size_t offset_;
};

/**
 * Growable big-endian byte buffer used by every encoder.
 */
class ByteWriter {
public:
    ByteWriter() = default;

    size_t size() const { return buffer_.size(); }
    const std::vector<uint8_t>& bytes() const { return buffer_; }
    std::vector<uint8_t> release() { return std::move(buffer_); }

    void writeU8(uint8_t value);
    void writeU16(uint16_t value);
    /** @throws PackError if value does not fit in 24 bits */
    void writeU24(uint32_t value);
    void writeU32(uint32_t value);
    /** @throws PackError if value does not fit in 40 bits */
    void writeU40(uint64_t value);
    void writeBytes(const uint8_t* data, size_t length);
    void writeBytes(const std::vector<uint8_t>& data);

    /**
     * Append a zero 16-bit placeholder and return its position for patchU16()
     */
    size_t reserveU16();
    void patchU16(size_t position, uint16_t value);

private:
    std::vector<uint8_t> buffer_;
};

}  // namespace ctlwire
