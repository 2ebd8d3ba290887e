#include "codec/byte_buffer.h"

#include <arpa/inet.h>

#include <cstring>
#include <string>

#include "common/codec_error.h"

namespace ctlwire {

// ============================================================================
// ByteReader
// ============================================================================

ByteReader::ByteReader(const uint8_t* data, size_t length, size_t offset)
    : data_(data), length_(length), offset_(offset) {
    if (offset_ > length_) {
        throw NeedData("reader offset " + std::to_string(offset_) + " beyond buffer of " +
                       std::to_string(length_) + " bytes");
    }
}

ByteReader::ByteReader(const std::vector<uint8_t>& data, size_t offset)
    : ByteReader(data.data(), data.size(), offset) {}

void ByteReader::require(size_t count, const char* what) const {
    if (count > remaining()) {
        throw NeedData(std::string("need ") + std::to_string(count) + " bytes for " + what +
                       " at offset " + std::to_string(offset_) + ", have " +
                       std::to_string(remaining()));
    }
}

void ByteReader::skip(size_t count) {
    require(count, "skip");
    offset_ += count;
}

uint8_t ByteReader::readU8() {
    require(1, "u8");
    return data_[offset_++];
}

uint16_t ByteReader::readU16() {
    require(2, "u16");
    uint16_t value;
    std::memcpy(&value, data_ + offset_, 2);
    offset_ += 2;
    return ntohs(value);
}

uint32_t ByteReader::readU24() {
    require(3, "u24");
    uint32_t value = (static_cast<uint32_t>(data_[offset_]) << 16) |
                     (static_cast<uint32_t>(data_[offset_ + 1]) << 8) |
                     static_cast<uint32_t>(data_[offset_ + 2]);
    offset_ += 3;
    return value;
}

uint32_t ByteReader::readU32() {
    require(4, "u32");
    uint32_t value;
    std::memcpy(&value, data_ + offset_, 4);
    offset_ += 4;
    return ntohl(value);
}

uint64_t ByteReader::readU40() {
    require(5, "u40");
    uint64_t value = 0;
    for (size_t i = 0; i < 5; ++i) {
        value = (value << 8) | data_[offset_ + i];
    }
    offset_ += 5;
    return value;
}

std::vector<uint8_t> ByteReader::readBytes(size_t count) {
    require(count, "byte string");
    std::vector<uint8_t> out(data_ + offset_, data_ + offset_ + count);
    offset_ += count;
    return out;
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::writeU8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::writeU16(uint16_t value) {
    uint16_t net = htons(value);
    const auto* p = reinterpret_cast<const uint8_t*>(&net);
    buffer_.insert(buffer_.end(), p, p + 2);
}

void ByteWriter::writeU24(uint32_t value) {
    if (value > 0xFFFFFF) {
        throw PackError("value " + std::to_string(value) + " does not fit in 24 bits");
    }
    buffer_.push_back(static_cast<uint8_t>(value >> 16));
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::writeU32(uint32_t value) {
    uint32_t net = htonl(value);
    const auto* p = reinterpret_cast<const uint8_t*>(&net);
    buffer_.insert(buffer_.end(), p, p + 4);
}

void ByteWriter::writeU40(uint64_t value) {
    if (value > 0xFFFFFFFFFFULL) {
        throw PackError("value " + std::to_string(value) + " does not fit in 40 bits");
    }
    for (int shift = 32; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void ByteWriter::writeBytes(const uint8_t* data, size_t length) {
    if (length == 0) {
        return;
    }
    buffer_.insert(buffer_.end(), data, data + length);
}

void ByteWriter::writeBytes(const std::vector<uint8_t>& data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

size_t ByteWriter::reserveU16() {
    size_t position = buffer_.size();
    buffer_.push_back(0);
    buffer_.push_back(0);
    return position;
}

void ByteWriter::patchU16(size_t position, uint16_t value) {
    if (position + 2 > buffer_.size()) {
        throw PackError("patch position " + std::to_string(position) + " outside buffer");
    }
    buffer_[position] = static_cast<uint8_t>(value >> 8);
    buffer_[position + 1] = static_cast<uint8_t>(value);
}

}  // namespace ctlwire
