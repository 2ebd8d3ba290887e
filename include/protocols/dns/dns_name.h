#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctlwire {
namespace dns {

/**
 * Scratch table for one message encode: upper-cased dot-joined label suffix
 * to the absolute offset where that suffix was first written.
 *
 * Create one per DnsMessage::encode() call and drop it when the call returns.
 */
class LabelPointerTable {
public:
    std::optional<uint16_t> find(const std::string& suffix_key) const;

    /**
     * Remember a suffix position. Offsets that do not fit the 14-bit pointer
     * field are ignored and false is returned.
     */
    bool record(const std::string& suffix_key, size_t offset);

    size_t size() const { return offsets_.size(); }

private:
    std::unordered_map<std::string, uint16_t> offsets_;
};

/**
 * RFC 1035 domain name encoding with message compression.
 */
class DnsNameCodec {
public:
    /// Maximum decoded name length including length octets
    static constexpr size_t kMaxNameLength = 255;

    /// Maximum length of a single label
    static constexpr size_t kMaxLabelLength = 63;

    /// First offset a compression pointer cannot express
    static constexpr size_t kPointerLimit = 0x4000;

    static constexpr uint8_t kPointerMarker = 0xC0;

    /**
     * Encode a dotted name that will be written at absolute message offset
     * `offset`.
     *
     * Each suffix already present in `table` is replaced by a two-byte
     * pointer and encoding stops there; every new suffix longer than the root
     * is recorded at its candidate offset. Passing a null table disables
     * compression entirely.
     *
     * @throws PackError on an empty interior label, a label over 63 bytes,
     *         or an encoded name over 255 bytes
     */
    static std::vector<uint8_t> packName(const std::string& name, size_t offset,
                                         LabelPointerTable* table);

    /**
     * Decode the name starting at `offset` within the whole message buffer.
     *
     * Compression pointers must point strictly before the start of the name
     * part currently being read, so loops and forward references are
     * rejected. On return `offset` is positioned right after the name's
     * on-wire bytes (after the first pointer if one was followed).
     *
     * @throws NeedData when the buffer ends inside the name
     * @throws DecodeError on a bad label-length byte, an invalid pointer or
     *         a name longer than 255 bytes
     */
    static std::string unpackName(const uint8_t* data, size_t length, size_t& offset);

    /**
     * Upper-cased suffix key used by the pointer table
     */
    static std::string suffixKey(const std::vector<std::string>& labels, size_t first);
};

}  // namespace dns
}  // namespace ctlwire
