#include "protocols/dns/dns_name.h"

#include <algorithm>
#include <cctype>

#include "common/codec_error.h"
#include "common/logger.h"
#include "common/utils.h"

namespace ctlwire {
namespace dns {

// ============================================================================
// LabelPointerTable
// ============================================================================

std::optional<uint16_t> LabelPointerTable::find(const std::string& suffix_key) const {
    auto it = offsets_.find(suffix_key);
    if (it == offsets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LabelPointerTable::record(const std::string& suffix_key, size_t offset) {
    if (offset >= DnsNameCodec::kPointerLimit) {
        return false;
    }
    offsets_.emplace(suffix_key, static_cast<uint16_t>(offset));
    return true;
}

// ============================================================================
// Name encoding
// ============================================================================

namespace {

std::vector<std::string> splitLabels(const std::string& name) {
    std::vector<std::string> labels;

    // A single trailing dot names the root explicitly; "" and "." are the root
    std::string trimmed = name;
    if (!trimmed.empty() && trimmed.back() == '.') {
        trimmed.pop_back();
    }

    if (!trimmed.empty()) {
        size_t start = 0;
        while (true) {
            size_t dot = trimmed.find('.', start);
            if (dot == std::string::npos) {
                labels.push_back(trimmed.substr(start));
                break;
            }
            labels.push_back(trimmed.substr(start, dot - start));
            start = dot + 1;
        }
    }

    labels.emplace_back();  // root terminator
    return labels;
}

}  // namespace

std::string DnsNameCodec::suffixKey(const std::vector<std::string>& labels, size_t first) {
    std::string key;
    for (size_t i = first; i < labels.size(); ++i) {
        if (i != first) {
            key.push_back('.');
        }
        key += labels[i];
    }
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return key;
}

std::vector<uint8_t> DnsNameCodec::packName(const std::string& name, size_t offset,
                                            LabelPointerTable* table) {
    std::vector<std::string> labels = splitLabels(name);

    size_t encoded_length = 0;
    for (size_t i = 0; i + 1 < labels.size(); ++i) {
        if (labels[i].empty()) {
            throw PackError("empty label in name '" + name + "'");
        }
        if (labels[i].size() > kMaxLabelLength) {
            throw PackError("label longer than 63 bytes in name '" + name + "'");
        }
        encoded_length += labels[i].size() + 1;
    }
    if (encoded_length + 1 > kMaxNameLength) {
        throw PackError("name longer than 255 bytes: '" + name + "'");
    }

    std::vector<uint8_t> out;
    out.reserve(encoded_length + 1);

    for (size_t i = 0; i < labels.size(); ++i) {
        const std::string& label = labels[i];

        if (table != nullptr) {
            std::string key = suffixKey(labels, i);
            auto pointer = table->find(key);
            if (pointer.has_value()) {
                uint16_t field = static_cast<uint16_t>(0xC000 | pointer.value());
                out.push_back(static_cast<uint8_t>(field >> 8));
                out.push_back(static_cast<uint8_t>(field & 0xFF));
                LOG_TRACE("Compressed suffix {} to pointer {}", key, pointer.value());
                return out;
            }
            if (key.size() > 1) {
                table->record(key, offset + out.size());
            }
        }

        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }

    return out;
}

// ============================================================================
// Name decoding
// ============================================================================

std::string DnsNameCodec::unpackName(const uint8_t* data, size_t length, size_t& offset) {
    std::string name;
    size_t cursor = offset;
    size_t start = offset;
    size_t name_length = 0;
    bool jumped = false;
    size_t resume = 0;

    while (true) {
        if (cursor >= length) {
            throw NeedData("name runs past end of message at offset " + std::to_string(cursor));
        }

        uint8_t n = data[cursor];

        if (n == 0) {
            ++cursor;
            break;
        }

        if ((n & 0xC0) == 0xC0) {
            if (cursor + 2 > length) {
                throw NeedData("truncated compression pointer at offset " +
                               std::to_string(cursor));
            }
            size_t target = (static_cast<size_t>(n & 0x3F) << 8) | data[cursor + 1];
            if (target >= start) {
                LOG_DEBUG("Rejecting compression pointer to {} from name part at {}", target,
                          start);
                throw DecodeError("invalid label compression pointer to offset " +
                                  std::to_string(target));
            }
            cursor += 2;
            if (!jumped) {
                jumped = true;
                resume = cursor;
            }
            start = cursor = target;
        } else if ((n & 0xC0) == 0x00) {
            ++cursor;
            name_length += n + 1;
            if (name_length > kMaxNameLength) {
                throw DecodeError("name longer than 255 bytes");
            }
            if (cursor + n > length) {
                throw NeedData("label runs past end of message at offset " +
                               std::to_string(cursor));
            }
            if (!name.empty()) {
                name.push_back('.');
            }
            name.append(reinterpret_cast<const char*>(data + cursor), n);
            cursor += n;
        } else {
            throw DecodeError("invalid label length byte 0x" + utils::toHexString(n));
        }
    }

    offset = jumped ? resume : cursor;
    return name;
}

}  // namespace dns
}  // namespace ctlwire
