#pragma once

#include <cstdint>
#include <string>

namespace ctlwire {
namespace dns {

/**
 * Resource record types handled by the rdata dispatch table (RFC 1035, 3596, 2782, 6891)
 */
enum class DnsType : uint16_t {
    A = 1,
    NS = 2,
    CNAME = 5,
    SOA = 6,
    NULL_RECORD = 10,
    PTR = 12,
    HINFO = 13,
    MX = 15,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    OPT = 41
};

/**
 * Record classes. OPT records reuse this field as the requestor's UDP payload size.
 */
enum class DnsClass : uint16_t {
    IN = 1,
    CHAOS = 3,
    HESIOD = 4,
    ANY = 255
};

enum class DnsOpcode : uint8_t {
    QUERY = 0,
    IQUERY = 1,
    STATUS = 2,
    NOTIFY = 4,
    UPDATE = 5
};

enum class DnsRcode : uint8_t {
    NOERROR = 0,
    FORMERR = 1,
    SERVFAIL = 2,
    NXDOMAIN = 3,
    NOTIMP = 4,
    REFUSED = 5,
    YXDOMAIN = 6,
    YXRRSET = 7,
    NXRRSET = 8,
    NOTAUTH = 9,
    NOTZONE = 10
};

/**
 * Per-call codec switches. Defaults give RFC 1035 compression and strict type checking.
 */
struct DnsCodecOptions {
    bool compress_names = true;          // emit and record compression pointers on encode
    bool accept_unknown_rr_types = false;  // keep unknown RR types as untagged opaque rdata
};

// Display names; unknown codes render as "TYPE<n>", "CLASS<n>", ...
std::string getTypeName(DnsType type);
std::string getClassName(DnsClass cls);
std::string getOpcodeName(DnsOpcode opcode);
std::string getRcodeName(DnsRcode rcode);

}  // namespace dns
}  // namespace ctlwire
