#include "protocols/dns/dns_types.h"

#include <unordered_map>

namespace ctlwire {
namespace dns {

namespace {

const std::unordered_map<uint16_t, const char*> kTypeNames = {
    {1, "A"},      {2, "NS"},   {5, "CNAME"}, {6, "SOA"},  {10, "NULL"}, {12, "PTR"},
    {13, "HINFO"}, {15, "MX"},  {16, "TXT"},  {28, "AAAA"}, {33, "SRV"}, {41, "OPT"},
};

const std::unordered_map<uint16_t, const char*> kClassNames = {
    {1, "IN"}, {3, "CHAOS"}, {4, "HESIOD"}, {255, "ANY"},
};

const std::unordered_map<uint8_t, const char*> kOpcodeNames = {
    {0, "QUERY"}, {1, "IQUERY"}, {2, "STATUS"}, {4, "NOTIFY"}, {5, "UPDATE"},
};

const std::unordered_map<uint8_t, const char*> kRcodeNames = {
    {0, "NOERROR"},  {1, "FORMERR"}, {2, "SERVFAIL"}, {3, "NXDOMAIN"},
    {4, "NOTIMP"},   {5, "REFUSED"}, {6, "YXDOMAIN"}, {7, "YXRRSET"},
    {8, "NXRRSET"},  {9, "NOTAUTH"}, {10, "NOTZONE"},
};

template <typename Map, typename Key>
std::string lookupName(const Map& names, Key code, const char* prefix) {
    auto it = names.find(code);
    if (it != names.end()) {
        return it->second;
    }
    return std::string(prefix) + std::to_string(static_cast<unsigned>(code));
}

}  // namespace

std::string getTypeName(DnsType type) {
    return lookupName(kTypeNames, static_cast<uint16_t>(type), "TYPE");
}

std::string getClassName(DnsClass cls) {
    return lookupName(kClassNames, static_cast<uint16_t>(cls), "CLASS");
}

std::string getOpcodeName(DnsOpcode opcode) {
    return lookupName(kOpcodeNames, static_cast<uint8_t>(opcode), "OPCODE");
}

std::string getRcodeName(DnsRcode rcode) {
    return lookupName(kRcodeNames, static_cast<uint8_t>(rcode), "RCODE");
}

}  // namespace dns
}  // namespace ctlwire
