#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/codec_error.h"
#include "protocols/dns/dns_rdata.h"

using namespace ctlwire;
using namespace ctlwire::dns;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

/**
 * Encode standalone rdata at offset 0 with a fresh compression table
 */
std::vector<uint8_t> packAtZero(DnsType type, const DnsRdata& rdata) {
    LabelPointerTable table;
    ByteWriter out;
    encodeRdata(type, rdata, &table, out);
    return out.release();
}

DnsRdata unpackAll(DnsType type, const std::vector<uint8_t>& wire) {
    return decodeRdata(type, wire.data(), wire.size(), 0, wire.size());
}

}  // namespace

TEST(DnsRdataTest, AddressesAreRawBytes) {
    DnsAddressRdata a{{0x3f, 0xf1, 0xc7, 0x36}};
    EXPECT_EQ(packAtZero(DnsType::A, a), a.address);
    EXPECT_EQ(a.toString(), "63.241.199.54");

    std::vector<uint8_t> ip6 = {0x26, 0x07, 0xf8, 0xb0, 0x40, 0x0c, 0x0c, 0x03,
                                0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x1a};
    DnsAddressRdata aaaa{ip6};
    EXPECT_EQ(packAtZero(DnsType::AAAA, aaaa), ip6);
    EXPECT_EQ(aaaa.toString(), "2607:f8b0:400c:c03::1a");
    EXPECT_EQ(std::get<DnsAddressRdata>(unpackAll(DnsType::AAAA, ip6)), aaaa);
}

TEST(DnsRdataTest, NameTypes) {
    auto expected = bytes(std::string("\x02zc\x06" "akadns\x03org\x00", 15));

    for (DnsType type : {DnsType::NS, DnsType::CNAME, DnsType::PTR}) {
        EXPECT_EQ(packAtZero(type, DnsNameRdata{"zc.akadns.org"}), expected);
        EXPECT_EQ(std::get<DnsNameRdata>(unpackAll(type, expected)).name, "zc.akadns.org");
    }
}

TEST(DnsRdataTest, SoaCompressesSecondName) {
    DnsSoaRdata soa;
    soa.mname = "blah.google.com";
    soa.rname = "moo.blah.com";
    soa.serial = 12345666;
    soa.refresh = 123463;
    soa.retry = 209834;
    soa.expire = 28341;
    soa.minimum = 9000;

    auto expected = bytes(std::string(
        "\x04" "blah\x06google\x03" "com\x00\x03moo\x04" "blah\xc0\x0c"
        "\x00\xbc\x61\x42\x00\x01\xe2\x47\x00\x03\x33\xaa\x00\x00\x6e\xb5\x00\x00\x23\x28",
        48));
    EXPECT_EQ(packAtZero(DnsType::SOA, soa), expected);
    EXPECT_EQ(std::get<DnsSoaRdata>(unpackAll(DnsType::SOA, expected)), soa);
}

TEST(DnsRdataTest, SoaTooShortForCounters) {
    auto wire = bytes(std::string("\x01" "a\x00\x01" "b\x00\x00\x00\x00\x01", 10));
    EXPECT_THROW(unpackAll(DnsType::SOA, wire), DecodeError);
}

TEST(DnsRdataTest, MxAndSrv) {
    DnsMxRdata mx{2124, "mail.google.com"};
    auto mx_wire = bytes(std::string("\x08L\x04mail\x06google\x03" "com\x00", 19));
    EXPECT_EQ(packAtZero(DnsType::MX, mx), mx_wire);
    EXPECT_EQ(std::get<DnsMxRdata>(unpackAll(DnsType::MX, mx_wire)), mx);

    DnsSrvRdata srv{0, 5, 5060, "_sip._tcp.example.com"};
    auto srv_wire = bytes(std::string(
        "\x00\x00\x00\x05\x13\xc4\x04_sip\x04_tcp\x07" "example\x03" "com\x00", 29));
    EXPECT_EQ(packAtZero(DnsType::SRV, srv), srv_wire);
    EXPECT_EQ(std::get<DnsSrvRdata>(unpackAll(DnsType::SRV, srv_wire)), srv);

    EXPECT_THROW(unpackAll(DnsType::SRV, {0x00, 0x01, 0x02}), DecodeError);
    EXPECT_THROW(unpackAll(DnsType::MX, {0x00}), DecodeError);
}

TEST(DnsRdataTest, TextSegments) {
    DnsTextRdata txt{{"v=spf1 ptr ?all", "a=something"}};
    auto wire = bytes("\x0fv=spf1 ptr ?all\x0b" "a=something");

    EXPECT_EQ(packAtZero(DnsType::TXT, txt), wire);
    EXPECT_EQ(packAtZero(DnsType::HINFO, txt), wire);
    EXPECT_EQ(std::get<DnsTextRdata>(unpackAll(DnsType::TXT, wire)), txt);

    // Segment length running past the rdata end
    EXPECT_THROW(unpackAll(DnsType::TXT, {0x05, 'a', 'b'}), DecodeError);
    EXPECT_THROW(packAtZero(DnsType::TXT, DnsTextRdata{{std::string(256, 'x')}}), PackError);
}

TEST(DnsRdataTest, OpaqueTypes) {
    std::vector<uint8_t> null_data = {'V', 'A', 'C', 'K', 'D', 0x03, 0xc5, 0xe9, 0x01};
    auto decoded = unpackAll(DnsType::NULL_RECORD, null_data);
    EXPECT_EQ(std::get<DnsOpaqueRdata>(decoded).data, null_data);
    EXPECT_EQ(rdataToJson(decoded)["hex"], "5641434b4403c5e901");

    // OPT without options packs to nothing
    EXPECT_TRUE(packAtZero(DnsType::OPT, DnsOpaqueRdata{}).empty());

    std::vector<uint8_t> option = {0x00, 0x00, 0x00, 0x02, 0x00, 0x00};
    EXPECT_EQ(packAtZero(DnsType::OPT, DnsOpaqueRdata{option}), option);
}

TEST(DnsRdataTest, NameMustStayInsideRdata) {
    // Name continues past the declared rdlength of 3
    auto wire = bytes(std::string("\x02zc\x03org\x00", 8));
    EXPECT_THROW(decodeRdata(DnsType::CNAME, wire.data(), wire.size(), 0, 3), DecodeError);
    EXPECT_THROW(decodeRdata(DnsType::CNAME, wire.data(), wire.size(), 0, 0), DecodeError);
}

TEST(DnsRdataTest, DispatchErrors) {
    auto unknown = static_cast<DnsType>(999);
    EXPECT_EQ(findRdataCodec(unknown), nullptr);
    EXPECT_NE(findRdataCodec(DnsType::SRV), nullptr);

    std::vector<uint8_t> wire = {0x01, 0x02};
    EXPECT_THROW(decodeRdata(unknown, wire.data(), wire.size(), 0, 2), DecodeError);
    EXPECT_THROW(decodeRdata(DnsType::A, wire.data(), wire.size(), 0, 4), NeedData);
    EXPECT_THROW(packAtZero(unknown, DnsOpaqueRdata{wire}), PackError);

    // Payload kind does not match the record type
    EXPECT_THROW(packAtZero(DnsType::MX, DnsNameRdata{"mail.example.com"}), PackError);
}

TEST(DnsRdataTest, JsonViews) {
    EXPECT_EQ(rdataToJson(DnsAddressRdata{{10, 0, 0, 1}})["address"], "10.0.0.1");
    EXPECT_EQ(rdataToJson(DnsMxRdata{10, "mx.example.com"})["exchange"], "mx.example.com");
    EXPECT_EQ(rdataToJson(DnsSrvRdata{1, 2, 443, "svc.example.com"})["port"], 443);
    EXPECT_EQ(rdataToJson(DnsTextRdata{{"a", "b"}})["strings"].size(), 2u);
}
