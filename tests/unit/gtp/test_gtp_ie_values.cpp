#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/codec_error.h"
#include "protocols/gtp/gtp_ie_values.h"

using namespace ctlwire;
using namespace ctlwire::gtp;
using ::testing::ElementsAre;

// ============================================================================
// Scalar encodings
// ============================================================================

TEST(GtpValueCodecTest, Digits) {
    EXPECT_THAT(GtpValueCodec::encodeDigits("001011234567895"),
                ElementsAre(0x00, 0x01, 0x11, 0x32, 0x54, 0x76, 0x98, 0xf5));
    EXPECT_EQ(GtpValueCodec::decodeDigits({0x00, 0x01, 0x11, 0x32, 0x54, 0x76, 0x98, 0xf5}),
              "001011234567895");
    EXPECT_THROW(GtpValueCodec::encodeDigits("12a4"), PackError);
}

TEST(GtpValueCodecTest, Apn) {
    auto wire = GtpValueCodec::encodeApn("internet.mnc001.mcc001.gprs");
    EXPECT_EQ(wire.size(), 28u);
    EXPECT_EQ(wire[0], 8);
    EXPECT_EQ(wire[9], 6);
    EXPECT_EQ(GtpValueCodec::decodeApn(wire), "internet.mnc001.mcc001.gprs");
}

TEST(GtpValueCodecTest, ApnRejectsBadLabels) {
    EXPECT_THROW(GtpValueCodec::encodeApn(""), PackError);
    EXPECT_THROW(GtpValueCodec::encodeApn("ims..net"), PackError);
    EXPECT_THROW(GtpValueCodec::encodeApn("ims."), PackError);
    EXPECT_THROW(GtpValueCodec::encodeApn(std::string(64, 'a')), PackError);
    EXPECT_NO_THROW(GtpValueCodec::encodeApn(std::string(63, 'a')));
}

TEST(GtpValueCodecTest, ApnDecodeEdges) {
    // Root terminator is tolerated
    EXPECT_EQ(GtpValueCodec::decodeApn({0x03, 'i', 'm', 's', 0x00}), "ims");
    EXPECT_EQ(GtpValueCodec::decodeApn({}), "");
    EXPECT_THROW(GtpValueCodec::decodeApn({0x05, 'a', 'b'}), DecodeError);
}

TEST(GtpValueCodecTest, FixedWidthIntegers) {
    EXPECT_THAT(GtpValueCodec::encodeUint(0x1234, 2), ElementsAre(0x12, 0x34));
    EXPECT_THAT(GtpValueCodec::encodeUint(7, 4), ElementsAre(0x00, 0x00, 0x00, 0x07));
    EXPECT_THROW(GtpValueCodec::encodeUint(256, 1), PackError);
    EXPECT_THROW(GtpValueCodec::encodeUint(1, 0), PackError);
    EXPECT_THROW(GtpValueCodec::encodeUint(1, 9), PackError);

    EXPECT_EQ(GtpValueCodec::decodeUint({0xde, 0xad, 0xbe, 0xef}, 4, "teid"), 0xdeadbeefu);
    EXPECT_THROW(GtpValueCodec::decodeUint({0x01, 0x02}, 4, "teid"), DecodeError);
}

TEST(GtpValueCodecTest, EpsBearerId) {
    EXPECT_THAT(GtpValueCodec::encodeEbi(5), ElementsAre(0x05));
    EXPECT_THROW(GtpValueCodec::encodeEbi(16), PackError);
    // Spare high nibble is ignored
    EXPECT_EQ(GtpValueCodec::decodeEbi({0xf6}), 6);
    EXPECT_THROW(GtpValueCodec::decodeEbi({}), DecodeError);
}

// ============================================================================
// Structured values
// ============================================================================

TEST(GtpV2ValueTest, Ambr) {
    GtpV2Ambr ambr;
    ambr.uplink_kbps = 1000;
    ambr.downlink_kbps = 2000;

    auto wire = ambr.encode();
    EXPECT_THAT(wire, ElementsAre(0x00, 0x00, 0x03, 0xe8, 0x00, 0x00, 0x07, 0xd0));

    GtpV2Ambr decoded = GtpV2Ambr::decode(wire);
    EXPECT_EQ(decoded.uplink_kbps, 1000u);
    EXPECT_EQ(decoded.downlink_kbps, 2000u);

    wire.pop_back();
    EXPECT_THROW(GtpV2Ambr::decode(wire), DecodeError);
}

TEST(GtpV2ValueTest, ArpOctet) {
    GtpV2Arp arp;
    arp.pci = true;
    arp.priority_level = 9;
    arp.pvi = false;
    EXPECT_EQ(arp.toOctet(), 0x64);

    GtpV2Arp parsed = GtpV2Arp::fromOctet(0x65);
    EXPECT_TRUE(parsed.pci);
    EXPECT_EQ(parsed.priority_level, 9);
    EXPECT_TRUE(parsed.pvi);

    arp.priority_level = 16;
    EXPECT_THROW(arp.encode(), PackError);
}

TEST(GtpV2ValueTest, BearerQos) {
    GtpV2BearerQos qos;
    qos.arp.priority_level = 1;
    qos.qci = 5;
    qos.mbr_uplink = 0x0102030405ULL;
    qos.gbr_downlink = 128;

    auto wire = qos.encode();
    ASSERT_EQ(wire.size(), GtpV2BearerQos::kLength);
    EXPECT_EQ(wire[0], 0x04);
    EXPECT_EQ(wire[1], 5);
    EXPECT_THAT(std::vector<uint8_t>(wire.begin() + 2, wire.begin() + 7),
                ElementsAre(0x01, 0x02, 0x03, 0x04, 0x05));
    EXPECT_EQ(wire[21], 128);

    GtpV2BearerQos decoded = GtpV2BearerQos::decode(wire);
    EXPECT_EQ(decoded.qci, 5);
    EXPECT_EQ(decoded.arp.priority_level, 1);
    EXPECT_EQ(decoded.mbr_uplink, 0x0102030405ULL);
    EXPECT_EQ(decoded.gbr_downlink, 128u);

    wire.resize(21);
    EXPECT_THROW(GtpV2BearerQos::decode(wire), DecodeError);
}

TEST(GtpV2ValueTest, Cause) {
    GtpV2Cause cause;
    cause.pce = true;
    EXPECT_THAT(cause.encode(), ElementsAre(0x10, 0x04));

    GtpV2Cause rejected = GtpV2Cause::decode({0x40, 0x01});
    EXPECT_EQ(rejected.cause, 64);
    EXPECT_TRUE(rejected.cs);
    EXPECT_FALSE(rejected.bce);
    EXPECT_FALSE(rejected.toJson()["accepted"].get<bool>());

    EXPECT_THROW(GtpV2Cause::decode({0x10}), DecodeError);
}

TEST(GtpV2ValueTest, PaaIpv4) {
    GtpV2Paa paa;
    paa.ipv4_address = "10.45.0.2";
    EXPECT_THAT(paa.encode(), ElementsAre(0x01, 0x0a, 0x2d, 0x00, 0x02));

    GtpV2Paa decoded = GtpV2Paa::decode(paa.encode());
    EXPECT_EQ(decoded.pdn_type, PdnType::IPV4);
    EXPECT_EQ(decoded.ipv4_address.value(), "10.45.0.2");
    EXPECT_FALSE(decoded.ipv6_address.has_value());
}

TEST(GtpV2ValueTest, PaaDualStack) {
    GtpV2Paa paa;
    paa.pdn_type = PdnType::IPV4V6;
    paa.ipv4_address = "10.45.0.2";
    paa.ipv6_address = "2001:db8::1";
    paa.ipv6_prefix_length = 64;

    auto wire = paa.encode();
    ASSERT_EQ(wire.size(), 22u);
    EXPECT_EQ(wire[0], 0x03);
    EXPECT_EQ(wire[1], 64);
    EXPECT_EQ(wire[2], 0x20);
    EXPECT_EQ(wire[18], 0x0a);

    nlohmann::json j = GtpV2Paa::decode(wire).toJson();
    EXPECT_EQ(j["pdn_type"], "IPv4v6");
    EXPECT_EQ(j["ipv4"], "10.45.0.2");
    EXPECT_EQ(j["ipv6"], "2001:db8::1");
    EXPECT_EQ(j["ipv6_prefix_length"], 64);
}

TEST(GtpV2ValueTest, PaaAddressesMustMatchType) {
    GtpV2Paa missing;
    EXPECT_THROW(missing.encode(), PackError);

    GtpV2Paa extra;
    extra.pdn_type = PdnType::IPV6;
    extra.ipv6_address = "2001:db8::1";
    extra.ipv4_address = "10.0.0.1";
    EXPECT_THROW(extra.encode(), PackError);

    GtpV2Paa bad;
    bad.ipv4_address = "10.0.0";
    EXPECT_THROW(bad.encode(), PackError);

    EXPECT_THROW(GtpV2Paa::decode({0x02, 0x40, 0x20, 0x01}), DecodeError);
}

// ============================================================================
// Describer tables
// ============================================================================

TEST(GtpDescribeTest, V2Scalars) {
    auto rat = describeV2Value(static_cast<uint8_t>(GtpV2IEType::RAT_TYPE), {6});
    ASSERT_TRUE(rat.has_value());
    EXPECT_EQ((*rat)["name"], "EUTRAN");

    auto pdn = describeV2Value(static_cast<uint8_t>(GtpV2IEType::PDN_TYPE), {0x03});
    EXPECT_EQ((*pdn)["name"], "IPv4v6");

    auto timer = describeV2Value(static_cast<uint8_t>(GtpV2IEType::EPC_TIMER), {0x65});
    EXPECT_EQ((*timer)["unit"], 3);
    EXPECT_EQ((*timer)["value"], 5);

    auto throttling = describeV2Value(static_cast<uint8_t>(GtpV2IEType::THROTTLING), {0x21, 50});
    EXPECT_EQ((*throttling)["delay_unit"], 1);
    EXPECT_EQ((*throttling)["delay_value"], 1);
    EXPECT_EQ((*throttling)["factor"], 50);

    auto charging = describeV2Value(static_cast<uint8_t>(GtpV2IEType::CHARGING_ID),
                                    {0x00, 0x00, 0x01, 0x00});
    EXPECT_EQ(*charging, 256);
}

TEST(GtpDescribeTest, V2UnknownTypeHasNoView) {
    EXPECT_FALSE(describeV2Value(200, {0x01}).has_value());
    EXPECT_FALSE(
        describeV2Value(static_cast<uint8_t>(GtpV2IEType::BEARER_TFT), {0x01}).has_value());
}

TEST(GtpDescribeTest, V2ErrorsBecomeJson) {
    auto ambr = describeV2Value(static_cast<uint8_t>(GtpV2IEType::AMBR), {0x00, 0x01});
    ASSERT_TRUE(ambr.has_value());
    EXPECT_TRUE(ambr->contains("error"));
}

TEST(GtpDescribeTest, V1Values) {
    auto cause = describeV1Value(static_cast<uint8_t>(GtpV1IEType::CAUSE), {0x80});
    EXPECT_TRUE((*cause)["accepted"].get<bool>());

    auto teid2 = describeV1Value(static_cast<uint8_t>(GtpV1IEType::TEID_DATA_II),
                                 {0x05, 0x00, 0x00, 0x00, 0x01});
    EXPECT_EQ((*teid2)["nsapi"], 5);
    EXPECT_EQ((*teid2)["teid"], 1);

    auto gsn = describeV1Value(static_cast<uint8_t>(GtpV1IEType::GSN_ADDRESS),
                               {0xc0, 0xa8, 0x01, 0x01});
    EXPECT_EQ(*gsn, "192.168.1.1");

    auto bad_gsn = describeV1Value(static_cast<uint8_t>(GtpV1IEType::GSN_ADDRESS), {0xc0, 0xa8});
    EXPECT_TRUE(bad_gsn->contains("error"));

    auto msisdn = describeV1Value(static_cast<uint8_t>(GtpV1IEType::MSISDN),
                                  {0x91, 0x64, 0x07, 0x12, 0x34, 0xf5});
    EXPECT_EQ(*msisdn, "467021435");

    auto eua = describeV1Value(static_cast<uint8_t>(GtpV1IEType::END_USER_ADDRESS),
                               {0xf1, 0x21, 0x0a, 0x00, 0x00, 0x01});
    EXPECT_EQ((*eua)["organization"], 1);
    EXPECT_EQ((*eua)["pdp_type"], 0x21);
    EXPECT_EQ((*eua)["ipv4"], "10.0.0.1");
}
