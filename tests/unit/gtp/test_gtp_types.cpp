#include <gtest/gtest.h>

#include "protocols/gtp/gtp_types.h"

using namespace ctlwire::gtp;

TEST(GtpTypesTest, TvLengthTable) {
    EXPECT_EQ(getGtpV1TvLength(1), 1u);    // Cause
    EXPECT_EQ(getGtpV1TvLength(2), 8u);    // IMSI
    EXPECT_EQ(getGtpV1TvLength(3), 6u);    // RAI
    EXPECT_EQ(getGtpV1TvLength(14), 1u);   // Recovery
    EXPECT_EQ(getGtpV1TvLength(16), 4u);   // TEID Data I
    EXPECT_EQ(getGtpV1TvLength(18), 5u);   // TEID Data II
    EXPECT_EQ(getGtpV1TvLength(127), 4u);  // Charging ID
}

TEST(GtpTypesTest, TvLengthUnknown) {
    EXPECT_FALSE(getGtpV1TvLength(0x1e).has_value());
    EXPECT_FALSE(getGtpV1TvLength(0x7e).has_value());
    // TLV types are never in the table
    EXPECT_FALSE(getGtpV1TvLength(0x83).has_value());
}

TEST(GtpTypesTest, TlvRangeStartsAt128) {
    EXPECT_FALSE(isGtpV1TlvType(0x7f));
    EXPECT_TRUE(isGtpV1TlvType(0x80));
    EXPECT_TRUE(isGtpV1TlvType(0xff));
}

TEST(GtpTypesTest, MessageTypeNames) {
    EXPECT_EQ(getV1MessageTypeName(16), "Create PDP Context Request");
    EXPECT_EQ(getV2MessageTypeName(32), "Create Session Request");
    EXPECT_EQ(getV2MessageTypeName(1), "Echo Request");
    EXPECT_EQ(getV2MessageTypeName(250), "Unknown (250)");
}

TEST(GtpTypesTest, IETypeNames) {
    EXPECT_EQ(getV1IETypeName(131), "Access Point Name");
    EXPECT_EQ(getV2IETypeName(87), "F-TEID");
    EXPECT_EQ(getV2IETypeName(93), "Bearer Context");
    EXPECT_EQ(getV2IETypeName(200), "Unknown (200)");
}

TEST(GtpTypesTest, EnumNames) {
    EXPECT_EQ(getInterfaceTypeName(FteidInterfaceType::S11_MME_GTP_C), "S11 MME GTP-C");
    EXPECT_EQ(getInterfaceTypeName(FteidInterfaceType::S1_U_SGW_GTP_U), "S1-U SGW GTP-U");
    EXPECT_EQ(getRatTypeName(6), "EUTRAN");
    EXPECT_EQ(getRatTypeName(10), "NR");
    EXPECT_EQ(getPdnTypeName(3), "IPv4v6");
    EXPECT_EQ(getPdnTypeName(7), "Unknown (7)");
}

TEST(GtpTypesTest, GroupedTypesOption) {
    GtpCodecOptions options;
    EXPECT_TRUE(options.isGroupedV2Type(93));
    EXPECT_FALSE(options.isGroupedV2Type(87));

    options.grouped_v2_types = {93, 180};
    EXPECT_TRUE(options.isGroupedV2Type(180));

    options.grouped_v2_types.clear();
    EXPECT_FALSE(options.isGroupedV2Type(93));
}
