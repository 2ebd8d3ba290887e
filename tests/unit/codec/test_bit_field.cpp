#include <gtest/gtest.h>

#include "codec/bit_field.h"

using namespace ctlwire;

TEST(BitFieldTest, GetReadsOnlyItsRange) {
    using Opcode = BitField<uint16_t, 11, 4>;
    using Rcode = BitField<uint16_t, 0, 4>;

    uint16_t op = 0x2903;  // opcode 5, rd, rcode 3
    EXPECT_EQ(Opcode::get(op), 5);
    EXPECT_EQ(Rcode::get(op), 3);
}

TEST(BitFieldTest, SetPreservesOtherBits) {
    using Opcode = BitField<uint16_t, 11, 4>;

    uint16_t op = 0xFFFF;
    Opcode::assign(op, 0);
    EXPECT_EQ(op, 0x87FF);

    Opcode::assign(op, 0xF);
    EXPECT_EQ(op, 0xFFFF);
}

TEST(BitFieldTest, SetMasksOversizedValues) {
    using Low = BitField<uint8_t, 0, 4>;

    uint8_t flags = 0xA0;
    Low::assign(flags, 0x1F);
    EXPECT_EQ(flags, 0xAF);
}

TEST(BitFieldTest, SetIsIdempotent) {
    using Version = BitField<uint8_t, 5, 3>;

    uint8_t flags = 0x12;
    uint8_t once = Version::set(flags, 2);
    EXPECT_EQ(Version::set(once, 2), once);
    EXPECT_EQ(once, 0x52);
}

TEST(BitFieldTest, MasksAreCompileTimeConstants) {
    static_assert(BitField<uint16_t, 11, 4>::kMask == 0x0F, "mask");
    static_assert(BitField<uint16_t, 11, 4>::kInPlaceMask == 0x7800, "in-place mask");
    static_assert(BitField<uint32_t, 24, 8>::get(0xAB000000u) == 0xAB, "constexpr get");
    SUCCEED();
}

TEST(BitFlagTest, IndependentFlags) {
    using Qr = BitFlag<uint16_t, 15>;
    using Rd = BitFlag<uint16_t, 8>;
    using Ra = BitFlag<uint16_t, 7>;

    uint16_t op = 0x8180;
    Rd::assign(op, false);
    EXPECT_EQ(op, 0x8080);
    EXPECT_TRUE(Qr::get(op));
    EXPECT_TRUE(Ra::get(op));

    Rd::assign(op, true);
    EXPECT_EQ(op, 0x8180);
}
