#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/codec_error.h"
#include "protocols/gtp/gtp_ie_values.h"
#include "protocols/gtp/gtpv2_message.h"

using namespace ctlwire;
using namespace ctlwire::gtp;
using ::testing::ElementsAre;

/**
 * Test fixture for GTPv2-C message decoding
 */
class GtpV2MessageTest : public ::testing::Test {
protected:
    /**
     * Create Session Request: TEID 0x10, sequence 0x01000a, IMSI and a
     * plain-text APN value
     */
    std::vector<uint8_t> createSessionRequest() {
        std::vector<uint8_t> data = {
            0x48, 0x20, 0x00, 0x29, 0x00, 0x00, 0x00, 0x10, 0x01, 0x00, 0x0a, 0x00,  // Header
            0x01, 0x00, 0x08, 0x00, 0x44, 0x90, 0x01, 0x12, 0x23, 0x34, 0x45, 0xf5,  // IMSI
            0x47, 0x00, 0x11, 0x00,                                                  // APN
        };
        std::string apn = "some.operator.net";
        data.insert(data.end(), apn.begin(), apn.end());
        return data;
    }

    GtpV2Message echoRequest(uint32_t sequence) {
        GtpV2Message msg;
        msg.header.setTeidPresent(false);
        msg.header.message_type = static_cast<uint8_t>(GtpV2MessageType::ECHO_REQUEST);
        msg.header.sequence_number = sequence;
        msg.ies.push_back(GtpV2IE::make(GtpV2IEType::RECOVERY, {0x05}));
        return msg;
    }
};

TEST_F(GtpV2MessageTest, ParseCreateSessionRequest) {
    auto data = createSessionRequest();
    ASSERT_EQ(data.size(), 45u);

    GtpV2Message msg = GtpV2Message::decode(data);
    EXPECT_EQ(msg.header.version(), 2);
    EXPECT_FALSE(msg.header.piggyback());
    EXPECT_TRUE(msg.header.teidPresent());
    EXPECT_FALSE(msg.header.priorityPresent());
    EXPECT_EQ(msg.header.message_type,
              static_cast<uint8_t>(GtpV2MessageType::CREATE_SESSION_REQUEST));
    EXPECT_EQ(msg.header.length, 41);
    EXPECT_EQ(msg.header.teid, 0x00000010u);
    EXPECT_EQ(msg.header.sequence_number, 0x01000au);

    ASSERT_EQ(msg.ies.size(), 2u);
    EXPECT_EQ(msg.ies[0].type, 1);
    EXPECT_EQ(msg.ies[0].value.size(), 8u);
    EXPECT_EQ(msg.ies[0].crFlag(), 0);
    EXPECT_EQ(msg.ies[0].instance(), 0);
    EXPECT_EQ(GtpValueCodec::decodeDigits(msg.ies[0].value), "440910213243545");

    EXPECT_EQ(msg.ies[1].type, 71);
    EXPECT_EQ(std::string(msg.ies[1].value.begin(), msg.ies[1].value.end()),
              "some.operator.net");
}

TEST_F(GtpV2MessageTest, PackCreateSessionRequest) {
    GtpV2Message msg;
    msg.header.message_type = static_cast<uint8_t>(GtpV2MessageType::CREATE_SESSION_REQUEST);
    msg.header.teid = 0x00000010;
    msg.header.sequence_number = 0x01000a;

    std::string apn = "some.operator.net";
    msg.ies.push_back(GtpV2IE::make(GtpV2IEType::IMSI, {0x44, 0x90, 0x01, 0x12, 0x23, 0x34,
                                                         0x45, 0xf5}));
    msg.ies.push_back(GtpV2IE::make(GtpV2IEType::APN, {apn.begin(), apn.end()}));

    EXPECT_EQ(msg.encode(), createSessionRequest());
}

TEST_F(GtpV2MessageTest, HeaderWithoutTeid) {
    auto data = echoRequest(0x000123).encode();
    EXPECT_THAT(data, ElementsAre(0x40, 0x01, 0x00, 0x09, 0x00, 0x01, 0x23, 0x00, 0x03, 0x00,
                                  0x01, 0x00, 0x05));

    GtpV2Message msg = GtpV2Message::decode(data);
    EXPECT_FALSE(msg.header.teidPresent());
    EXPECT_EQ(msg.header.teid, 0u);
    EXPECT_EQ(msg.header.sequence_number, 0x000123u);
    ASSERT_EQ(msg.ies.size(), 1u);
    EXPECT_EQ(msg.ies[0].type, static_cast<uint8_t>(GtpV2IEType::RECOVERY));

    nlohmann::json j = msg.header.toJson();
    EXPECT_FALSE(j.contains("teid"));
    EXPECT_EQ(j["message_type_name"], "Echo Request");
}

TEST_F(GtpV2MessageTest, MessagePriority) {
    GtpV2Message msg;
    msg.header.setPriorityPresent(true);
    msg.header.message_type = static_cast<uint8_t>(GtpV2MessageType::MODIFY_BEARER_REQUEST);
    msg.header.teid = 0xabcdef01;
    msg.header.sequence_number = 2;
    msg.header.message_priority = 7;

    auto data = msg.encode();
    ASSERT_EQ(data.size(), 12u);
    EXPECT_EQ(data[0], 0x4c);
    EXPECT_EQ(data[11], 0x70);

    GtpV2Message decoded = GtpV2Message::decode(data);
    EXPECT_TRUE(decoded.header.priorityPresent());
    EXPECT_EQ(decoded.header.message_priority, 7);
    EXPECT_EQ(decoded.header.toJson()["message_priority"], 7);
}

TEST_F(GtpV2MessageTest, EncodeRejectsOversizedHeaderFields) {
    GtpV2Message msg = echoRequest(0x1000000);
    EXPECT_THROW(msg.encode(), PackError);

    msg = echoRequest(1);
    msg.header.setTeidPresent(true);
    msg.header.message_priority = 16;
    EXPECT_THROW(msg.encode(), PackError);
}

TEST_F(GtpV2MessageTest, VersionMismatch) {
    auto data = createSessionRequest();
    data[0] = 0x28;  // Version 1
    EXPECT_THROW(GtpV2Message::decode(data), DecodeError);
}

TEST_F(GtpV2MessageTest, ShortBufferNeedsData) {
    auto data = createSessionRequest();
    EXPECT_THROW(GtpV2Message::decode(data.data(), 3), NeedData);
    EXPECT_THROW(GtpV2Message::decode(data.data(), 30), NeedData);
}

TEST_F(GtpV2MessageTest, TrailingBytes) {
    auto data = createSessionRequest();
    data.push_back(0x00);

    GtpV2Message msg = GtpV2Message::decode(data);
    EXPECT_EQ(msg.ies.size(), 2u);

    GtpCodecOptions strict;
    strict.strict_length = true;
    EXPECT_THROW(GtpV2Message::decode(data, strict), DecodeError);
}

TEST_F(GtpV2MessageTest, TruncatedIEInBody) {
    auto data = createSessionRequest();
    // APN claims one byte more than the message carries
    data[26] = 0x12;

    EXPECT_THROW(GtpV2Message::decode(data), DecodeError);
}

TEST_F(GtpV2MessageTest, FindIEByInstance) {
    GtpV2Message msg = echoRequest(1);
    msg.ies.push_back(GtpV2IE::make(GtpV2IEType::RECOVERY, {0x06}, 1));

    const GtpV2IE* first = msg.findIE(GtpV2IEType::RECOVERY);
    ASSERT_NE(first, nullptr);
    EXPECT_THAT(first->value, ElementsAre(0x05));

    const GtpV2IE* second = msg.findIE(GtpV2IEType::RECOVERY, 1);
    ASSERT_NE(second, nullptr);
    EXPECT_THAT(second->value, ElementsAre(0x06));

    EXPECT_EQ(msg.findIE(GtpV2IEType::RECOVERY, 2), nullptr);
}

TEST_F(GtpV2MessageTest, ToJson) {
    GtpV2Message msg = GtpV2Message::decode(createSessionRequest());

    nlohmann::json j = msg.toJson();
    EXPECT_EQ(j["header"]["version"], 2);
    EXPECT_EQ(j["header"]["teid"], 16);
    EXPECT_EQ(j["header"]["sequence_number"], 0x01000a);
    EXPECT_EQ(j["header"]["message_type_name"], "Create Session Request");
    ASSERT_EQ(j["ies"].size(), 2u);
    EXPECT_EQ(j["ies"][0]["decoded"], "440910213243545");
    EXPECT_EQ(j["ies"][1]["type_name"], "APN");
}

TEST_F(GtpV2MessageTest, DeeplyNestedBearerContextDumps) {
    // 16000 Bearer Contexts wrapped around one EBI, close to the 16-bit body limit
    const size_t levels = 16000;
    std::vector<uint8_t> value;
    size_t total = 4 * (levels - 1) + 5;
    for (size_t i = 1; i < levels; ++i) {
        size_t inner_length = total - 4 * i;
        value.insert(value.end(), {0x5d, static_cast<uint8_t>(inner_length >> 8),
                                   static_cast<uint8_t>(inner_length & 0xFF), 0x00});
    }
    value.insert(value.end(), {0x49, 0x00, 0x01, 0x00, 0x05});

    GtpV2Message msg;
    msg.header.message_type = static_cast<uint8_t>(GtpV2MessageType::CREATE_BEARER_REQUEST);
    msg.ies.push_back(GtpV2IE::make(GtpV2IEType::BEARER_CONTEXT, value));

    GtpV2Message decoded = GtpV2Message::decode(msg.encode());
    ASSERT_EQ(decoded.ies.size(), 1u);

    nlohmann::json j;
    ASSERT_NO_THROW(j = decoded.toJson());
    ASSERT_EQ(j["ies"].size(), 1u);
    EXPECT_TRUE(j["ies"][0].contains("ies"));
}

TEST_F(GtpV2MessageTest, HeaderCodecLayout) {
    const FieldCodec& codec = GtpV2Message::headerCodec();
    EXPECT_EQ(codec.headerLength(), GtpV2Header::kFixedLength);
    EXPECT_EQ(codec.defaults().at("flags"), 0x48u);
}
