#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ctlwire {
namespace gtp {

// ============================================================================
// GTPv1-C (3GPP TS 29.060)
// ============================================================================

/**
 * GTPv1 message types
 */
enum class GtpV1MessageType : uint8_t {
    ECHO_REQUEST = 1,
    ECHO_RESPONSE = 2,
    VERSION_NOT_SUPPORTED = 3,
    NODE_ALIVE_REQUEST = 4,
    NODE_ALIVE_RESPONSE = 5,
    REDIRECTION_REQUEST = 6,
    REDIRECTION_RESPONSE = 7,
    CREATE_PDP_CONTEXT_REQUEST = 16,
    CREATE_PDP_CONTEXT_RESPONSE = 17,
    UPDATE_PDP_CONTEXT_REQUEST = 18,
    UPDATE_PDP_CONTEXT_RESPONSE = 19,
    DELETE_PDP_CONTEXT_REQUEST = 20,
    DELETE_PDP_CONTEXT_RESPONSE = 21,
    INITIATE_PDP_CONTEXT_ACTIVATION_REQUEST = 22,
    INITIATE_PDP_CONTEXT_ACTIVATION_RESPONSE = 23,
    ERROR_INDICATION = 26,
    PDU_NOTIFICATION_REQUEST = 27,
    PDU_NOTIFICATION_RESPONSE = 28,
    SUPPORTED_EXTENSION_HEADERS_NOTIFICATION = 31,
    SGSN_CONTEXT_REQUEST = 50,
    SGSN_CONTEXT_RESPONSE = 51,
    SGSN_CONTEXT_ACKNOWLEDGE = 52,
    DATA_RECORD_TRANSFER_REQUEST = 240,
    DATA_RECORD_TRANSFER_RESPONSE = 241,
    END_MARKER = 254,
    G_PDU = 255
};

/**
 * GTPv1 IE types. Types below 0x80 are TV (fixed length, no length field);
 * types from 0x80 up are TLV with a 16-bit length.
 */
enum class GtpV1IEType : uint8_t {
    RESERVED = 0,
    CAUSE = 1,
    IMSI = 2,
    RAI = 3,
    TLLI = 4,
    P_TMSI = 5,
    REORDERING_REQUIRED = 8,
    AUTHENTICATION_TRIPLET = 9,
    MAP_CAUSE = 11,
    P_TMSI_SIGNATURE = 12,
    MS_VALIDATED = 13,
    RECOVERY = 14,
    SELECTION_MODE = 15,
    TEID_DATA_I = 16,
    TEID_CONTROL_PLANE = 17,
    TEID_DATA_II = 18,
    TEARDOWN_IND = 19,
    NSAPI = 20,
    RANAP_CAUSE = 21,
    RAB_CONTEXT = 22,
    RADIO_PRIORITY_SMS = 23,
    RADIO_PRIORITY = 24,
    PACKET_FLOW_ID = 25,
    CHARGING_CHARACTERISTICS = 26,
    TRACE_REFERENCE = 27,
    TRACE_TYPE = 28,
    MS_NOT_REACHABLE_REASON = 29,
    CHARGING_ID = 127,
    END_USER_ADDRESS = 128,
    APN = 131,
    PCO = 132,
    GSN_ADDRESS = 133,
    MSISDN = 134,
    QOS_PROFILE = 135,
    CHARGING_GATEWAY_ADDRESS = 251,
    PRIVATE_EXTENSION = 255
};

/// GTPv1 Cause value for "Request accepted"
constexpr uint8_t kGtpV1CauseRequestAccepted = 0x80;

/**
 * True when the IE type carries an explicit 16-bit length
 */
inline bool isGtpV1TlvType(uint8_t type) {
    return (type & 0x80) != 0;
}

/**
 * Value length of a TV-form IE from the static type table
 * @return Length or nullopt if the TV type is not in the table
 */
std::optional<size_t> getGtpV1TvLength(uint8_t type);

std::string getV1MessageTypeName(uint8_t type);
std::string getV1IETypeName(uint8_t type);

// ============================================================================
// GTPv2-C (3GPP TS 29.274)
// ============================================================================

enum class GtpV2MessageType : uint8_t {
    ECHO_REQUEST = 1,
    ECHO_RESPONSE = 2,
    VERSION_NOT_SUPPORTED_INDICATION = 3,
    CREATE_SESSION_REQUEST = 32,
    CREATE_SESSION_RESPONSE = 33,
    MODIFY_BEARER_REQUEST = 34,
    MODIFY_BEARER_RESPONSE = 35,
    DELETE_SESSION_REQUEST = 36,
    DELETE_SESSION_RESPONSE = 37,
    CHANGE_NOTIFICATION_REQUEST = 38,
    CHANGE_NOTIFICATION_RESPONSE = 39,
    MODIFY_BEARER_COMMAND = 64,
    MODIFY_BEARER_FAILURE_INDICATION = 65,
    DELETE_BEARER_COMMAND = 66,
    DELETE_BEARER_FAILURE_INDICATION = 67,
    BEARER_RESOURCE_COMMAND = 68,
    BEARER_RESOURCE_FAILURE_INDICATION = 69,
    DOWNLINK_DATA_NOTIFICATION_FAILURE_INDICATION = 70,
    CREATE_BEARER_REQUEST = 95,
    CREATE_BEARER_RESPONSE = 96,
    UPDATE_BEARER_REQUEST = 97,
    UPDATE_BEARER_RESPONSE = 98,
    DELETE_BEARER_REQUEST = 99,
    DELETE_BEARER_RESPONSE = 100,
    CONTEXT_REQUEST = 130,
    CONTEXT_RESPONSE = 131,
    CONTEXT_ACKNOWLEDGE = 132,
    DETACH_NOTIFICATION = 149,
    DETACH_ACKNOWLEDGE = 150,
    RELEASE_ACCESS_BEARERS_REQUEST = 170,
    RELEASE_ACCESS_BEARERS_RESPONSE = 171,
    DOWNLINK_DATA_NOTIFICATION = 176,
    DOWNLINK_DATA_NOTIFICATION_ACKNOWLEDGE = 177,
    MODIFY_ACCESS_BEARERS_REQUEST = 211,
    MODIFY_ACCESS_BEARERS_RESPONSE = 212
};

enum class GtpV2IEType : uint8_t {
    RESERVED = 0,
    IMSI = 1,
    CAUSE = 2,
    RECOVERY = 3,
    APN = 71,
    AMBR = 72,
    EPS_BEARER_ID = 73,
    IP_ADDRESS = 74,
    MEI = 75,
    MSISDN = 76,
    INDICATION = 77,
    PCO = 78,
    PAA = 79,
    BEARER_QOS = 80,
    FLOW_QOS = 81,
    RAT_TYPE = 82,
    SERVING_NETWORK = 83,
    BEARER_TFT = 84,
    ULI = 86,
    F_TEID = 87,
    BEARER_CONTEXT = 93,
    CHARGING_ID = 94,
    CHARGING_CHARACTERISTICS = 95,
    PDN_TYPE = 99,
    PTI = 100,
    UE_TIME_ZONE = 114,
    APN_RESTRICTION = 127,
    SELECTION_MODE = 128,
    FQ_CSID = 132,
    THROTTLING = 154,
    ARP = 155,
    EPC_TIMER = 156,
    PRIVATE_EXTENSION = 255
};

/**
 * F-TEID interface types (TS 29.274 section 8.22)
 */
enum class FteidInterfaceType : uint8_t {
    S1_U_ENODEB_GTP_U = 0,
    S1_U_SGW_GTP_U = 1,
    S12_RNC_GTP_U = 2,
    S12_SGW_GTP_U = 3,
    S5_S8_SGW_GTP_U = 4,
    S5_S8_PGW_GTP_U = 5,
    S5_S8_SGW_GTP_C = 6,
    S5_S8_PGW_GTP_C = 7,
    S5_S8_SGW_PMIPV6 = 8,
    S5_S8_PGW_PMIPV6 = 9,
    S11_MME_GTP_C = 10,
    S11_S4_SGW_GTP_C = 11,
    S10_MME_GTP_C = 12,
    S3_MME_GTP_C = 13,
    S3_SGSN_GTP_C = 14,
    S4_SGSN_GTP_U = 15,
    S4_SGW_GTP_U = 16,
    S4_SGSN_GTP_C = 17,
    S16_SGSN_GTP_C = 18
};

enum class PdnType : uint8_t {
    IPV4 = 1,
    IPV6 = 2,
    IPV4V6 = 3,
    NON_IP = 4
};

enum class RatType : uint8_t {
    UTRAN = 1,
    GERAN = 2,
    WLAN = 3,
    GAN = 4,
    HSPA_EVOLUTION = 5,
    EUTRAN = 6,
    VIRTUAL = 7,
    EUTRAN_NB_IOT = 8,
    LTE_M = 9,
    NR = 10
};

/// GTPv2 Cause value for "Request accepted"
constexpr uint8_t kGtpV2CauseRequestAccepted = 16;

/**
 * Per-call codec switches shared by GTPv1 and GTPv2 message decoding
 */
struct GtpCodecOptions {
    bool strict_length = false;                   // reject bytes after the declared length
    std::vector<uint8_t> grouped_v2_types = {93};  // IE types expanded by toJson()

    bool isGroupedV2Type(uint8_t type) const;
};

std::string getV2MessageTypeName(uint8_t type);
std::string getV2IETypeName(uint8_t type);
std::string getInterfaceTypeName(FteidInterfaceType type);
std::string getRatTypeName(uint8_t rat);
std::string getPdnTypeName(uint8_t pdn);

}  // namespace gtp
}  // namespace ctlwire
