#include "protocols/gtp/gtp_types.h"

#include <algorithm>
#include <unordered_map>

namespace ctlwire {
namespace gtp {

namespace {

// TV value lengths (TS 29.060 section 7.7); TLV types never appear here
const std::unordered_map<uint8_t, size_t> kV1TvLengths = {
    {0, 0},   {1, 1},   {2, 8},   {3, 6},   {4, 4},   {5, 4},   {8, 1},
    {9, 28},  {11, 1},  {12, 3},  {13, 1},  {14, 1},  {15, 1},  {16, 4},
    {17, 4},  {18, 5},  {19, 1},  {20, 1},  {21, 1},  {22, 9},  {23, 1},
    {24, 1},  {25, 2},  {26, 2},  {27, 2},  {28, 2},  {29, 1},  {127, 4},
};

const std::unordered_map<uint8_t, const char*> kV1MessageNames = {
    {1, "Echo Request"},
    {2, "Echo Response"},
    {3, "Version Not Supported"},
    {4, "Node Alive Request"},
    {5, "Node Alive Response"},
    {6, "Redirection Request"},
    {7, "Redirection Response"},
    {16, "Create PDP Context Request"},
    {17, "Create PDP Context Response"},
    {18, "Update PDP Context Request"},
    {19, "Update PDP Context Response"},
    {20, "Delete PDP Context Request"},
    {21, "Delete PDP Context Response"},
    {22, "Initiate PDP Context Activation Request"},
    {23, "Initiate PDP Context Activation Response"},
    {26, "Error Indication"},
    {27, "PDU Notification Request"},
    {28, "PDU Notification Response"},
    {31, "Supported Extension Headers Notification"},
    {50, "SGSN Context Request"},
    {51, "SGSN Context Response"},
    {52, "SGSN Context Acknowledge"},
    {240, "Data Record Transfer Request"},
    {241, "Data Record Transfer Response"},
    {254, "End Marker"},
    {255, "G-PDU"},
};

const std::unordered_map<uint8_t, const char*> kV1IENames = {
    {0, "Reserved"},
    {1, "Cause"},
    {2, "IMSI"},
    {3, "Routing Area Identity"},
    {4, "TLLI"},
    {5, "P-TMSI"},
    {8, "Reordering Required"},
    {9, "Authentication Triplet"},
    {11, "MAP Cause"},
    {12, "P-TMSI Signature"},
    {13, "MS Validated"},
    {14, "Recovery"},
    {15, "Selection Mode"},
    {16, "TEID Data I"},
    {17, "TEID Control Plane"},
    {18, "TEID Data II"},
    {19, "Teardown Ind"},
    {20, "NSAPI"},
    {21, "RANAP Cause"},
    {22, "RAB Context"},
    {23, "Radio Priority SMS"},
    {24, "Radio Priority"},
    {25, "Packet Flow Id"},
    {26, "Charging Characteristics"},
    {27, "Trace Reference"},
    {28, "Trace Type"},
    {29, "MS Not Reachable Reason"},
    {127, "Charging ID"},
    {128, "End User Address"},
    {131, "Access Point Name"},
    {132, "Protocol Configuration Options"},
    {133, "GSN Address"},
    {134, "MSISDN"},
    {135, "Quality of Service Profile"},
    {251, "Charging Gateway Address"},
    {255, "Private Extension"},
};

const std::unordered_map<uint8_t, const char*> kV2MessageNames = {
    {1, "Echo Request"},
    {2, "Echo Response"},
    {3, "Version Not Supported Indication"},
    {32, "Create Session Request"},
    {33, "Create Session Response"},
    {34, "Modify Bearer Request"},
    {35, "Modify Bearer Response"},
    {36, "Delete Session Request"},
    {37, "Delete Session Response"},
    {38, "Change Notification Request"},
    {39, "Change Notification Response"},
    {64, "Modify Bearer Command"},
    {65, "Modify Bearer Failure Indication"},
    {66, "Delete Bearer Command"},
    {67, "Delete Bearer Failure Indication"},
    {68, "Bearer Resource Command"},
    {69, "Bearer Resource Failure Indication"},
    {70, "Downlink Data Notification Failure Indication"},
    {95, "Create Bearer Request"},
    {96, "Create Bearer Response"},
    {97, "Update Bearer Request"},
    {98, "Update Bearer Response"},
    {99, "Delete Bearer Request"},
    {100, "Delete Bearer Response"},
    {130, "Context Request"},
    {131, "Context Response"},
    {132, "Context Acknowledge"},
    {149, "Detach Notification"},
    {150, "Detach Acknowledge"},
    {170, "Release Access Bearers Request"},
    {171, "Release Access Bearers Response"},
    {176, "Downlink Data Notification"},
    {177, "Downlink Data Notification Acknowledge"},
    {211, "Modify Access Bearers Request"},
    {212, "Modify Access Bearers Response"},
};

const std::unordered_map<uint8_t, const char*> kV2IENames = {
    {0, "Reserved"},
    {1, "IMSI"},
    {2, "Cause"},
    {3, "Recovery"},
    {71, "APN"},
    {72, "AMBR"},
    {73, "EPS Bearer ID"},
    {74, "IP Address"},
    {75, "MEI"},
    {76, "MSISDN"},
    {77, "Indication"},
    {78, "PCO"},
    {79, "PAA"},
    {80, "Bearer QoS"},
    {81, "Flow QoS"},
    {82, "RAT Type"},
    {83, "Serving Network"},
    {84, "Bearer TFT"},
    {86, "ULI"},
    {87, "F-TEID"},
    {93, "Bearer Context"},
    {94, "Charging ID"},
    {95, "Charging Characteristics"},
    {99, "PDN Type"},
    {100, "PTI"},
    {114, "UE Time Zone"},
    {127, "APN Restriction"},
    {128, "Selection Mode"},
    {132, "FQ-CSID"},
    {154, "Throttling"},
    {155, "ARP"},
    {156, "EPC Timer"},
    {255, "Private Extension"},
};

const std::unordered_map<uint8_t, const char*> kInterfaceNames = {
    {0, "S1-U eNodeB GTP-U"},
    {1, "S1-U SGW GTP-U"},
    {2, "S12 RNC GTP-U"},
    {3, "S12 SGW GTP-U"},
    {4, "S5/S8 SGW GTP-U"},
    {5, "S5/S8 PGW GTP-U"},
    {6, "S5/S8 SGW GTP-C"},
    {7, "S5/S8 PGW GTP-C"},
    {8, "S5/S8 SGW PMIPv6"},
    {9, "S5/S8 PGW PMIPv6"},
    {10, "S11 MME GTP-C"},
    {11, "S11/S4 SGW GTP-C"},
    {12, "S10 MME GTP-C"},
    {13, "S3 MME GTP-C"},
    {14, "S3 SGSN GTP-C"},
    {15, "S4 SGSN GTP-U"},
    {16, "S4 SGW GTP-U"},
    {17, "S4 SGSN GTP-C"},
    {18, "S16 SGSN GTP-C"},
};

const std::unordered_map<uint8_t, const char*> kRatNames = {
    {1, "UTRAN"},  {2, "GERAN"},   {3, "WLAN"},          {4, "GAN"},  {5, "HSPA Evolution"},
    {6, "EUTRAN"}, {7, "Virtual"}, {8, "EUTRAN-NB-IoT"}, {9, "LTE-M"}, {10, "NR"},
};

const std::unordered_map<uint8_t, const char*> kPdnNames = {
    {1, "IPv4"}, {2, "IPv6"}, {3, "IPv4v6"}, {4, "Non-IP"},
};

std::string lookupName(const std::unordered_map<uint8_t, const char*>& names, uint8_t code) {
    auto it = names.find(code);
    if (it != names.end()) {
        return it->second;
    }
    return "Unknown (" + std::to_string(code) + ")";
}

}  // namespace

bool GtpCodecOptions::isGroupedV2Type(uint8_t type) const {
    return std::find(grouped_v2_types.begin(), grouped_v2_types.end(), type) !=
           grouped_v2_types.end();
}

std::optional<size_t> getGtpV1TvLength(uint8_t type) {
    auto it = kV1TvLengths.find(type);
    if (it == kV1TvLengths.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string getV1MessageTypeName(uint8_t type) {
    return lookupName(kV1MessageNames, type);
}

std::string getV1IETypeName(uint8_t type) {
    return lookupName(kV1IENames, type);
}

std::string getV2MessageTypeName(uint8_t type) {
    return lookupName(kV2MessageNames, type);
}

std::string getV2IETypeName(uint8_t type) {
    return lookupName(kV2IENames, type);
}

std::string getInterfaceTypeName(FteidInterfaceType type) {
    return lookupName(kInterfaceNames, static_cast<uint8_t>(type));
}

std::string getRatTypeName(uint8_t rat) {
    return lookupName(kRatNames, rat);
}

std::string getPdnTypeName(uint8_t pdn) {
    return lookupName(kPdnNames, pdn);
}

}  // namespace gtp
}  // namespace ctlwire
