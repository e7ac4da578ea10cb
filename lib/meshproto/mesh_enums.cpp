/**
 * mesh_enums.cpp - Enum code to name tables
 * 
 */

#include "mesh_enums.h"

#include <cstdio>

struct EnumName {
    uint32_t code;
    const char* name;
};

#define TABLE_LEN(t) (sizeof(t) / sizeof(t[0]))

static const EnumName DEVICE_ROLES[] = {
    {0, "CLIENT"}, {1, "CLIENT_MUTE"}, {2, "ROUTER"}, {3, "ROUTER_CLIENT"},
    {4, "REPEATER"}, {5, "TRACKER"}, {6, "SENSOR"}, {7, "TAK"},
    {8, "CLIENT_HIDDEN"}, {9, "LOST_AND_FOUND"}, {10, "TAK_TRACKER"}
};

static const EnumName REBROADCAST_MODES[] = {
    {0, "ALL"}, {1, "ALL_SKIP_DECODING"}, {2, "LOCAL_ONLY"}, {3, "KNOWN_ONLY"}
};

static const EnumName REGIONS[] = {
    {0, "UNSET"}, {1, "US"}, {2, "EU_433"}, {3, "EU_868"}, {4, "CN"},
    {5, "JP"}, {6, "ANZ"}, {7, "KR"}, {8, "TW"}, {9, "RU"}, {10, "IN"},
    {11, "NZ_865"}, {12, "TH"}, {13, "LORA_24"}, {14, "UA_433"}, {15, "UA_868"},
    {16, "MY_433"}, {17, "MY_919"}, {18, "SG_923"}, {19, "PH_433"},
    {20, "PH_868"}, {21, "PH_915"}
};

static const EnumName MODEM_PRESETS[] = {
    {0, "LONG_FAST"}, {1, "LONG_SLOW"}, {2, "VERY_LONG_SLOW"},
    {3, "MEDIUM_SLOW"}, {4, "MEDIUM_FAST"}, {5, "SHORT_SLOW"},
    {6, "SHORT_FAST"}, {7, "LONG_MODERATE"}, {8, "SHORT_TURBO"}
};

static const EnumName GPS_FORMATS[] = {
    {0, "DEC"}, {1, "DMS"}, {2, "UTM"}, {3, "MGRS"}, {4, "OLC"}, {5, "OSGR"}
};

static const EnumName OLED_TYPES[] = {
    {0, "AUTO"}, {1, "SSD1306"}, {2, "SH1106"}, {3, "SH1107"}
};

static const EnumName BLUETOOTH_MODES[] = {
    {0, "RANDOM_PIN"}, {1, "FIXED_PIN"}, {2, "NO_PIN"}
};

// Gaps in the numbering are retired or reserved models
static const EnumName HW_MODELS[] = {
    {0, "UNSET"}, {1, "TLORA_V2"}, {2, "TLORA_V1"}, {3, "TLORA_V2_1_1P6"},
    {4, "TBEAM"}, {5, "HELTEC_V2_0"}, {6, "TBEAM_V0P7"}, {7, "T_ECHO"},
    {8, "TLORA_V1_1P3"}, {9, "RAK4631"}, {10, "HELTEC_V2_1"}, {11, "HELTEC_V1"},
    {12, "LILYGO_TBEAM_S3_CORE"}, {13, "RAK11200"}, {14, "NANO_G1"},
    {15, "TLORA_V2_1_1P8"}, {16, "TLORA_T3_S3"}, {17, "NANO_G1_EXPLORER"},
    {18, "NANO_G2_ULTRA"}, {19, "LORA_TYPE"}, {25, "STATION_G1"},
    {26, "RAK11310"}, {32, "HELTEC_WIRELESS_PAPER"},
    {33, "HELTEC_WIRELESS_PAPER_V1_0"}, {34, "HELTEC_WIRELESS_TRACKER"},
    {35, "HELTEC_WIRELESS_TRACKER_V1_0"}, {36, "HELTEC_VISION_MASTER_T190"},
    {37, "HELTEC_VISION_MASTER_E213"}, {38, "HELTEC_VISION_MASTER_E290"},
    {39, "HELTEC_MESH_NODE_T114"}, {40, "T_WATCH_S3"}, {41, "PICOMPUTER_S3"},
    {42, "HELTEC_HT62"}, {43, "EBYTE_ESP32_S3"}, {44, "ESP32_S3_PICO"},
    {45, "CHATTER_2"}, {47, "HELTEC_WIRELESS_PAPER_V1_1"},
    {48, "HELTEC_WIRELESS_TRACKER_V1_1"}, {49, "UNPHONE"}, {50, "TD_LORAC"},
    {51, "CDEBYTE_EORA_S3"}, {52, "TWC_MESH_V4"}, {53, "NRF52_PROMICRO_DIY"},
    {54, "RADIOMASTER_900_BANDIT_NANO"}, {55, "HELTEC_CAPSULE_SENSOR_V3"},
    {56, "HELTEC_VISION_MASTER_T"}, {57, "HELTEC_VISION_MASTER_E"},
    {58, "HELTEC_MESH_NODE_114"}, {255, "PRIVATE_HW"}
};

static const EnumName PORT_NUMS[] = {
    {0, "UNKNOWN_APP"}, {1, "TEXT_MESSAGE_APP"}, {2, "REMOTE_HARDWARE_APP"},
    {3, "POSITION_APP"}, {4, "NODEINFO_APP"}, {5, "ROUTING_APP"}, {6, "ADMIN_APP"},
    {7, "TEXT_MESSAGE_COMPRESSED_APP"}, {8, "WAYPOINT_APP"}, {9, "AUDIO_APP"},
    {10, "DETECTION_SENSOR_APP"}, {32, "REPLY_APP"}, {33, "IP_TUNNEL_APP"},
    {34, "PAXCOUNTER_APP"}, {64, "SERIAL_APP"}, {65, "STORE_FORWARD_APP"},
    {66, "RANGE_TEST_APP"}, {67, "TELEMETRY_APP"}, {68, "ZPS_APP"},
    {69, "SIMULATOR_APP"}, {70, "TRACEROUTE_APP"}, {71, "NEIGHBORINFO_APP"},
    {72, "ATAK_PLUGIN"}, {73, "MAP_REPORT_APP"}, {256, "PRIVATE_APP"},
    {257, "ATAK_FORWARDER"}
};

static const EnumName ROUTING_ERRORS[] = {
    {0, "NONE"}, {1, "NO_ROUTE"}, {2, "GOT_NAK"}, {3, "TIMEOUT"},
    {4, "NO_INTERFACE"}, {5, "MAX_RETRANSMIT"}, {6, "NO_CHANNEL"},
    {7, "TOO_LARGE"}, {8, "NO_RESPONSE"}, {9, "DUTY_CYCLE_LIMIT"},
    {32, "BAD_REQUEST"}, {33, "NOT_AUTHORIZED"}
};

static std::string lookup(const EnumName* table, size_t len, uint32_t code,
                          const char* fallbackPrefix) {
    for (size_t i = 0; i < len; i++) {
        if (table[i].code == code) {
            return table[i].name;
        }
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%s(%u)", fallbackPrefix, (unsigned)code);
    return buf;
}

std::string MeshEnums::deviceRole(uint32_t code) {
    return lookup(DEVICE_ROLES, TABLE_LEN(DEVICE_ROLES), code, "UNKNOWN");
}

std::string MeshEnums::rebroadcastMode(uint32_t code) {
    return lookup(REBROADCAST_MODES, TABLE_LEN(REBROADCAST_MODES), code, "UNKNOWN");
}

std::string MeshEnums::region(uint32_t code) {
    return lookup(REGIONS, TABLE_LEN(REGIONS), code, "UNKNOWN");
}

std::string MeshEnums::modemPreset(uint32_t code) {
    return lookup(MODEM_PRESETS, TABLE_LEN(MODEM_PRESETS), code, "UNKNOWN");
}

std::string MeshEnums::gpsFormat(uint32_t code) {
    return lookup(GPS_FORMATS, TABLE_LEN(GPS_FORMATS), code, "UNKNOWN");
}

std::string MeshEnums::units(uint32_t code) {
    return code == 0 ? "METRIC" : "IMPERIAL";
}

std::string MeshEnums::oledType(uint32_t code) {
    return lookup(OLED_TYPES, TABLE_LEN(OLED_TYPES), code, "UNKNOWN");
}

std::string MeshEnums::bluetoothMode(uint32_t code) {
    return lookup(BLUETOOTH_MODES, TABLE_LEN(BLUETOOTH_MODES), code, "UNKNOWN");
}

std::string MeshEnums::hwModel(uint32_t code) {
    return lookup(HW_MODELS, TABLE_LEN(HW_MODELS), code, "HW_MODEL");
}

std::string MeshEnums::portNum(uint32_t code) {
    return lookup(PORT_NUMS, TABLE_LEN(PORT_NUMS), code, "UNKNOWN");
}

std::string MeshEnums::routingError(uint32_t code) {
    return lookup(ROUTING_ERRORS, TABLE_LEN(ROUTING_ERRORS), code, "UNKNOWN");
}
