/**
 * mesh_types.cpp - Names for the domain enums
 * 
 * These strings are persisted by the message store; do not rename them.
 */

#include "mesh_types.h"

const char* radioStatusName(RadioStatus status) {
    switch (status) {
        case RADIO_PENDING:   return "pending";
        case RADIO_SENT:      return "sent";
        case RADIO_DELIVERED: return "delivered";
        case RADIO_FAILED:    return "failed";
    }
    return "pending";
}

const char* mqttStatusName(MqttStatus status) {
    switch (status) {
        case MQTT_NOT_APPLICABLE: return "not_applicable";
        case MQTT_PENDING:        return "pending";
        case MQTT_SENT:           return "sent";
        case MQTT_FAILED:         return "failed";
    }
    return "not_applicable";
}

const char* channelRoleName(ChannelRole role) {
    switch (role) {
        case CHANNEL_DISABLED:  return "DISABLED";
        case CHANNEL_PRIMARY:   return "PRIMARY";
        case CHANNEL_SECONDARY: return "SECONDARY";
    }
    return "DISABLED";
}

const char* messageTypeName(MessageType type) {
    return type == MSG_LOCATION ? "location" : "text";
}

const char* configSectionName(ConfigSectionKind kind) {
    switch (kind) {
        case SECTION_DEVICE:       return "device";
        case SECTION_POSITION:     return "position";
        case SECTION_POWER:        return "power";
        case SECTION_NETWORK:      return "network";
        case SECTION_DISPLAY:      return "display";
        case SECTION_LORA:         return "lora";
        case SECTION_BLUETOOTH:    return "bluetooth";
        case CONFIG_SECTION_COUNT: break;
    }
    return "unknown";
}

const char* syncStateName(SyncState state) {
    switch (state) {
        case SYNC_UNKNOWN:       return "Unknown";
        case SYNC_SYNCED:        return "Synced";
        case SYNC_PENDING_WRITE: return "PendingWrite";
        case SYNC_FAILED:        return "Failed";
    }
    return "Unknown";
}

bool parseRadioStatus(const std::string& text, RadioStatus* status) {
    if (text == "pending")   { *status = RADIO_PENDING;   return true; }
    if (text == "sent")      { *status = RADIO_SENT;      return true; }
    if (text == "delivered") { *status = RADIO_DELIVERED; return true; }
    if (text == "failed")    { *status = RADIO_FAILED;    return true; }
    return false;
}

bool parseMqttStatus(const std::string& text, MqttStatus* status) {
    if (text == "not_applicable") { *status = MQTT_NOT_APPLICABLE; return true; }
    if (text == "pending")        { *status = MQTT_PENDING;        return true; }
    if (text == "sent")           { *status = MQTT_SENT;           return true; }
    if (text == "failed")         { *status = MQTT_FAILED;         return true; }
    return false;
}

bool parseMessageType(const std::string& text, MessageType* type) {
    if (text == "text")     { *type = MSG_TEXT;     return true; }
    if (text == "location") { *type = MSG_LOCATION; return true; }
    return false;
}
