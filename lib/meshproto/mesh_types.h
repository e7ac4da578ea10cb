/**
 * mesh_types.h - Domain types for the meshlink protocol core
 * 
 * Plain value types shared by the codec, the store, the delivery tracker and
 * the config layer. Optional values carry an explicit has* flag.
 */

#ifndef MESH_TYPES_H
#define MESH_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "mesh_config.h"

enum MessageType {
    MSG_TEXT     = 0,
    MSG_LOCATION = 1
};

// Radio track of an outgoing message
enum RadioStatus {
    RADIO_PENDING   = 0,   // stored, not handed to the transport yet
    RADIO_SENT      = 1,   // transmitted, awaiting confirmation
    RADIO_DELIVERED = 2,   // device reported an ACK
    RADIO_FAILED    = 3
};

// MQTT relay track of an outgoing message
enum MqttStatus {
    MQTT_NOT_APPLICABLE = 0,   // destination channel has no uplink
    MQTT_PENDING        = 1,
    MQTT_SENT           = 2,
    MQTT_FAILED         = 3
};

// Per config section, how the local view relates to the device
enum SyncState {
    SYNC_UNKNOWN       = 0,   // no device snapshot yet
    SYNC_SYNCED        = 1,
    SYNC_PENDING_WRITE = 2,   // written, waiting for confirmation
    SYNC_FAILED        = 3
};

enum ChannelRole {
    CHANNEL_DISABLED  = 0,
    CHANNEL_PRIMARY   = 1,
    CHANNEL_SECONDARY = 2
};

struct LocationData {
    double latitude;
    double longitude;
    bool hasAltitude;
    double altitude;
    bool hasTime;
    uint32_t time;          // epoch seconds

    LocationData() : latitude(0), longitude(0), hasAltitude(false), altitude(0),
                     hasTime(false), time(0) {}
};

struct Message {
    std::string id;         // unique, stable across persistence
    bool hasPacketId;       // set iff transmitted over the radio
    uint32_t packetId;
    uint32_t from;
    uint32_t to;            // BROADCAST_ADDR for channel messages
    std::string text;
    int64_t timestamp;      // epoch milliseconds
    bool isOutgoing;
    bool hasChannel;
    uint32_t channel;
    MessageType type;
    bool hasLocation;
    LocationData location;
    bool hasDualStatus;     // false for rows persisted before dual tracking
    RadioStatus radioStatus;
    MqttStatus mqttStatus;
    std::string status;     // legacy single status, "" if never recorded

    Message() : hasPacketId(false), packetId(0), from(0), to(0), timestamp(0),
                isOutgoing(false), hasChannel(false), channel(0), type(MSG_TEXT),
                hasLocation(false), hasDualStatus(false), radioStatus(RADIO_PENDING),
                mqttStatus(MQTT_NOT_APPLICABLE) {}

    bool isChannelMessage() const { return to == BROADCAST_ADDR; }
};

struct Channel {
    uint8_t index;          // 0..7, 0 is primary
    std::string name;
    ChannelRole role;
    std::vector<uint8_t> psk;
    bool uplinkEnabled;
    bool downlinkEnabled;
    uint32_t positionPrecision;   // 0 = not reported / not shared

    Channel() : index(0), role(CHANNEL_DISABLED), uplinkEnabled(false),
                downlinkEnabled(false), positionPrecision(0) {}

    bool hasEncryption() const { return !psk.empty(); }
};

struct PositionInfo {
    double latitude;
    double longitude;
    bool hasAltitude;
    int32_t altitude;
    uint32_t time;

    PositionInfo() : latitude(0), longitude(0), hasAltitude(false), altitude(0), time(0) {}
};

struct NodeInfo {
    uint32_t nodeNum;
    bool hasUser;
    std::string userId;
    std::string longName;
    std::string shortName;
    std::string hwModel;
    std::string role;
    uint32_t lastHeard;     // epoch seconds, 0 = unknown
    bool hasPosition;
    PositionInfo position;
    bool hasSnr;
    float snr;
    uint32_t hopsAway;
    bool viaMqtt;

    NodeInfo() : nodeNum(0), hasUser(false), lastHeard(0), hasPosition(false),
                 hasSnr(false), snr(0), hopsAway(0), viaMqtt(false) {}
};

struct MqttSettings {
    bool enabled;
    std::string address;
    std::string username;
    std::string password;
    bool encryptionEnabled;
    bool jsonEnabled;
    bool tlsEnabled;
    std::string root;
    bool proxyToClientEnabled;
    bool mapReportingEnabled;

    MqttSettings() : enabled(false), encryptionEnabled(false), jsonEnabled(false),
                     tlsEnabled(false), root(DEFAULT_MQTT_ROOT), proxyToClientEnabled(true),
                     mapReportingEnabled(false) {}

    /**
     * Compare the fields a user can change. root, json and map reporting
     * are not part of the comparison.
     */
    bool sameUserFields(const MqttSettings& other) const {
        return enabled == other.enabled &&
               address == other.address &&
               username == other.username &&
               password == other.password &&
               encryptionEnabled == other.encryptionEnabled &&
               tlsEnabled == other.tlsEnabled &&
               proxyToClientEnabled == other.proxyToClientEnabled;
    }
};

// Device configuration sections, one struct each

struct DeviceSection {
    std::string role;
    bool serialEnabled;
    uint32_t buttonGpio;
    uint32_t buzzerGpio;
    std::string rebroadcastMode;
    uint32_t nodeInfoBroadcastSecs;
    bool doubleTapAsButtonPress;
    std::string tzdef;

    DeviceSection() : serialEnabled(false), buttonGpio(0), buzzerGpio(0),
                      nodeInfoBroadcastSecs(0), doubleTapAsButtonPress(false) {}
};

struct PositionSection {
    uint32_t positionBroadcastSecs;
    bool smartBroadcastEnabled;
    bool fixedPosition;
    uint32_t gpsUpdateInterval;
    uint32_t gpsAttemptTime;
    uint32_t positionFlags;

    PositionSection() : positionBroadcastSecs(0), smartBroadcastEnabled(false),
                        fixedPosition(false), gpsUpdateInterval(0), gpsAttemptTime(0),
                        positionFlags(0) {}
};

struct PowerSection {
    bool isPowerSaving;
    uint32_t onBatteryShutdownAfterSecs;
    float adcMultiplierOverride;
    uint32_t waitBluetoothSecs;
    uint32_t sdsSecs;
    uint32_t lsSecs;
    uint32_t minWakeSecs;

    PowerSection() : isPowerSaving(false), onBatteryShutdownAfterSecs(0),
                     adcMultiplierOverride(0), waitBluetoothSecs(0), sdsSecs(0),
                     lsSecs(0), minWakeSecs(0) {}
};

struct NetworkSection {
    bool wifiEnabled;
    std::string wifiSsid;
    std::string ntpServer;
    bool ethEnabled;

    NetworkSection() : wifiEnabled(false), ethEnabled(false) {}
};

struct DisplaySection {
    uint32_t screenOnSecs;
    std::string gpsFormat;
    uint32_t autoScreenCarouselSecs;
    bool compassNorthTop;
    bool flipScreen;
    std::string units;
    std::string oled;

    DisplaySection() : screenOnSecs(0), autoScreenCarouselSecs(0),
                       compassNorthTop(false), flipScreen(false) {}
};

struct LoraSection {
    bool usePreset;
    std::string modemPreset;
    uint32_t bandwidth;
    uint32_t spreadFactor;
    uint32_t codingRate;
    float frequencyOffset;
    std::string region;
    uint32_t hopLimit;
    bool txEnabled;
    int32_t txPower;
    uint32_t channelNum;
    bool overrideDutyCycle;
    bool ignoreMqtt;
    bool configOkToMqtt;

    LoraSection() : usePreset(false), bandwidth(0), spreadFactor(0), codingRate(0),
                    frequencyOffset(0), hopLimit(0), txEnabled(false), txPower(0),
                    channelNum(0), overrideDutyCycle(false), ignoreMqtt(false),
                    configOkToMqtt(false) {}
};

struct BluetoothSection {
    bool enabled;
    std::string mode;
    uint32_t fixedPin;

    BluetoothSection() : enabled(false), fixedPin(0) {}
};

enum ConfigSectionKind {
    SECTION_DEVICE = 0,
    SECTION_POSITION,
    SECTION_POWER,
    SECTION_NETWORK,
    SECTION_DISPLAY,
    SECTION_LORA,
    SECTION_BLUETOOTH,
    CONFIG_SECTION_COUNT
};

/**
 * One device-reported config section. Only the member selected by kind is
 * meaningful.
 */
struct ConfigSection {
    ConfigSectionKind kind;
    DeviceSection device;
    PositionSection position;
    PowerSection power;
    NetworkSection network;
    DisplaySection display;
    LoraSection lora;
    BluetoothSection bluetooth;

    ConfigSection() : kind(SECTION_DEVICE) {}
};

// Last known device configuration, one flag per received section
struct DeviceConfig {
    bool has[CONFIG_SECTION_COUNT];
    DeviceSection device;
    PositionSection position;
    PowerSection power;
    NetworkSection network;
    DisplaySection display;
    LoraSection lora;
    BluetoothSection bluetooth;

    DeviceConfig() {
        for (int i = 0; i < CONFIG_SECTION_COUNT; i++) has[i] = false;
    }
};

struct DeviceMetadata {
    std::string firmwareVersion;
    uint32_t deviceStateVersion;
    bool canShutdown;
    bool hasWifi;
    bool hasBluetooth;
    bool hasEthernet;
    std::string role;
    uint32_t positionFlags;
    std::string hwModel;
    bool hasRemoteHardware;

    DeviceMetadata() : deviceStateVersion(0), canShutdown(false), hasWifi(false),
                       hasBluetooth(false), hasEthernet(false), positionFlags(0),
                       hasRemoteHardware(false) {}
};

// Relay payload passed between the device and an MQTT broker
struct MqttProxyFrame {
    std::string topic;
    bool isText;
    std::vector<uint8_t> data;
    std::string text;
    bool retained;

    MqttProxyFrame() : isText(false), retained(false) {}
};

// Client-side preferences, persisted by the message store
struct ClientPrefs {
    std::string userName;
    std::string userPhone;
    bool gpsEnabled;
    std::string lastDeviceId;
    std::string lastDeviceName;
    int64_t lastDeviceSavedAt;
    bool hasMqtt;
    MqttSettings mqtt;

    ClientPrefs() : gpsEnabled(false), lastDeviceSavedAt(0), hasMqtt(false) {}
};

const char* radioStatusName(RadioStatus status);
const char* mqttStatusName(MqttStatus status);
const char* channelRoleName(ChannelRole role);
const char* messageTypeName(MessageType type);
const char* configSectionName(ConfigSectionKind kind);
const char* syncStateName(SyncState state);

bool parseRadioStatus(const std::string& text, RadioStatus* status);
bool parseMqttStatus(const std::string& text, MqttStatus* status);
bool parseMessageType(const std::string& text, MessageType* type);

#endif // MESH_TYPES_H
