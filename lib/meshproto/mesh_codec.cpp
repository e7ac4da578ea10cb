/**
 * mesh_codec.cpp - ToRadio/FromRadio envelope codec implementation
 * 
 */

#include "mesh_codec.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <memory>

#include <pb_encode.h>
#include <pb_decode.h>

#include "meshtastic/mesh.pb.h"
#include "meshtastic/mqtt.pb.h"
#include "meshtastic/portnums.pb.h"

#include "base64.h"
#include "mesh_enums.h"
#include "mesh_log.h"

#define TAG "Codec"

static void setError(MeshError* err, MeshErrorKind kind, const char* section, const std::string& message) {
    if (err != nullptr) {
        *err = MeshError(kind, section, message);
    }
}

// Copies a std::string into a nanopb char array, failing if it does not fit
static bool copyString(char* dst, size_t dstSize, const std::string& src) {
    if (src.size() + 1 > dstSize) {
        return false;
    }
    memcpy(dst, src.c_str(), src.size() + 1);
    return true;
}

static bool encodeToRadio(const meshtastic_ToRadio& toRadio, EncodedFrame* out, MeshError* err) {
    pb_ostream_t stream = pb_ostream_from_buffer(out->bytes, sizeof(out->bytes));
    if (!pb_encode(&stream, meshtastic_ToRadio_fields, &toRadio)) {
        setError(err, ERR_VALIDATION, "ToRadio", PB_GET_ERROR(&stream));
        return false;
    }
    out->len = stream.bytes_written;
    return true;
}

std::string EncodedFrame::toBase64() const {
    return Base64::encodeToString(bytes, len);
}

MeshCodec::MeshCodec(RandomSource& rng, MeshClock& clock)
    : _rng(rng), _clock(clock) {
}

int32_t MeshCodec::toFixedPoint(double degrees) {
    return (int32_t)std::lround(degrees * 1e7);
}

bool MeshCodec::nextPacketId(uint32_t* id, MeshError* err) {
    // 0 means "no id" on the wire, draw again
    for (int attempt = 0; attempt < 4; attempt++) {
        uint32_t candidate = _rng.nextUInt32();
        if (candidate != 0) {
            *id = candidate;
            return true;
        }
    }
    setError(err, ERR_VALIDATION, "PacketId", "random source unavailable");
    return false;
}

/* ---------------------------------- Encoders ------------------------------------- */

bool MeshCodec::encodeTextMessage(const std::string& text, uint32_t to, uint32_t from,
                                  uint32_t channel, bool wantAck,
                                  EncodedFrame* out, MeshError* err) {
    if (out == nullptr) {
        return false;
    }

    meshtastic_MeshPacket packet = meshtastic_MeshPacket_init_default;
    if (text.size() > sizeof(packet.decoded.payload.bytes)) {
        setError(err, ERR_VALIDATION, "Data", "text longer than a single packet payload");
        return false;
    }

    uint32_t packetId;
    if (!nextPacketId(&packetId, err)) {
        return false;
    }

    packet.from = from;
    packet.to = to;
    packet.channel = channel;
    packet.id = packetId;
    packet.want_ack = wantAck;
    packet.which_payload_variant = meshtastic_MeshPacket_decoded_tag;
    packet.decoded.portnum = meshtastic_PortNum_TEXT_MESSAGE_APP;
    packet.decoded.payload.size = (pb_size_t)text.size();
    memcpy(packet.decoded.payload.bytes, text.data(), text.size());

    meshtastic_ToRadio toRadio = meshtastic_ToRadio_init_default;
    toRadio.which_payload_variant = meshtastic_ToRadio_packet_tag;
    toRadio.packet = packet;

    if (!encodeToRadio(toRadio, out, err)) {
        return false;
    }
    out->packetId = packetId;
    MESH_LOGD(TAG, "text packet id=%08X to=%08X ch=%u len=%u", packetId, to, channel, (unsigned)out->len);
    return true;
}

bool MeshCodec::encodePositionMessage(double latitude, double longitude,
                                      bool hasAltitude, double altitude,
                                      uint32_t to, uint32_t from, uint32_t channel, bool wantAck,
                                      EncodedFrame* out, MeshError* err) {
    if (out == nullptr) {
        return false;
    }
    if (!(latitude >= -90.0 && latitude <= 90.0) || !(longitude >= -180.0 && longitude <= 180.0)) {
        setError(err, ERR_VALIDATION, "Position", "coordinates out of range");
        return false;
    }

    meshtastic_Position position = meshtastic_Position_init_default;
    position.has_latitude_i = true;
    position.latitude_i = toFixedPoint(latitude);
    position.has_longitude_i = true;
    position.longitude_i = toFixedPoint(longitude);
    position.has_altitude = true;
    position.altitude = hasAltitude ? (int32_t)std::lround(altitude) : 0;
    position.time = _clock.getEpochSeconds();

    meshtastic_MeshPacket packet = meshtastic_MeshPacket_init_default;
    pb_ostream_t pstream = pb_ostream_from_buffer(packet.decoded.payload.bytes,
                                                  sizeof(packet.decoded.payload.bytes));
    if (!pb_encode(&pstream, meshtastic_Position_fields, &position)) {
        setError(err, ERR_VALIDATION, "Position", PB_GET_ERROR(&pstream));
        return false;
    }

    uint32_t packetId;
    if (!nextPacketId(&packetId, err)) {
        return false;
    }

    packet.from = from;
    packet.to = to;
    packet.channel = channel;
    packet.id = packetId;
    packet.want_ack = wantAck;
    packet.which_payload_variant = meshtastic_MeshPacket_decoded_tag;
    packet.decoded.portnum = meshtastic_PortNum_POSITION_APP;
    packet.decoded.payload.size = (pb_size_t)pstream.bytes_written;

    meshtastic_ToRadio toRadio = meshtastic_ToRadio_init_default;
    toRadio.which_payload_variant = meshtastic_ToRadio_packet_tag;
    toRadio.packet = packet;

    if (!encodeToRadio(toRadio, out, err)) {
        return false;
    }
    out->packetId = packetId;
    MESH_LOGD(TAG, "position packet id=%08X lat=%d lon=%d", packetId,
              position.latitude_i, position.longitude_i);
    return true;
}

bool MeshCodec::encodeConfigRequest(EncodedFrame* out, uint32_t* configId) {
    if (out == nullptr) {
        return false;
    }
    uint32_t id = _clock.getEpochSeconds();

    meshtastic_ToRadio toRadio = meshtastic_ToRadio_init_default;
    toRadio.which_payload_variant = meshtastic_ToRadio_want_config_id_tag;
    toRadio.want_config_id = id;

    if (!encodeToRadio(toRadio, out, nullptr)) {
        return false;
    }
    out->packetId = 0;
    if (configId != nullptr) {
        *configId = id;
    }
    return true;
}

bool MeshCodec::encodeAdminMessage(const uint8_t* adminPayload, size_t adminLen,
                                   uint32_t to, uint32_t from,
                                   EncodedFrame* out, MeshError* err) {
    if (out == nullptr || (adminPayload == nullptr && adminLen > 0)) {
        return false;
    }

    meshtastic_MeshPacket packet = meshtastic_MeshPacket_init_default;
    if (adminLen > sizeof(packet.decoded.payload.bytes)) {
        setError(err, ERR_VALIDATION, "AdminMessage", "admin payload too large");
        return false;
    }

    uint32_t packetId;
    if (!nextPacketId(&packetId, err)) {
        return false;
    }

    packet.from = from;
    packet.to = to;
    packet.id = packetId;
    packet.want_ack = true;
    packet.which_payload_variant = meshtastic_MeshPacket_decoded_tag;
    packet.decoded.portnum = meshtastic_PortNum_ADMIN_APP;
    packet.decoded.want_response = true;
    packet.decoded.payload.size = (pb_size_t)adminLen;
    if (adminLen > 0) {
        memcpy(packet.decoded.payload.bytes, adminPayload, adminLen);
    }

    meshtastic_ToRadio toRadio = meshtastic_ToRadio_init_default;
    toRadio.which_payload_variant = meshtastic_ToRadio_packet_tag;
    toRadio.packet = packet;

    if (!encodeToRadio(toRadio, out, err)) {
        return false;
    }
    out->packetId = packetId;
    return true;
}

bool MeshCodec::encodeMqttProxyFrame(const std::string& topic, const uint8_t* data, size_t dataLen,
                                     bool retained, EncodedFrame* out, MeshError* err) {
    if (out == nullptr || (data == nullptr && dataLen > 0)) {
        return false;
    }

    meshtastic_MqttClientProxyMessage proxy = meshtastic_MqttClientProxyMessage_init_default;
    if (!copyString(proxy.topic, sizeof(proxy.topic), topic)) {
        setError(err, ERR_VALIDATION, "MqttClientProxyMessage", "topic too long");
        return false;
    }
    if (dataLen > sizeof(proxy.data.bytes)) {
        setError(err, ERR_VALIDATION, "MqttClientProxyMessage", "payload too large");
        return false;
    }
    proxy.which_payload_variant = meshtastic_MqttClientProxyMessage_data_tag;
    proxy.data.size = (pb_size_t)dataLen;
    if (dataLen > 0) {
        memcpy(proxy.data.bytes, data, dataLen);
    }
    proxy.retained = retained;

    meshtastic_ToRadio toRadio = meshtastic_ToRadio_init_default;
    toRadio.which_payload_variant = meshtastic_ToRadio_mqtt_client_proxy_message_tag;
    toRadio.mqtt_client_proxy_message = proxy;

    if (!encodeToRadio(toRadio, out, err)) {
        return false;
    }
    out->packetId = 0;
    return true;
}

/* ---------------------------------- Decoders ------------------------------------- */

static void fillUser(const meshtastic_User& user, NodeInfo* node) {
    node->hasUser = true;
    node->userId = user.id;
    node->longName = user.long_name;
    node->shortName = user.short_name;
    node->hwModel = MeshEnums::hwModel(user.hw_model);
    node->role = MeshEnums::deviceRole(user.role);
}

static bool fillPosition(const meshtastic_Position& pos, PositionInfo* out) {
    if (!pos.has_latitude_i || !pos.has_longitude_i) {
        return false;  // position without a fix
    }
    out->latitude = pos.latitude_i / 1e7;
    out->longitude = pos.longitude_i / 1e7;
    out->hasAltitude = pos.has_altitude;
    out->altitude = pos.altitude;
    out->time = pos.time;
    return true;
}

static void fillChannel(const meshtastic_Channel& ch, Channel* out) {
    out->index = (uint8_t)ch.index;
    out->role = (ChannelRole)ch.role;
    if (ch.has_settings) {
        out->name = ch.settings.name;
        out->psk.assign(ch.settings.psk.bytes, ch.settings.psk.bytes + ch.settings.psk.size);
        out->uplinkEnabled = ch.settings.uplink_enabled;
        out->downlinkEnabled = ch.settings.downlink_enabled;
        if (ch.settings.has_module_settings) {
            out->positionPrecision = ch.settings.module_settings.position_precision;
        }
    }
    if (out->name.empty()) {
        char buf[16];
        snprintf(buf, sizeof(buf), "Channel %d", (int)ch.index);
        out->name = ch.index == 0 ? "Primary" : buf;
    }
}

static void fillConfig(const meshtastic_Config& cfg, ConfigSection* out) {
    switch (cfg.which_payload_variant) {
        case meshtastic_Config_device_tag: {
            const meshtastic_Config_DeviceConfig& d = cfg.device;
            out->kind = SECTION_DEVICE;
            out->device.role = MeshEnums::deviceRole(d.role);
            out->device.serialEnabled = d.serial_enabled;
            out->device.buttonGpio = d.button_gpio;
            out->device.buzzerGpio = d.buzzer_gpio;
            out->device.rebroadcastMode = MeshEnums::rebroadcastMode(d.rebroadcast_mode);
            out->device.nodeInfoBroadcastSecs = d.node_info_broadcast_secs;
            out->device.doubleTapAsButtonPress = d.double_tap_as_button_press;
            out->device.tzdef = d.tzdef;
            break;
        }
        case meshtastic_Config_position_tag: {
            const meshtastic_Config_PositionConfig& p = cfg.position;
            out->kind = SECTION_POSITION;
            out->position.positionBroadcastSecs = p.position_broadcast_secs;
            out->position.smartBroadcastEnabled = p.position_broadcast_smart_enabled;
            out->position.fixedPosition = p.fixed_position;
            out->position.gpsUpdateInterval = p.gps_update_interval;
            out->position.gpsAttemptTime = p.gps_attempt_time;
            out->position.positionFlags = p.position_flags;
            break;
        }
        case meshtastic_Config_power_tag: {
            const meshtastic_Config_PowerConfig& p = cfg.power;
            out->kind = SECTION_POWER;
            out->power.isPowerSaving = p.is_power_saving;
            out->power.onBatteryShutdownAfterSecs = p.on_battery_shutdown_after_secs;
            out->power.adcMultiplierOverride = p.adc_multiplier_override;
            out->power.waitBluetoothSecs = p.wait_bluetooth_secs;
            out->power.sdsSecs = p.sds_secs;
            out->power.lsSecs = p.ls_secs;
            out->power.minWakeSecs = p.min_wake_secs;
            break;
        }
        case meshtastic_Config_network_tag: {
            const meshtastic_Config_NetworkConfig& n = cfg.network;
            out->kind = SECTION_NETWORK;
            out->network.wifiEnabled = n.wifi_enabled;
            out->network.wifiSsid = n.wifi_ssid;
            out->network.ntpServer = n.ntp_server;
            out->network.ethEnabled = n.eth_enabled;
            break;
        }
        case meshtastic_Config_display_tag: {
            const meshtastic_Config_DisplayConfig& d = cfg.display;
            out->kind = SECTION_DISPLAY;
            out->display.screenOnSecs = d.screen_on_secs;
            out->display.gpsFormat = MeshEnums::gpsFormat(d.gps_format);
            out->display.autoScreenCarouselSecs = d.auto_screen_carousel_secs;
            out->display.compassNorthTop = d.compass_north_top;
            out->display.flipScreen = d.flip_screen;
            out->display.units = MeshEnums::units(d.units);
            out->display.oled = MeshEnums::oledType(d.oled);
            break;
        }
        case meshtastic_Config_lora_tag: {
            const meshtastic_Config_LoRaConfig& l = cfg.lora;
            out->kind = SECTION_LORA;
            out->lora.usePreset = l.use_preset;
            out->lora.modemPreset = MeshEnums::modemPreset(l.modem_preset);
            out->lora.bandwidth = l.bandwidth;
            out->lora.spreadFactor = l.spread_factor;
            out->lora.codingRate = l.coding_rate;
            out->lora.frequencyOffset = l.frequency_offset;
            out->lora.region = MeshEnums::region(l.region);
            out->lora.hopLimit = l.hop_limit;
            out->lora.txEnabled = l.tx_enabled;
            out->lora.txPower = l.tx_power;
            out->lora.channelNum = l.channel_num;
            out->lora.overrideDutyCycle = l.override_duty_cycle;
            out->lora.ignoreMqtt = l.ignore_mqtt;
            out->lora.configOkToMqtt = l.config_ok_to_mqtt;
            break;
        }
        case meshtastic_Config_bluetooth_tag: {
            const meshtastic_Config_BluetoothConfig& b = cfg.bluetooth;
            out->kind = SECTION_BLUETOOTH;
            out->bluetooth.enabled = b.enabled;
            out->bluetooth.mode = MeshEnums::bluetoothMode(b.mode);
            out->bluetooth.fixedPin = b.fixed_pin;
            break;
        }
    }
}

static void fillMqtt(const meshtastic_ModuleConfig_MQTTConfig& m, MqttSettings* out) {
    out->enabled = m.enabled;
    out->address = m.address;
    out->username = m.username;
    out->password = m.password;
    out->encryptionEnabled = m.encryption_enabled;
    out->jsonEnabled = m.json_enabled;
    out->tlsEnabled = m.tls_enabled;
    out->root = m.root[0] != '\0' ? m.root : DEFAULT_MQTT_ROOT;
    out->proxyToClientEnabled = m.proxy_to_client_enabled;
    out->mapReportingEnabled = m.map_reporting_enabled;
}

static void fillMetadata(const meshtastic_DeviceMetadata& md, DeviceMetadata* out) {
    out->firmwareVersion = md.firmware_version;
    out->deviceStateVersion = md.device_state_version;
    out->canShutdown = md.canShutdown;
    out->hasWifi = md.hasWifi;
    out->hasBluetooth = md.hasBluetooth;
    out->hasEthernet = md.hasEthernet;
    out->role = MeshEnums::deviceRole(md.role);
    out->positionFlags = md.position_flags;
    out->hwModel = MeshEnums::hwModel(md.hw_model);
    out->hasRemoteHardware = md.hasRemoteHardware;
}

static void fillProxy(const meshtastic_MqttClientProxyMessage& p, MqttProxyFrame* out) {
    out->topic = p.topic;
    out->retained = p.retained;
    if (p.which_payload_variant == meshtastic_MqttClientProxyMessage_text_tag) {
        out->isText = true;
        out->text = p.text;
    } else if (p.which_payload_variant == meshtastic_MqttClientProxyMessage_data_tag) {
        out->data.assign(p.data.bytes, p.data.bytes + p.data.size);
    }
}

// Dispatch a decoded mesh packet on its port number
static bool decodeMeshPacket(const meshtastic_MeshPacket& packet, InboundEvent* event, MeshError* err) {
    event->packet.id = packet.id;
    event->packet.from = packet.from;
    event->packet.to = packet.to;
    event->packet.channel = packet.channel;
    event->packet.rxTime = packet.rx_time;
    event->packet.wantAck = packet.want_ack;
    event->packet.viaMqtt = packet.via_mqtt;
    event->packet.hopStart = packet.hop_start;
    event->packet.hopLimit = packet.hop_limit;

    if (packet.which_payload_variant != meshtastic_MeshPacket_decoded_tag) {
        MESH_LOGD(TAG, "encrypted packet %08X from %08X, ignoring", packet.id, packet.from);
        event->kind = EVT_IGNORED;
        return true;
    }

    const meshtastic_Data& data = packet.decoded;
    switch (data.portnum) {
        case meshtastic_PortNum_TEXT_MESSAGE_APP:
            event->kind = EVT_TEXT;
            event->text.assign((const char*)data.payload.bytes, data.payload.size);
            return true;

        case meshtastic_PortNum_POSITION_APP: {
            meshtastic_Position position = meshtastic_Position_init_default;
            pb_istream_t stream = pb_istream_from_buffer(data.payload.bytes, data.payload.size);
            if (!pb_decode(&stream, meshtastic_Position_fields, &position)) {
                setError(err, ERR_DECODE, "Position", PB_GET_ERROR(&stream));
                return false;
            }
            event->kind = EVT_POSITION;
            event->node.nodeNum = packet.from;
            event->node.lastHeard = packet.rx_time;
            event->node.hasPosition = fillPosition(position, &event->node.position);
            return true;
        }

        case meshtastic_PortNum_NODEINFO_APP: {
            meshtastic_User user = meshtastic_User_init_default;
            pb_istream_t stream = pb_istream_from_buffer(data.payload.bytes, data.payload.size);
            if (!pb_decode(&stream, meshtastic_User_fields, &user)) {
                setError(err, ERR_DECODE, "User", PB_GET_ERROR(&stream));
                return false;
            }
            event->kind = EVT_NODE_INFO;
            event->node.nodeNum = packet.from;
            event->node.lastHeard = packet.rx_time;
            fillUser(user, &event->node);
            return true;
        }

        case meshtastic_PortNum_ROUTING_APP: {
            meshtastic_Routing routing = meshtastic_Routing_init_default;
            pb_istream_t stream = pb_istream_from_buffer(data.payload.bytes, data.payload.size);
            if (!pb_decode(&stream, meshtastic_Routing_fields, &routing)) {
                setError(err, ERR_DECODE, "Routing", PB_GET_ERROR(&stream));
                return false;
            }
            // Only error_reason answers one of our packets; route requests/replies are not ours
            if (routing.which_variant != meshtastic_Routing_error_reason_tag || data.request_id == 0) {
                event->kind = EVT_IGNORED;
                return true;
            }
            event->kind = EVT_ROUTING;
            event->requestId = data.request_id;
            event->routingError = (uint32_t)routing.error_reason;
            return true;
        }

        default:
            event->kind = EVT_DATA;
            event->portnum = (uint32_t)data.portnum;
            event->payload.assign(data.payload.bytes, data.payload.bytes + data.payload.size);
            event->requestId = data.request_id;
            return true;
    }
}

bool MeshCodec::decodeInbound(const uint8_t* bytes, size_t len, InboundEvent* event, MeshError* err) {
    if (event == nullptr || (bytes == nullptr && len > 0)) {
        setError(err, ERR_DECODE, "FromRadio", "no input");
        return false;
    }
    *event = InboundEvent();

    // FromRadio is large; keep it off the stack
    std::unique_ptr<meshtastic_FromRadio> fromRadio(new meshtastic_FromRadio());
    pb_istream_t stream = pb_istream_from_buffer(bytes, len);
    if (!pb_decode(&stream, meshtastic_FromRadio_fields, fromRadio.get())) {
        setError(err, ERR_DECODE, "FromRadio", PB_GET_ERROR(&stream));
        return false;
    }
    event->fromRadioId = fromRadio->id;

    switch (fromRadio->which_payload_variant) {
        case meshtastic_FromRadio_packet_tag:
            return decodeMeshPacket(fromRadio->packet, event, err);

        case meshtastic_FromRadio_my_info_tag:
            event->kind = EVT_MY_INFO;
            event->myNodeNum = fromRadio->my_info.my_node_num;
            return true;

        case meshtastic_FromRadio_node_info_tag: {
            const meshtastic_NodeInfo& ni = fromRadio->node_info;
            event->kind = EVT_NODE_INFO;
            event->node.nodeNum = ni.num;
            if (ni.has_user) {
                fillUser(ni.user, &event->node);
            }
            if (ni.has_position) {
                event->node.hasPosition = fillPosition(ni.position, &event->node.position);
            }
            event->node.hasSnr = true;
            event->node.snr = ni.snr;
            event->node.lastHeard = ni.last_heard;
            event->node.hopsAway = ni.hops_away;
            event->node.viaMqtt = ni.via_mqtt;
            return true;
        }

        case meshtastic_FromRadio_config_tag:
            if (fromRadio->config.which_payload_variant < meshtastic_Config_device_tag ||
                fromRadio->config.which_payload_variant > meshtastic_Config_bluetooth_tag) {
                event->kind = EVT_IGNORED;  // section this client does not track
                return true;
            }
            event->kind = EVT_CONFIG;
            fillConfig(fromRadio->config, &event->config);
            return true;

        case meshtastic_FromRadio_moduleConfig_tag:
            if (fromRadio->moduleConfig.which_payload_variant != meshtastic_ModuleConfig_mqtt_tag) {
                event->kind = EVT_IGNORED;
                return true;
            }
            event->kind = EVT_MQTT_CONFIG;
            fillMqtt(fromRadio->moduleConfig.mqtt, &event->mqtt);
            return true;

        case meshtastic_FromRadio_channel_tag:
            if (fromRadio->channel.index < 0 || fromRadio->channel.index >= MAX_CHANNELS) {
                setError(err, ERR_DECODE, "Channel", "channel index out of range");
                return false;
            }
            event->kind = EVT_CHANNEL;
            fillChannel(fromRadio->channel, &event->channel);
            return true;

        case meshtastic_FromRadio_metadata_tag:
            event->kind = EVT_METADATA;
            fillMetadata(fromRadio->metadata, &event->metadata);
            return true;

        case meshtastic_FromRadio_mqttClientProxyMessage_tag:
            event->kind = EVT_MQTT_PROXY;
            fillProxy(fromRadio->mqttClientProxyMessage, &event->proxy);
            return true;

        case meshtastic_FromRadio_config_complete_id_tag:
            event->kind = EVT_CONFIG_COMPLETE;
            event->configCompleteId = fromRadio->config_complete_id;
            return true;

        case meshtastic_FromRadio_rebooted_tag:
            event->kind = EVT_REBOOTED;
            return true;

        default:
            event->kind = EVT_IGNORED;
            return true;
    }
}

bool MeshCodec::decodeFrame(const std::string& base64, InboundEvent* event, MeshError* err) {
    uint8_t buf[FROM_RADIO_MAX_BYTES];
    size_t len = 0;
    if (!Base64::decode(base64.c_str(), buf, sizeof(buf), &len)) {
        setError(err, ERR_DECODE, "Base64Frame", "invalid base64 frame");
        return false;
    }
    return decodeInbound(buf, len, event, err);
}

bool MeshCodec::decodeServiceEnvelope(const uint8_t* bytes, size_t len,
                                      uint32_t* packetId, uint32_t* from, MeshError* err) {
    std::unique_ptr<meshtastic_ServiceEnvelope> envelope(new meshtastic_ServiceEnvelope());
    pb_istream_t stream = pb_istream_from_buffer(bytes, len);
    if (!pb_decode(&stream, meshtastic_ServiceEnvelope_fields, envelope.get())) {
        setError(err, ERR_DECODE, "ServiceEnvelope", PB_GET_ERROR(&stream));
        return false;
    }
    if (!envelope->has_packet) {
        setError(err, ERR_DECODE, "ServiceEnvelope", "no packet");
        return false;
    }
    if (packetId != nullptr) *packetId = envelope->packet.id;
    if (from != nullptr) *from = envelope->packet.from;
    return true;
}
