/**
 * mesh_admin.cpp - AdminMessage payload builders and channel-set codec
 * 
 */

#include "mesh_admin.h"

#include <cstring>

#include <pb_encode.h>
#include <pb_decode.h>

#include "meshtastic/admin.pb.h"
#include "meshtastic/apponly.pb.h"

static void setError(MeshError* err, MeshErrorKind kind, const char* section, const std::string& message) {
    if (err != nullptr) {
        *err = MeshError(kind, section, message);
    }
}

static bool copyString(char* dst, size_t dstSize, const std::string& src) {
    if (src.size() + 1 > dstSize) {
        return false;
    }
    memcpy(dst, src.c_str(), src.size() + 1);
    return true;
}

static bool encodeAdmin(const meshtastic_AdminMessage& admin, AdminPayload* out, MeshError* err) {
    pb_ostream_t stream = pb_ostream_from_buffer(out->bytes, sizeof(out->bytes));
    if (!pb_encode(&stream, meshtastic_AdminMessage_fields, &admin)) {
        setError(err, ERR_VALIDATION, "AdminMessage", PB_GET_ERROR(&stream));
        return false;
    }
    out->len = stream.bytes_written;
    return true;
}

// Fills settings from a descriptor; validates name and key sizes
static bool fillSettings(const Channel& channel, meshtastic_ChannelSettings* settings, MeshError* err) {
    if (!copyString(settings->name, sizeof(settings->name), channel.name)) {
        setError(err, ERR_VALIDATION, "ChannelSettings", "channel name longer than 11 bytes");
        return false;
    }
    if (channel.psk.size() > sizeof(settings->psk.bytes)) {
        setError(err, ERR_VALIDATION, "ChannelSettings", "psk longer than 32 bytes");
        return false;
    }
    settings->psk.size = (pb_size_t)channel.psk.size();
    if (!channel.psk.empty()) {
        memcpy(settings->psk.bytes, channel.psk.data(), channel.psk.size());
    }
    return true;
}

bool MeshAdmin::buildSetOwner(const std::string& longName, const std::string& shortName,
                              AdminPayload* out, MeshError* err) {
    meshtastic_AdminMessage admin = meshtastic_AdminMessage_init_default;
    admin.which_payload_variant = meshtastic_AdminMessage_set_owner_tag;
    if (!copyString(admin.set_owner.long_name, sizeof(admin.set_owner.long_name), longName)) {
        setError(err, ERR_VALIDATION, "User", "long name too long");
        return false;
    }
    if (!copyString(admin.set_owner.short_name, sizeof(admin.set_owner.short_name), shortName)) {
        setError(err, ERR_VALIDATION, "User", "short name too long");
        return false;
    }
    return encodeAdmin(admin, out, err);
}

bool MeshAdmin::buildSetChannel(const Channel& channel, AdminPayload* out, MeshError* err) {
    if (channel.index >= MAX_CHANNELS) {
        setError(err, ERR_VALIDATION, "Channel", "channel index out of range");
        return false;
    }

    meshtastic_AdminMessage admin = meshtastic_AdminMessage_init_default;
    admin.which_payload_variant = meshtastic_AdminMessage_set_channel_tag;
    meshtastic_Channel& ch = admin.set_channel;
    ch.index = channel.index;
    ch.role = (meshtastic_Channel_Role)channel.role;
    ch.has_settings = true;
    if (!fillSettings(channel, &ch.settings, err)) {
        return false;
    }
    ch.settings.uplink_enabled = channel.uplinkEnabled;
    ch.settings.downlink_enabled = channel.downlinkEnabled;
    if (channel.positionPrecision > 0) {
        ch.settings.has_module_settings = true;
        ch.settings.module_settings.position_precision = channel.positionPrecision;
    }
    return encodeAdmin(admin, out, err);
}

bool MeshAdmin::buildSetMqttConfig(const MqttSettings& settings, AdminPayload* out, MeshError* err) {
    meshtastic_AdminMessage admin = meshtastic_AdminMessage_init_default;
    admin.which_payload_variant = meshtastic_AdminMessage_set_module_config_tag;
    admin.set_module_config.which_payload_variant = meshtastic_ModuleConfig_mqtt_tag;
    meshtastic_ModuleConfig_MQTTConfig& mqtt = admin.set_module_config.mqtt;

    mqtt.enabled = settings.enabled;
    mqtt.encryption_enabled = settings.encryptionEnabled;
    mqtt.tls_enabled = settings.tlsEnabled;
    mqtt.proxy_to_client_enabled = settings.proxyToClientEnabled;
    const std::string& root = settings.root.empty() ? std::string(DEFAULT_MQTT_ROOT) : settings.root;
    if (!copyString(mqtt.address, sizeof(mqtt.address), settings.address) ||
        !copyString(mqtt.username, sizeof(mqtt.username), settings.username) ||
        !copyString(mqtt.password, sizeof(mqtt.password), settings.password) ||
        !copyString(mqtt.root, sizeof(mqtt.root), root)) {
        setError(err, ERR_VALIDATION, "MQTTConfig", "field too long");
        return false;
    }
    return encodeAdmin(admin, out, err);
}

bool MeshAdmin::encodeChannelSet(const Channel& channel, std::vector<uint8_t>& out, MeshError* err) {
    meshtastic_ChannelSet set = meshtastic_ChannelSet_init_default;
    set.settings_count = 1;
    if (!fillSettings(channel, &set.settings[0], err)) {
        return false;
    }

    uint8_t buf[128];
    pb_ostream_t stream = pb_ostream_from_buffer(buf, sizeof(buf));
    if (!pb_encode(&stream, meshtastic_ChannelSet_fields, &set)) {
        setError(err, ERR_VALIDATION, "ChannelSet", PB_GET_ERROR(&stream));
        return false;
    }
    out.assign(buf, buf + stream.bytes_written);
    return true;
}

bool MeshAdmin::decodeChannelSet(const uint8_t* bytes, size_t len, Channel* first, MeshError* err) {
    meshtastic_ChannelSet set = meshtastic_ChannelSet_init_default;
    pb_istream_t stream = pb_istream_from_buffer(bytes, len);
    if (!pb_decode(&stream, meshtastic_ChannelSet_fields, &set)) {
        setError(err, ERR_DECODE, "ChannelSet", PB_GET_ERROR(&stream));
        return false;
    }
    if (set.settings_count == 0) {
        setError(err, ERR_DECODE, "ChannelSet", "link carries no channel");
        return false;
    }

    const meshtastic_ChannelSettings& s = set.settings[0];
    *first = Channel();
    first->name = s.name[0] != '\0' ? s.name : "Default";
    first->psk.assign(s.psk.bytes, s.psk.bytes + s.psk.size);
    first->uplinkEnabled = s.uplink_enabled;
    first->downlinkEnabled = s.downlink_enabled;
    first->role = CHANNEL_SECONDARY;
    if (s.has_module_settings) {
        first->positionPrecision = s.module_settings.position_precision;
    }
    return true;
}
