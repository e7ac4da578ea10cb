/**
 * channel_manager.cpp - Channel slot management and channel links
 * 
 */

#include "channel_manager.h"

#include <cstdio>
#include <cstring>

#include "base64.h"
#include "mesh_log.h"

#define TAG "Channels"

ChannelManager::ChannelManager(MeshCodec& codec, FrameWriter& writer, NodeDb& nodes,
                               ChannelTable& table, RandomSource& rng, MeshClock& clock,
                               const ErrorSink& onError)
    : _codec(codec), _writer(writer), _nodes(nodes), _table(table), _rng(rng), _clock(clock),
      _onError(onError), _nextWriteAt(0) {
}

void ChannelManager::dispatch(const MeshError& err) {
    MESH_LOGE(TAG, "%s in %s: %s", meshErrorKindName(err.kind), err.section.c_str(), err.message.c_str());
    if (_onError) {
        _onError(err);
    }
}

bool ChannelManager::writeChannel(const Channel& channel, const char* what) {
    if (!_nodes.hasMyNodeNum()) {
        dispatch(MeshError(ERR_VALIDATION, "Channel", "local node number not known yet"));
        return false;
    }

    AdminPayload payload;
    MeshError err;
    if (!MeshAdmin::buildSetChannel(channel, &payload, &err)) {
        dispatch(err);
        return false;
    }

    uint32_t self = _nodes.myNodeNum();
    EncodedFrame frame;
    if (!_codec.encodeAdminMessage(payload.bytes, payload.len, self, self, &frame, &err) ||
        !_writer.write(frame, what, &err)) {
        _table.markFailed(channel.index);
        dispatch(err);
        return false;
    }

    _table.applyOptimistic(channel, _clock.getMillis());
    MESH_LOGI(TAG, "channel %u '%s' written (%s)", channel.index, channel.name.c_str(),
              channelRoleName(channel.role));
    return true;
}

bool ChannelManager::setChannel(uint8_t index, const std::string& name,
                                const std::vector<uint8_t>& psk, ChannelRole role) {
    if (index >= MAX_CHANNELS) {
        dispatch(MeshError(ERR_VALIDATION, "Channel", "channel index out of range"));
        return false;
    }
    if (index == 0 && role != CHANNEL_PRIMARY) {
        dispatch(MeshError(ERR_CONFIG_CONFLICT, "Channel", "primary channel cannot be disabled or demoted"));
        return false;
    }
    if (index != 0 && role == CHANNEL_PRIMARY) {
        dispatch(MeshError(ERR_CONFIG_CONFLICT, "Channel", "only slot 0 can be primary"));
        return false;
    }

    Channel ch;
    Channel current;
    if (role != CHANNEL_DISABLED && _table.get(index, &current) && current.role != CHANNEL_DISABLED) {
        ch.uplinkEnabled = current.uplinkEnabled;
        ch.downlinkEnabled = current.downlinkEnabled;
        ch.positionPrecision = current.positionPrecision;
    }
    ch.index = index;
    ch.name = name;
    ch.psk = psk;
    ch.role = role;
    return writeChannel(ch, "channel");
}

int ChannelManager::addChannelFromQR(const std::string& name, const std::vector<uint8_t>& psk,
                                     bool uplinkEnabled, bool downlinkEnabled,
                                     const std::vector<Channel>& existing) {
    bool occupied[MAX_CHANNELS] = { false };
    for (size_t i = 0; i < existing.size(); i++) {
        if (existing[i].index < MAX_CHANNELS && existing[i].role != CHANNEL_DISABLED) {
            occupied[existing[i].index] = true;
        }
    }

    int target = -1;
    for (int i = 1; i < MAX_CHANNELS; i++) {
        if (!occupied[i]) {
            target = i;
            break;
        }
    }
    if (target < 0) {
        dispatch(MeshError(ERR_CONFIG_CONFLICT, "Channel", "no available channel slot"));
        return -1;
    }
    MESH_LOGD(TAG, "adding '%s' in slot %d", name.c_str(), target);

    Channel ch;
    ch.index = (uint8_t)target;
    ch.name = name;
    ch.psk = psk;
    ch.role = CHANNEL_SECONDARY;
    ch.uplinkEnabled = uplinkEnabled;
    ch.downlinkEnabled = downlinkEnabled;
    return writeChannel(ch, "channel") ? target : -1;
}

int ChannelManager::addChannelFromQR(const std::string& name, const std::vector<uint8_t>& psk,
                                     bool uplinkEnabled, bool downlinkEnabled) {
    return addChannelFromQR(name, psk, uplinkEnabled, downlinkEnabled, _table.effective());
}

bool ChannelManager::deleteChannel(uint8_t index) {
    if (index == 0) {
        dispatch(MeshError(ERR_CONFIG_CONFLICT, "Channel", "cannot delete primary channel"));
        return false;
    }
    return setChannel(index, "", std::vector<uint8_t>(), CHANNEL_DISABLED);
}

bool ChannelManager::updateChannelSettings(const Channel& channel, bool uplinkEnabled,
                                           bool downlinkEnabled, uint32_t positionPrecision) {
    Channel ch = channel;
    ch.uplinkEnabled = uplinkEnabled;
    ch.downlinkEnabled = downlinkEnabled;
    ch.positionPrecision = positionPrecision;
    MESH_LOGD(TAG, "channel %u settings: uplink=%d downlink=%d precision=%u", ch.index,
              uplinkEnabled, downlinkEnabled, positionPrecision);
    return writeChannel(ch, "channel settings");
}

bool ChannelManager::needsSettingsFix(const Channel& channel) {
    return !channel.uplinkEnabled || !channel.downlinkEnabled ||
           channel.positionPrecision < FULL_POSITION_PRECISION;
}

size_t ChannelManager::ensureChannelSettings(const std::vector<Channel>& channels) {
    size_t queued = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t i = 0; i < channels.size(); i++) {
            const Channel& ch = channels[i];
            if (ch.role == CHANNEL_DISABLED) {
                continue;
            }
            if (!needsSettingsFix(ch)) {
                MESH_LOGD(TAG, "channel %u settings OK", ch.index);
                continue;
            }
            bool alreadyQueued = false;
            for (size_t q = 0; q < _queue.size(); q++) {
                if (_queue[q].channel.index == ch.index) {
                    _queue[q].channel = ch;
                    alreadyQueued = true;
                }
            }
            if (!alreadyQueued) {
                QueuedUpdate update;
                update.channel = ch;
                _queue.push_back(update);
                queued++;
            }
        }
    }
    if (queued > 0) {
        MESH_LOGI(TAG, "%u channel(s) need relay/precision settings", (unsigned)queued);
        pumpQueue(_clock.getMillis());
    }
    return queued;
}

size_t ChannelManager::queuedWrites() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
}

void ChannelManager::pumpQueue(unsigned long now) {
    Channel next;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_queue.empty() || !millisHasPassed(now, _nextWriteAt)) {
            return;
        }
        next = _queue.front().channel;
        _queue.pop_front();
        _nextWriteAt = now + CHANNEL_WRITE_GAP_MILLIS;
    }
    if (!updateChannelSettings(next, true, true, FULL_POSITION_PRECISION)) {
        MESH_LOGW(TAG, "channel %u settings update failed", next.index);
    }
}

bool ChannelManager::generatePsk(size_t length, std::vector<uint8_t>& out) {
    if (length != 16 && length != 32) {
        dispatch(MeshError(ERR_VALIDATION, "PSK", "key length must be 16 or 32 bytes"));
        return false;
    }
    out.assign(length, 0);
    if (!_rng.random(&out[0], length)) {
        out.clear();
        dispatch(MeshError(ERR_VALIDATION, "PSK", "random source failed"));
        return false;
    }
    return true;
}

bool ChannelManager::getChannelUrl(const Channel& channel, std::string* url) {
    std::vector<uint8_t> set;
    MeshError err;
    if (!MeshAdmin::encodeChannelSet(channel, set, &err)) {
        dispatch(err);
        return false;
    }
    *url = std::string(CHANNEL_URL_PREFIX) + Base64::encodeUrl(set.empty() ? nullptr : &set[0], set.size());
    return true;
}

bool ChannelManager::parseChannelUrl(const std::string& url, Channel* out) {
    size_t marker = url.find(CHANNEL_URL_MARKER);
    if (marker == std::string::npos) {
        dispatch(MeshError(ERR_DECODE, "ChannelSet", "not a channel link"));
        return false;
    }
    std::string payload = url.substr(marker + strlen(CHANNEL_URL_MARKER));

    std::vector<uint8_t> bytes;
    if (payload.empty() || !Base64::decodeUrl(payload, bytes)) {
        dispatch(MeshError(ERR_DECODE, "ChannelSet", "bad base64 in channel link"));
        return false;
    }

    MeshError err;
    if (!MeshAdmin::decodeChannelSet(&bytes[0], bytes.size(), out, &err)) {
        dispatch(err);
        return false;
    }
    return true;
}

void ChannelManager::onChannel(const Channel& channel) {
    _table.applySnapshot(channel);
}

void ChannelManager::loop() {
    unsigned long now = _clock.getMillis();
    std::vector<uint8_t> expired = _table.expireOverlays(now, OVERLAY_CONFIRM_MILLIS);
    for (size_t i = 0; i < expired.size(); i++) {
        char msg[48];
        snprintf(msg, sizeof(msg), "channel %u write not confirmed", expired[i]);
        dispatch(MeshError(ERR_TRANSPORT, "Channel", msg));
    }
    pumpQueue(now);
}
