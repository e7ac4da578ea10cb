/**
 * channel_table.cpp - Channel slots with optimistic overlays
 * 
 */

#include "channel_table.h"

#include "mesh_clock.h"
#include "mesh_log.h"

#define TAG "Channels"

ChannelTable::ChannelTable() {
}

bool ChannelTable::sameDescriptor(const Channel& a, const Channel& b) {
    if (a.index != b.index || a.role != b.role) {
        return false;
    }
    if (a.role == CHANNEL_DISABLED) {
        return true;  // device may keep stale name/key on a disabled slot
    }
    return a.name == b.name &&
           a.psk == b.psk &&
           a.uplinkEnabled == b.uplinkEnabled &&
           a.downlinkEnabled == b.downlinkEnabled &&
           (a.positionPrecision == 0 || b.positionPrecision == 0 ||
            a.positionPrecision == b.positionPrecision);
}

bool ChannelTable::applySnapshot(const Channel& channel) {
    if (channel.index >= MAX_CHANNELS) {
        return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    Slot& slot = _slots[channel.index];
    slot.confirmed = true;
    slot.device = channel;

    if (slot.pending && sameDescriptor(slot.overlay, channel)) {
        slot.pending = false;
        slot.failed = false;
        MESH_LOGI(TAG, "channel %u confirmed by device", channel.index);
        return true;
    }
    if (!slot.pending) {
        slot.failed = false;
    }
    return false;
}

void ChannelTable::applyOptimistic(const Channel& channel, unsigned long now) {
    if (channel.index >= MAX_CHANNELS) {
        return;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    Slot& slot = _slots[channel.index];
    slot.pending = true;
    slot.overlay = channel;
    slot.writtenAt = now;
    slot.failed = false;
}

void ChannelTable::markFailed(uint8_t index) {
    if (index >= MAX_CHANNELS) {
        return;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _slots[index].failed = true;
}

std::vector<uint8_t> ChannelTable::expireOverlays(unsigned long now, unsigned long ttl) {
    std::vector<uint8_t> expired;
    std::lock_guard<std::mutex> lock(_mutex);
    for (uint8_t i = 0; i < MAX_CHANNELS; i++) {
        Slot& slot = _slots[i];
        if (slot.pending && millisHasPassed(now, slot.writtenAt + ttl)) {
            slot.pending = false;
            slot.failed = true;
            expired.push_back(i);
            MESH_LOGW(TAG, "channel %u write not confirmed, reverting to device view", i);
        }
    }
    return expired;
}

bool ChannelTable::get(uint8_t index, Channel* out) const {
    if (index >= MAX_CHANNELS) {
        return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    const Slot& slot = _slots[index];
    if (slot.pending) {
        if (out != nullptr) *out = slot.overlay;
        return true;
    }
    if (slot.confirmed) {
        if (out != nullptr) *out = slot.device;
        return true;
    }
    return false;
}

bool ChannelTable::getConfirmed(uint8_t index, Channel* out) const {
    if (index >= MAX_CHANNELS) {
        return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_slots[index].confirmed) {
        return false;
    }
    if (out != nullptr) *out = _slots[index].device;
    return true;
}

std::vector<Channel> ChannelTable::effective() const {
    std::vector<Channel> out;
    for (uint8_t i = 0; i < MAX_CHANNELS; i++) {
        Channel ch;
        if (get(i, &ch)) {
            out.push_back(ch);
        }
    }
    return out;
}

SyncState ChannelTable::syncState(uint8_t index) const {
    if (index >= MAX_CHANNELS) {
        return SYNC_UNKNOWN;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    const Slot& slot = _slots[index];
    if (slot.pending) return SYNC_PENDING_WRITE;
    if (slot.failed) return SYNC_FAILED;
    if (slot.confirmed) return SYNC_SYNCED;
    return SYNC_UNKNOWN;
}

bool ChannelTable::hasPending(uint8_t index) const {
    return syncState(index) == SYNC_PENDING_WRITE;
}

bool ChannelTable::uplinkEnabled(uint8_t index) const {
    Channel ch;
    return get(index, &ch) && ch.role != CHANNEL_DISABLED && ch.uplinkEnabled;
}

void ChannelTable::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    for (uint8_t i = 0; i < MAX_CHANNELS; i++) {
        _slots[i] = Slot();
    }
}
