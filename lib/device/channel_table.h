/**
 * channel_table.h - Channel slots with optimistic overlays
 * 
 * Holds the last device-confirmed descriptor for each of the 8 slots, plus a
 * pending overlay for slots written but not yet echoed back. Readers see the
 * overlay when one exists.
 * 
 * An overlay is dropped when a device snapshot matches it (confirmed) or when
 * it outlives the confirmation window with only mismatching snapshots
 * (failed). A mismatching snapshot alone does not drop it, since the device
 * may still be replaying config captured before the write.
 */

#ifndef CHANNEL_TABLE_H
#define CHANNEL_TABLE_H

#include <cstdint>
#include <mutex>
#include <vector>

#include "mesh_config.h"
#include "mesh_types.h"

class ChannelTable {
public:
    ChannelTable();

    /**
     * Apply a device-reported descriptor.
     * @return true if it confirmed a pending overlay
     */
    bool applySnapshot(const Channel& channel);

    /**
     * Record an optimistic write
     * @param now Monotonic millis of the write
     */
    void applyOptimistic(const Channel& channel, unsigned long now);

    /** A write to this slot never reached the device */
    void markFailed(uint8_t index);

    /**
     * Drop overlays older than ttl. Their slots become SYNC_FAILED.
     * @return indices that expired
     */
    std::vector<uint8_t> expireOverlays(unsigned long now, unsigned long ttl);

    /** Effective descriptor (overlay over confirmed) */
    bool get(uint8_t index, Channel* out) const;

    /** Device-confirmed descriptor only */
    bool getConfirmed(uint8_t index, Channel* out) const;

    /** Every known slot, effective view, ascending index */
    std::vector<Channel> effective() const;

    SyncState syncState(uint8_t index) const;
    bool hasPending(uint8_t index) const;

    /** Whether messages on this channel are expected to be uplinked to MQTT */
    bool uplinkEnabled(uint8_t index) const;

    void clear();

    static bool sameDescriptor(const Channel& a, const Channel& b);

private:
    struct Slot {
        bool confirmed;
        Channel device;
        bool pending;
        Channel overlay;
        unsigned long writtenAt;
        bool failed;

        Slot() : confirmed(false), pending(false), writtenAt(0), failed(false) {}
    };

    mutable std::mutex _mutex;
    Slot _slots[MAX_CHANNELS];
};

#endif // CHANNEL_TABLE_H
