/**
 * channel_manager.h - Channel slot management and channel links
 * 
 * Writes channel descriptors to the device through set_channel admin
 * messages and keeps the ChannelTable overlay in step. Slot 0 is the
 * primary channel: it is never disabled or deleted, and no other slot may
 * take the primary role.
 * 
 * ensureChannelSettings() queues one write per channel that does not relay
 * both ways with full position precision. Queued writes go out one at a
 * time, CHANNEL_WRITE_GAP_MILLIS apart, driven by loop().
 */

#ifndef CHANNEL_MANAGER_H
#define CHANNEL_MANAGER_H

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "mesh_config.h"
#include "mesh_types.h"
#include "mesh_errors.h"
#include "mesh_clock.h"
#include "mesh_codec.h"
#include "mesh_admin.h"
#include "random_source.h"
#include "frame_writer.h"
#include "node_db.h"
#include "channel_table.h"

class ChannelManager {
public:
    ChannelManager(MeshCodec& codec, FrameWriter& writer, NodeDb& nodes, ChannelTable& table,
                   RandomSource& rng, MeshClock& clock, const ErrorSink& onError);

    /**
     * Write a channel. Relay flags and precision of an active slot are kept.
     * 
     * @param index Slot 0..7
     * @param name Channel name, at most 11 bytes
     * @param psk Key, empty for an unencrypted channel
     * @param role Primary for slot 0 only, disabled for deletion
     * @return true if the device accepted the write
     */
    bool setChannel(uint8_t index, const std::string& name, const std::vector<uint8_t>& psk,
                    ChannelRole role);

    /**
     * Place a channel from a shared link in the first free secondary slot.
     * A slot is free if it is unknown or disabled.
     * 
     * @param existing Current channel list
     * @return slot index, or -1 (no free slot: ERR_CONFIG_CONFLICT, nothing
     *         written)
     */
    int addChannelFromQR(const std::string& name, const std::vector<uint8_t>& psk,
                         bool uplinkEnabled, bool downlinkEnabled,
                         const std::vector<Channel>& existing);

    /** Same, against the channel table */
    int addChannelFromQR(const std::string& name, const std::vector<uint8_t>& psk,
                         bool uplinkEnabled, bool downlinkEnabled);

    /**
     * Disable a secondary channel. Slot 0 fails with ERR_CONFIG_CONFLICT
     * and writes nothing.
     */
    bool deleteChannel(uint8_t index);

    /**
     * Rewrite relay flags and position precision, keeping name, role and key
     */
    bool updateChannelSettings(const Channel& channel, bool uplinkEnabled, bool downlinkEnabled,
                               uint32_t positionPrecision);

    /**
     * Queue a settings fix for every active channel that does not relay
     * both ways with precision >= FULL_POSITION_PRECISION.
     * 
     * @return number of writes queued
     */
    size_t ensureChannelSettings(const std::vector<Channel>& channels);

    size_t queuedWrites() const;

    /**
     * Random channel key.
     * 
     * @param length 16 (AES-128) or 32 (AES-256)
     * @param out Output: key bytes
     * @return false on an unsupported length or RNG failure
     */
    bool generatePsk(size_t length, std::vector<uint8_t>& out);

    /**
     * Share link for a channel: CHANNEL_URL_PREFIX + unpadded base64url of
     * a single-entry ChannelSet
     */
    bool getChannelUrl(const Channel& channel, std::string* url);

    /**
     * Parse a share link back into a channel descriptor (name, key, relay
     * flags). Accepts the link with or without scheme.
     */
    bool parseChannelUrl(const std::string& url, Channel* out);

    /** Device-reported channel from the config replay */
    void onChannel(const Channel& channel);

    /**
     * Send the next queued settings write when due, expire unconfirmed
     * overlays
     */
    void loop();

    ChannelTable& table() { return _table; }

private:
    struct QueuedUpdate {
        Channel channel;
    };

    MeshCodec& _codec;
    FrameWriter& _writer;
    NodeDb& _nodes;
    ChannelTable& _table;
    RandomSource& _rng;
    MeshClock& _clock;
    ErrorSink _onError;

    mutable std::mutex _mutex;
    std::deque<QueuedUpdate> _queue;
    unsigned long _nextWriteAt;

    bool writeChannel(const Channel& channel, const char* what);
    void dispatch(const MeshError& err);
    void pumpQueue(unsigned long now);

    static bool needsSettingsFix(const Channel& channel);
};

#endif // CHANNEL_MANAGER_H
