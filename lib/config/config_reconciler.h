/**
 * config_reconciler.h - Converges device configuration with minimal writes
 * 
 * Every admin write costs a round trip and may restart the device, so each
 * setter first compares the desired state with the last device-reported
 * state and skips the write when nothing changed (unless forced).
 * 
 * Owner writes are optimistic: the new names are visible through
 * getOwner() at once and are confirmed or failed when the device echoes
 * its node info (or the confirmation window passes).
 * 
 * MQTT writes run a settle sequence because applying them can restart the
 * device's network stack:
 * 
 *   stopPolling -> write -> 3000 ms -> connected? ----------------> startPolling, Synced
 *                                          \-> no -> 2000 ms -> connected? -> startPolling, Synced
 *                                                                   \-> no -> Failed, polling owed
 * 
 * Delays are advanced by loop(); nothing here sleeps.
 */

#ifndef CONFIG_RECONCILER_H
#define CONFIG_RECONCILER_H

#include <cstdint>
#include <mutex>
#include <string>

#include "mesh_config.h"
#include "mesh_types.h"
#include "mesh_errors.h"
#include "mesh_clock.h"
#include "mesh_codec.h"
#include "mesh_admin.h"
#include "frame_writer.h"
#include "node_db.h"

class ConfigReconciler {
public:
    ConfigReconciler(MeshCodec& codec, FrameWriter& writer, NodeDb& nodes,
                     MeshClock& clock, const ErrorSink& onError);

    /**
     * Write the owner names unless the device already reports them.
     * 
     * @param longName Long name
     * @param shortName Short name, cut to 4 bytes on a character boundary
     * @param force Write even if unchanged
     * @return true if written or already matching
     */
    bool setOwner(const std::string& longName, const std::string& shortName, bool force);

    /**
     * Write the MQTT module config unless the device already reports the
     * same user-visible fields. Returns once the write is on the wire; the
     * settle sequence continues in loop().
     * 
     * @return true if written or already matching
     */
    bool setMqttConfig(const MqttSettings& settings, bool force);

    /**
     * Initials of the leading words, or the start of a single-word name,
     * uppercased. The result fits SHORT_NAME_MAX_LEN bytes with whole
     * UTF-8 sequences, so normalizeShortName() leaves it unchanged.
     */
    static std::string generateShortName(const std::string& longName);

    /**
     * Cut to at most SHORT_NAME_MAX_LEN bytes without splitting a UTF-8
     * sequence
     */
    static std::string normalizeShortName(const std::string& shortName);

    // Device-reported state from the config replay and node info packets
    void onNodeInfo(const NodeInfo& node);
    void onConfig(const ConfigSection& section);
    void onMqttConfig(const MqttSettings& settings);
    void onMetadata(const DeviceMetadata& metadata);

    /**
     * Advance the MQTT settle sequence and expire unconfirmed owner writes
     */
    void loop();

    /** Effective owner names (pending write over device report) */
    bool getOwner(std::string* longName, std::string* shortName) const;

    /** Last device-reported MQTT settings */
    bool getMqttConfig(MqttSettings* out) const;
    DeviceConfig getDeviceConfig() const;
    bool getMetadata(DeviceMetadata* out) const;

    SyncState ownerState() const;
    SyncState mqttState() const;
    SyncState sectionState(ConfigSectionKind kind) const;

    bool mqttWriteInProgress() const;

    /**
     * Polling was stopped for an MQTT write and the device never came back.
     * The owner of the transport must call resumePolling() after
     * reconnecting.
     */
    bool pollingResumeOwed() const;

    /**
     * Restart polling if the device is connected again.
     * @return true if polling was resumed
     */
    bool resumePolling();

    /**
     * Forget all device state (new connection, device reboot). An MQTT
     * settle in progress is abandoned: polling restarts at once if the
     * device is connected, otherwise the resume is owed. A resume already
     * owed stays owed.
     */
    void reset();

private:
    enum MqttPhase {
        MQTT_IDLE,
        MQTT_SETTLING,        // first settle delay
        MQTT_EXTRA_SETTLE     // device was disconnected after the first delay
    };

    MeshCodec& _codec;
    FrameWriter& _writer;
    NodeDb& _nodes;
    MeshClock& _clock;
    ErrorSink _onError;

    mutable std::mutex _mutex;

    // Owner
    SyncState _ownerState;
    bool _ownerPending;
    std::string _pendingLong;
    std::string _pendingShort;
    unsigned long _ownerWrittenAt;

    // MQTT
    SyncState _mqttState;
    bool _hasMqtt;
    MqttSettings _mqtt;
    MqttSettings _mqttDesired;
    MqttPhase _mqttPhase;
    unsigned long _mqttDeadline;
    bool _pollingOwed;

    // Config sections and metadata
    DeviceConfig _config;
    bool _hasMetadata;
    DeviceMetadata _metadata;

    bool ownerMatches(const std::string& longName, const std::string& shortName) const;
    bool sendAdmin(const AdminPayload& payload, const char* what, MeshError* err);
    void finishMqttWrite(bool connected);
    void dispatch(const MeshError& err);
};

#endif // CONFIG_RECONCILER_H
