/**
 * delivery_tracker.h - Dual-track delivery state of outgoing messages
 * 
 * Every outgoing message has two independent tracks:
 * 
 *   radio:  pending -> sent -> delivered
 *           pending|sent -> failed
 *   mqtt:   not_applicable (fixed at creation: direct message, or no
 *           uplink on the channel)
 *           pending -> sent | failed
 * 
 * "sent" on the radio track means handed to the transport, not confirmed.
 * A routing ACK from the device promotes it to delivered. If the hand-off
 * fails the MQTT track fails with it, since the packet never reached the
 * bridge.
 * 
 * At most MAX_IN_FLIGHT_PACKETS packets are held in memory. When a new send
 * exceeds that, the oldest is dropped; its row stays in the store, where a
 * late ACK still finds it.
 * 
 * The tracker is the only writer of status fields. Persistence and the
 * terminal-state rules live in MessageStore; the tracker decides which
 * transition an event means and notifies the listener with the stored row.
 */

#ifndef DELIVERY_TRACKER_H
#define DELIVERY_TRACKER_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "mesh_config.h"
#include "mesh_types.h"
#include "message_store.h"

// Called with the stored row after each status change
typedef std::function<void(const Message& message)> StatusListener;

class DeliveryTracker {
public:
    explicit DeliveryTracker(MessageStore& store);

    void setListener(const StatusListener& listener);

    /**
     * Record a new outgoing message as pending on both tracks and persist
     * it before anything is transmitted.
     * 
     * @param message Outgoing message with packet id set; status fields are
     *                overwritten
     * @param mqttUplink Whether the destination channel uplinks to MQTT
     * @return result of the store insert
     */
    AddResult beginOutgoing(Message& message, bool mqttUplink);

    /**
     * Outcome of handing the frame to the transport
     */
    void onTransportResult(uint32_t packetId, bool ok);

    /**
     * Routing response from the device for one of our packets.
     * @return false if the packet id is not a tracked message
     */
    bool onAck(uint32_t packetId, bool success);

    /**
     * Outcome of relaying the packet to the MQTT broker
     */
    void onMqttRelay(uint32_t packetId, bool ok);

    /** Whether a radio outcome is still expected for this packet */
    bool isTracking(uint32_t packetId) const;
    size_t inFlight() const;

    /**
     * User-facing status of a stored message. Rows persisted before dual
     * tracking render their recorded status; outgoing rows with nothing
     * recorded render as "sent", incoming rows as "".
     */
    static std::string displayStatus(const Message& message);

    /**
     * Single status for a pair of tracks
     */
    static const char* deriveStatus(RadioStatus radio, MqttStatus mqtt);

private:
    MessageStore& _store;
    StatusListener _listener;

    struct InFlight {
        std::string messageId;
        uint32_t seq;           // send order, for eviction
    };

    mutable std::mutex _mutex;
    std::map<uint32_t, InFlight> _inFlight;   // by packet id
    uint32_t _nextSeq;

    void evictOldest();

    void notify(uint32_t packetId);
    void settle(uint32_t packetId);
};

#endif // DELIVERY_TRACKER_H
