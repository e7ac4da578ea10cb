/**
 * chat_session.h - Sequences sends and dispatches inbound device events
 * 
 * Outgoing chat messages follow one order: encode (draws the packet id),
 * persist as pending, write to the device, record the hand-off result.
 * Delivery then advances asynchronously on routing ACKs and MQTT relay
 * results.
 * 
 * Inbound frames are decoded once and routed to the component that owns
 * the affected state: node database, channel table, config reconciler,
 * delivery tracker or message store. A listener observes the results.
 */

#ifndef CHAT_SESSION_H
#define CHAT_SESSION_H

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "mesh_types.h"
#include "mesh_errors.h"
#include "mesh_clock.h"
#include "mesh_codec.h"
#include "frame_writer.h"
#include "node_db.h"
#include "message_store.h"
#include "delivery_tracker.h"
#include "config_reconciler.h"
#include "channel_manager.h"
#include "mqtt_bridge.h"

#define LOCATION_MESSAGE_TEXT  "\xF0\x9F\x93\x8D Location"

class ChatSessionListener {
public:
    virtual ~ChatSessionListener() {}

    /** A message was stored (incoming, or outgoing at send time) */
    virtual void onMessage(const Message& message) { (void)message; }
    virtual void onStatusChanged(const Message& message) { (void)message; }
    virtual void onNodeUpdated(const NodeInfo& node) { (void)node; }
    virtual void onChannelUpdated(const Channel& channel) { (void)channel; }
    virtual void onConfigComplete() {}

    /** Packet on a port meshlink does not interpret (telemetry etc.) */
    virtual void onData(const PacketHeader& packet, uint32_t portnum, const std::vector<uint8_t>& payload) {
        (void)packet; (void)portnum; (void)payload;
    }
};

class ChatSession {
public:
    ChatSession(MeshCodec& codec, FrameWriter& writer, NodeDb& nodes, MessageStore& store,
                DeliveryTracker& tracker, ConfigReconciler& config, ChannelManager& channels,
                MeshClock& clock, const ErrorSink& onError);

    void setListener(ChatSessionListener* listener);
    void setMqttBridge(MqttBridge* bridge);

    /**
     * Send a text message with want_ack.
     * 
     * @param text Message text (not blank, at most 233 bytes)
     * @param to Destination node, BROADCAST_ADDR for the channel
     * @param channel Channel index
     * @param out Output: the stored message (may be nullptr)
     * @return true if handed to the device
     */
    bool sendText(const std::string& text, uint32_t to, uint32_t channel, Message* out);

    /**
     * Send a location as a chat message. It is stored with type location
     * and tracked like a text message.
     */
    bool sendLocation(double latitude, double longitude, bool hasAltitude, double altitude,
                      uint32_t to, uint32_t channel, Message* out);

    /**
     * Give the local node a position to broadcast. Sent to the local node
     * without want_ack; nothing is stored.
     */
    bool broadcastPosition(double latitude, double longitude, bool hasAltitude, double altitude);

    /**
     * Ask the device to replay its configuration
     */
    bool requestConfig();
    bool configComplete() const;

    /**
     * Decode and dispatch one base64 FromRadio frame
     * @return false if the frame was malformed (ERR_DECODE dispatched)
     */
    bool handleInbound(const std::string& base64);

    /** Dispatch an already decoded event */
    void handleEvent(const InboundEvent& event);

    /**
     * Message from the broker for the device (downlink)
     */
    bool onBrokerMessage(const std::string& topic, const uint8_t* data, size_t len, bool retained);

    /**
     * Drive timed work: MQTT settle sequence, channel write queue, overlay
     * expiry
     */
    void loop();

    uint32_t myNodeNum() const { return _nodes.myNodeNum(); }

private:
    MeshCodec& _codec;
    FrameWriter& _writer;
    NodeDb& _nodes;
    MessageStore& _store;
    DeliveryTracker& _tracker;
    ConfigReconciler& _config;
    ChannelManager& _channels;
    MeshClock& _clock;
    ErrorSink _onError;

    mutable std::mutex _mutex;
    ChatSessionListener* _listener;
    MqttBridge* _bridge;
    uint32_t _configId;
    bool _configComplete;

    bool transmitTracked(const EncodedFrame& frame, Message& message, const char* what);
    void handleText(const InboundEvent& event);
    void handleProxy(const MqttProxyFrame& frame);
    void dispatch(const MeshError& err);
    ChatSessionListener* listener() const;
};

#endif // CHAT_SESSION_H
