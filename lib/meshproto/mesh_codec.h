/**
 * mesh_codec.h - ToRadio/FromRadio envelope codec for meshlink
 * 
 * Maps client intents to the device's binary ToRadio envelope and parses
 * FromRadio envelopes into typed InboundEvents. Envelopes travel over the BLE
 * characteristic as standard base64 text.
 * 
 * The codec is synchronous and does no I/O. It only needs a random source
 * (packet ids) and a wall clock (position time, config request ids).
 * 
 * Encoders return false and fill a MeshError when the request cannot be
 * encoded; decoders return false with ERR_DECODE and the name of the section
 * that was malformed.
 */

#ifndef MESH_CODEC_H
#define MESH_CODEC_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "mesh_config.h"
#include "mesh_types.h"
#include "mesh_errors.h"
#include "mesh_clock.h"
#include "random_source.h"

/**
 * One serialized ToRadio envelope
 */
struct EncodedFrame {
    uint8_t bytes[TO_RADIO_MAX_BYTES];
    size_t len;
    uint32_t packetId;      // mesh packet id, 0 if the frame carries no packet

    EncodedFrame() : len(0), packetId(0) {}

    /** Standard base64 text for the BLE characteristic */
    std::string toBase64() const;
};

enum InboundKind {
    EVT_IGNORED = 0,        // valid envelope with nothing for the client
    EVT_MY_INFO,            // myNodeNum
    EVT_NODE_INFO,          // node (from the config replay or NODEINFO_APP)
    EVT_POSITION,           // node.nodeNum + node.position, from POSITION_APP
    EVT_CHANNEL,            // channel
    EVT_CONFIG,             // config
    EVT_MQTT_CONFIG,        // mqtt
    EVT_METADATA,           // metadata
    EVT_MQTT_PROXY,         // proxy
    EVT_TEXT,               // packet + text
    EVT_ROUTING,            // packet + requestId + routingError
    EVT_DATA,               // packet + portnum + payload, any other port
    EVT_CONFIG_COMPLETE,    // configCompleteId
    EVT_REBOOTED
};

// Envelope fields of a decoded mesh packet
struct PacketHeader {
    uint32_t id;
    uint32_t from;
    uint32_t to;
    uint32_t channel;
    uint32_t rxTime;        // epoch seconds, 0 if the device did not stamp it
    bool wantAck;
    bool viaMqtt;
    uint32_t hopStart;
    uint32_t hopLimit;

    PacketHeader() : id(0), from(0), to(0), channel(0), rxTime(0), wantAck(false),
                     viaMqtt(false), hopStart(0), hopLimit(0) {}
};

/**
 * Tagged result of decoding one FromRadio envelope. Only the members named
 * for the kind are filled.
 */
struct InboundEvent {
    InboundKind kind;
    uint32_t fromRadioId;

    uint32_t myNodeNum;
    NodeInfo node;
    Channel channel;
    ConfigSection config;
    MqttSettings mqtt;
    DeviceMetadata metadata;
    MqttProxyFrame proxy;

    PacketHeader packet;
    std::string text;
    uint32_t requestId;     // packet id the routing message answers
    uint32_t routingError;  // 0 = NONE, i.e. ACK
    uint32_t portnum;
    std::vector<uint8_t> payload;

    uint32_t configCompleteId;

    InboundEvent() : kind(EVT_IGNORED), fromRadioId(0), myNodeNum(0), requestId(0),
                     routingError(0), portnum(0), configCompleteId(0) {}

    bool isAck() const { return kind == EVT_ROUTING && routingError == 0; }
};

class MeshCodec {
public:
    MeshCodec(RandomSource& rng, MeshClock& clock);

    /**
     * Encode a text message on TEXT_MESSAGE_APP.
     * 
     * @param text UTF-8 text, at most 233 bytes
     * @param to Destination node, BROADCAST_ADDR for a channel message
     * @param from Local node number
     * @param channel Channel index
     * @param wantAck Request a routing ACK
     * @param out Output: envelope and its freshly drawn packet id
     * @param err Output: failure cause (may be nullptr)
     * @return true on success
     */
    bool encodeTextMessage(const std::string& text, uint32_t to, uint32_t from,
                           uint32_t channel, bool wantAck,
                           EncodedFrame* out, MeshError* err);

    /**
     * Encode a position on POSITION_APP. Coordinates are sent as degrees
     * times 1e7 rounded to the nearest integer, altitude rounded to meters
     * (0 when absent), time is now in epoch seconds.
     */
    bool encodePositionMessage(double latitude, double longitude,
                               bool hasAltitude, double altitude,
                               uint32_t to, uint32_t from, uint32_t channel, bool wantAck,
                               EncodedFrame* out, MeshError* err);

    /**
     * Ask the device to replay its full configuration.
     * 
     * @param out Output: envelope
     * @param configId Output: correlation id (epoch seconds), echoed back
     *                 in config_complete_id
     */
    bool encodeConfigRequest(EncodedFrame* out, uint32_t* configId);

    /**
     * Wrap a serialized AdminMessage in an ADMIN_APP data envelope with
     * want_response, inside a mesh packet with want_ack.
     */
    bool encodeAdminMessage(const uint8_t* adminPayload, size_t adminLen,
                            uint32_t to, uint32_t from,
                            EncodedFrame* out, MeshError* err);

    /**
     * Pass a broker message through to the device acting as MQTT bridge
     */
    bool encodeMqttProxyFrame(const std::string& topic, const uint8_t* data, size_t dataLen,
                              bool retained, EncodedFrame* out, MeshError* err);

    /**
     * Decode one FromRadio envelope.
     * 
     * @param bytes Envelope bytes
     * @param len Length of envelope
     * @param event Output: decoded event
     * @param err Output: ERR_DECODE with the failing section (may be nullptr)
     * @return true if the envelope was well formed
     */
    bool decodeInbound(const uint8_t* bytes, size_t len, InboundEvent* event, MeshError* err);

    /**
     * Decode a base64 text frame as received from the BLE characteristic
     */
    bool decodeFrame(const std::string& base64, InboundEvent* event, MeshError* err);

    /**
     * Extract the mesh packet id and sender from an MQTT ServiceEnvelope, as
     * published by the device for an uplinked packet.
     */
    static bool decodeServiceEnvelope(const uint8_t* bytes, size_t len,
                                      uint32_t* packetId, uint32_t* from, MeshError* err);

    /**
     * Degrees to the 1e7 fixed-point wire representation
     */
    static int32_t toFixedPoint(double degrees);

private:
    RandomSource& _rng;
    MeshClock& _clock;

    bool nextPacketId(uint32_t* id, MeshError* err);
};

#endif // MESH_CODEC_H
