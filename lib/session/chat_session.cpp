/**
 * chat_session.cpp - Sequences sends and dispatches inbound device events
 * 
 */

#include "chat_session.h"

#include <cstdio>

#include "mesh_enums.h"
#include "mesh_log.h"

#define TAG "Session"

static bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Application id of a radio message; an echo of our own send maps to the same id
static std::string messageId(uint32_t from, uint32_t packetId) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%u-%u", from, packetId);
    return buf;
}

ChatSession::ChatSession(MeshCodec& codec, FrameWriter& writer, NodeDb& nodes, MessageStore& store,
                         DeliveryTracker& tracker, ConfigReconciler& config, ChannelManager& channels,
                         MeshClock& clock, const ErrorSink& onError)
    : _codec(codec), _writer(writer), _nodes(nodes), _store(store), _tracker(tracker),
      _config(config), _channels(channels), _clock(clock), _onError(onError),
      _listener(nullptr), _bridge(nullptr), _configId(0), _configComplete(false) {
    _tracker.setListener([this](const Message& message) {
        ChatSessionListener* l = listener();
        if (l != nullptr) {
            l->onStatusChanged(message);
        }
    });
}

void ChatSession::setListener(ChatSessionListener* listener) {
    std::lock_guard<std::mutex> lock(_mutex);
    _listener = listener;
}

void ChatSession::setMqttBridge(MqttBridge* bridge) {
    std::lock_guard<std::mutex> lock(_mutex);
    _bridge = bridge;
}

ChatSessionListener* ChatSession::listener() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _listener;
}

void ChatSession::dispatch(const MeshError& err) {
    MESH_LOGE(TAG, "%s in %s: %s", meshErrorKindName(err.kind), err.section.c_str(), err.message.c_str());
    if (_onError) {
        _onError(err);
    }
}

/* ---------------------------------- Outbound ------------------------------------- */

bool ChatSession::transmitTracked(const EncodedFrame& frame, Message& message, const char* what) {
    // Only channel messages are uplinked; direct messages never get an MQTT track
    bool uplink = message.to == BROADCAST_ADDR && message.hasChannel &&
                  _channels.table().uplinkEnabled((uint8_t)message.channel);
    AddResult added = _tracker.beginOutgoing(message, uplink);
    if (added == ADD_FAILED) {
        return false;  // store already reported it; nothing goes on air unrecorded
    }
    if (added == ADD_INSERTED) {
        ChatSessionListener* l = listener();
        if (l != nullptr) {
            l->onMessage(message);
        }
    }

    MeshError err;
    bool ok = _writer.write(frame, what, &err);
    _tracker.onTransportResult(frame.packetId, ok);
    if (!ok) {
        dispatch(err);
        return false;
    }
    message.radioStatus = RADIO_SENT;
    message.status = DeliveryTracker::deriveStatus(message.radioStatus, message.mqttStatus);
    return true;
}

bool ChatSession::sendText(const std::string& text, uint32_t to, uint32_t channel, Message* out) {
    uint32_t self = _nodes.myNodeNum();
    if (self == 0) {
        dispatch(MeshError(ERR_VALIDATION, "Data", "local node number not known yet"));
        return false;
    }
    if (isBlank(text)) {
        dispatch(MeshError(ERR_VALIDATION, "Data", "empty message"));
        return false;
    }

    EncodedFrame frame;
    MeshError err;
    if (!_codec.encodeTextMessage(text, to, self, channel, true, &frame, &err)) {
        dispatch(err);
        return false;
    }

    Message message;
    message.id = messageId(self, frame.packetId);
    message.hasPacketId = true;
    message.packetId = frame.packetId;
    message.from = self;
    message.to = to;
    message.text = text;
    message.timestamp = _clock.getEpochMillis();
    message.hasChannel = true;
    message.channel = channel;
    message.type = MSG_TEXT;

    bool ok = transmitTracked(frame, message, "text");
    if (out != nullptr) {
        *out = message;
    }
    return ok;
}

bool ChatSession::sendLocation(double latitude, double longitude, bool hasAltitude, double altitude,
                               uint32_t to, uint32_t channel, Message* out) {
    uint32_t self = _nodes.myNodeNum();
    if (self == 0) {
        dispatch(MeshError(ERR_VALIDATION, "Position", "local node number not known yet"));
        return false;
    }

    EncodedFrame frame;
    MeshError err;
    if (!_codec.encodePositionMessage(latitude, longitude, hasAltitude, altitude,
                                      to, self, channel, true, &frame, &err)) {
        dispatch(err);
        return false;
    }

    Message message;
    message.id = messageId(self, frame.packetId);
    message.hasPacketId = true;
    message.packetId = frame.packetId;
    message.from = self;
    message.to = to;
    message.text = LOCATION_MESSAGE_TEXT;
    message.timestamp = _clock.getEpochMillis();
    message.hasChannel = true;
    message.channel = channel;
    message.type = MSG_LOCATION;
    message.hasLocation = true;
    message.location.latitude = latitude;
    message.location.longitude = longitude;
    message.location.hasAltitude = hasAltitude;
    message.location.altitude = altitude;
    message.location.hasTime = true;
    message.location.time = (uint32_t)(message.timestamp / 1000);

    bool ok = transmitTracked(frame, message, "location");
    if (out != nullptr) {
        *out = message;
    }
    return ok;
}

bool ChatSession::broadcastPosition(double latitude, double longitude, bool hasAltitude, double altitude) {
    uint32_t self = _nodes.myNodeNum();
    if (self == 0) {
        dispatch(MeshError(ERR_VALIDATION, "Position", "local node number not known yet"));
        return false;
    }

    EncodedFrame frame;
    MeshError err;
    if (!_codec.encodePositionMessage(latitude, longitude, hasAltitude, altitude,
                                      self, self, 0, false, &frame, &err) ||
        !_writer.write(frame, "position", &err)) {
        dispatch(err);
        return false;
    }
    MESH_LOGD(TAG, "position %.5f,%.5f handed to the node", latitude, longitude);
    return true;
}

bool ChatSession::requestConfig() {
    EncodedFrame frame;
    uint32_t configId = 0;
    if (!_codec.encodeConfigRequest(&frame, &configId)) {
        dispatch(MeshError(ERR_VALIDATION, "ToRadio", "cannot encode config request"));
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _configId = configId;
        _configComplete = false;
    }

    MeshError err;
    if (!_writer.write(frame, "config request", &err)) {
        dispatch(err);
        return false;
    }
    MESH_LOGI(TAG, "config requested (id %u)", configId);
    return true;
}

bool ChatSession::configComplete() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _configComplete;
}

bool ChatSession::onBrokerMessage(const std::string& topic, const uint8_t* data, size_t len, bool retained) {
    EncodedFrame frame;
    MeshError err;
    if (!_codec.encodeMqttProxyFrame(topic, data, len, retained, &frame, &err) ||
        !_writer.write(frame, "mqtt proxy", &err)) {
        dispatch(err);
        return false;
    }
    return true;
}

void ChatSession::loop() {
    _config.loop();
    _channels.loop();
}

/* ---------------------------------- Inbound ------------------------------------- */

bool ChatSession::handleInbound(const std::string& base64) {
    InboundEvent event;
    MeshError err;
    if (!_codec.decodeFrame(base64, &event, &err)) {
        dispatch(err);
        return false;
    }
    handleEvent(event);
    return true;
}

void ChatSession::handleEvent(const InboundEvent& event) {
    ChatSessionListener* l = listener();

    switch (event.kind) {
        case EVT_MY_INFO:
            _nodes.setMyNodeNum(event.myNodeNum);
            break;

        case EVT_NODE_INFO: {
            _config.onNodeInfo(event.node);
            NodeInfo merged;
            if (l != nullptr && _nodes.get(event.node.nodeNum, &merged)) {
                l->onNodeUpdated(merged);
            }
            break;
        }

        case EVT_POSITION: {
            if (!event.node.hasPosition) {
                break;
            }
            uint32_t heardAt = event.packet.rxTime != 0 ? event.packet.rxTime : _clock.getEpochSeconds();
            _nodes.updatePosition(event.node.nodeNum, event.node.position, heardAt);
            NodeInfo merged;
            if (l != nullptr && _nodes.get(event.node.nodeNum, &merged)) {
                l->onNodeUpdated(merged);
            }
            break;
        }

        case EVT_CHANNEL:
            _channels.onChannel(event.channel);
            if (l != nullptr) {
                l->onChannelUpdated(event.channel);
            }
            break;

        case EVT_CONFIG:
            _config.onConfig(event.config);
            break;

        case EVT_MQTT_CONFIG:
            _config.onMqttConfig(event.mqtt);
            break;

        case EVT_METADATA:
            _config.onMetadata(event.metadata);
            break;

        case EVT_MQTT_PROXY:
            handleProxy(event.proxy);
            break;

        case EVT_TEXT:
            handleText(event);
            break;

        case EVT_ROUTING:
            if (!_tracker.onAck(event.requestId, event.isAck())) {
                MESH_LOGD(TAG, "routing %s for %08X (not a chat message)",
                          MeshEnums::routingError(event.routingError).c_str(), event.requestId);
            } else if (!event.isAck()) {
                MESH_LOGW(TAG, "packet %08X failed: %s", event.requestId,
                          MeshEnums::routingError(event.routingError).c_str());
            }
            break;

        case EVT_DATA:
            MESH_LOGD(TAG, "%s packet from %08X", MeshEnums::portNum(event.portnum).c_str(), event.packet.from);
            if (l != nullptr) {
                l->onData(event.packet, event.portnum, event.payload);
            }
            break;

        case EVT_CONFIG_COMPLETE: {
            bool matched;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                matched = _configId != 0 && event.configCompleteId == _configId;
                if (matched) {
                    _configComplete = true;
                }
            }
            if (!matched) {
                MESH_LOGD(TAG, "config complete for stale request %u", event.configCompleteId);
                break;
            }
            MESH_LOGI(TAG, "config replay complete");
            if (l != nullptr) {
                l->onConfigComplete();
            }
            break;
        }

        case EVT_REBOOTED:
            MESH_LOGW(TAG, "device rebooted, requesting config again");
            _config.reset();
            if (!requestConfig()) {
                MESH_LOGW(TAG, "config request after reboot failed");
            }
            break;

        case EVT_IGNORED:
            break;
    }
}

void ChatSession::handleText(const InboundEvent& event) {
    const PacketHeader& p = event.packet;
    uint32_t self = _nodes.myNodeNum();
    bool broadcast = p.to == BROADCAST_ADDR;

    Message message;
    message.id = messageId(p.from, p.id);
    message.from = p.from;
    message.to = p.to;
    message.text = event.text;
    message.timestamp = _clock.getEpochMillis();
    message.hasChannel = true;
    message.channel = p.channel;
    message.type = MSG_TEXT;

    if (self != 0 && p.from == self) {
        // Our own send echoed back; normally the pending row already exists
        message.isOutgoing = true;
        message.status = "sent";
    } else {
        if (!broadcast && self != 0 && p.to != self) {
            return;
        }
        if (self == 0 && !broadcast) {
            MESH_LOGI(TAG, "learned local node %08X from a direct message", p.to);
            _nodes.setMyNodeNum(p.to);
        }
    }

    if (_store.addMessage(message) != ADD_INSERTED) {
        return;
    }
    ChatSessionListener* l = listener();
    if (l != nullptr) {
        l->onMessage(message);
    }
}

void ChatSession::handleProxy(const MqttProxyFrame& frame) {
    MqttBridge* bridge;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        bridge = _bridge;
    }

    const uint8_t* data = frame.isText ? (const uint8_t*)frame.text.data()
                                       : (frame.data.empty() ? nullptr : &frame.data[0]);
    size_t len = frame.isText ? frame.text.size() : frame.data.size();

    bool published = false;
    if (bridge == nullptr) {
        MESH_LOGW(TAG, "no MQTT bridge, dropping publish to %s", frame.topic.c_str());
    } else {
        published = bridge->publish(frame.topic, data, len, frame.retained);
        if (!published) {
            MESH_LOGW(TAG, "publish to %s failed", frame.topic.c_str());
        }
    }

    // Uplinked packets travel as a ServiceEnvelope; anything else is not ours to track
    if (frame.isText || len == 0) {
        return;
    }
    uint32_t packetId = 0;
    uint32_t from = 0;
    MeshError err;
    if (!MeshCodec::decodeServiceEnvelope(data, len, &packetId, &from, &err)) {
        MESH_LOGD(TAG, "publish to %s is not a packet envelope", frame.topic.c_str());
        return;
    }
    if (from == _nodes.myNodeNum() && packetId != 0) {
        _tracker.onMqttRelay(packetId, published);
    }
}
