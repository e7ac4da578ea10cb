/**
 * test_chat_session.cpp - End-to-end tests of the chat session against a fake device
 *
 * Frames flow exactly as they would over BLE: the session writes base64
 * ToRadio envelopes to a FakeLink, and the tests feed base64 FromRadio
 * envelopes back through handleInbound().
 *
 * Build and run with:
 *   cmake -S . -B build && cmake --build build --target test_chat_session && ./build/test_chat_session
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <string>
#include <vector>

#include "test_support.h"

#include "channel_manager.h"
#include "channel_table.h"
#include "chat_session.h"
#include "config_reconciler.h"
#include "delivery_tracker.h"
#include "frame_writer.h"
#include "mesh_codec.h"
#include "message_store.h"
#include "mqtt_bridge.h"
#include "node_db.h"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST_ASSERT(condition, message) do { \
    if (!(condition)) { \
        printf("  FAIL: %s\n", message); \
        tests_failed++; \
    } else { \
        printf("  PASS: %s\n", message); \
        tests_passed++; \
    } \
} while(0)

#define SELF  0x0A0B0C0Du
#define PEER  0x55AA0001u
#define OTHER 0x66BB0002u

#define UPLINK_TOPIC "msh/EU_868/2/e/LongFast/!0a0b0c0d"

class RecordingListener : public ChatSessionListener {
public:
    std::vector<Message> messages;
    std::vector<Message> statuses;
    std::vector<NodeInfo> nodes;
    std::vector<Channel> channels;
    int configCompletes;

    RecordingListener() : configCompletes(0) {}

    void onMessage(const Message& message) override { messages.push_back(message); }
    void onStatusChanged(const Message& message) override { statuses.push_back(message); }
    void onNodeUpdated(const NodeInfo& node) override { nodes.push_back(node); }
    void onChannelUpdated(const Channel& channel) override { channels.push_back(channel); }
    void onConfigComplete() override { configCompletes++; }
};

class FakeBroker : public MqttBridge {
public:
    std::vector<std::string> topics;
    bool accept;

    FakeBroker() : accept(true) {}

    bool publish(const std::string& topic, const uint8_t* data, size_t len, bool retained) override {
        (void)data; (void)len; (void)retained;
        topics.push_back(topic);
        return accept;
    }
};

struct Rig {
    FakeLink link;
    FakeClock clock;
    FixedRandom rng;
    ErrorRecorder errors;
    MeshCodec codec;
    FrameWriter writer;
    NodeDb nodes;
    MessageStore store;
    DeliveryTracker tracker;
    ChannelTable table;
    ChannelManager channels;
    ConfigReconciler config;
    ChatSession session;
    RecordingListener listener;
    bool opened;

    explicit Rig(bool knowSelf = true)
        : codec(rng, clock), writer(link), store(errors.sink()), tracker(store),
          channels(codec, writer, nodes, table, rng, clock, errors.sink()),
          config(codec, writer, nodes, clock, errors.sink()),
          session(codec, writer, nodes, store, tracker, config, channels, clock, errors.sink()) {
        opened = store.open(":memory:");
        session.setListener(&listener);
        if (knowSelf) {
            session.handleInbound(makeMyInfoFrame(SELF));
        }
    }
};

void testSendAndAck() {
    printf("\n=== Test: Send Text Then ACK ===\n");

    Rig rig;
    TEST_ASSERT(rig.opened, "Store opened");
    TEST_ASSERT(rig.session.myNodeNum() == SELF, "Local node learned from my_info");

    Message sent;
    TEST_ASSERT(rig.session.sendText("hello mesh", BROADCAST_ADDR, 0, &sent), "Text handed to the device");
    TEST_ASSERT(rig.link.writes.size() == 1, "One frame written");
    TEST_ASSERT(sent.hasPacketId && sent.packetId != 0, "Packet id drawn");

    char expectedId[24];
    snprintf(expectedId, sizeof(expectedId), "%u-%u", SELF, sent.packetId);
    TEST_ASSERT(sent.id == expectedId, "Id is sender and packet id");
    TEST_ASSERT(sent.radioStatus == RADIO_SENT && sent.status == "sent", "Sent after hand-off");

    meshtastic_ToRadio toRadio;
    TEST_ASSERT(decodeToRadio(rig.link.writes[0], &toRadio), "Write decodes as ToRadio");
    TEST_ASSERT(toRadio.which_payload_variant == meshtastic_ToRadio_packet_tag, "Carries a packet");
    TEST_ASSERT(toRadio.packet.id == sent.packetId && toRadio.packet.want_ack, "Same id, want_ack set");
    TEST_ASSERT(toRadio.packet.decoded.portnum == meshtastic_PortNum_TEXT_MESSAGE_APP, "Text port");
    TEST_ASSERT(toRadio.packet.decoded.payload.size == 10 &&
                memcmp(toRadio.packet.decoded.payload.bytes, "hello mesh", 10) == 0, "Text payload");

    TEST_ASSERT(rig.listener.messages.size() == 1, "Listener saw the stored message");
    TEST_ASSERT(rig.listener.statuses.size() == 1 && rig.listener.statuses[0].radioStatus == RADIO_SENT,
                "Listener saw sent");

    TEST_ASSERT(rig.session.handleInbound(makeRoutingFrame(PEER, SELF, sent.packetId,
                                                           meshtastic_Routing_Error_NONE)), "ACK decoded");
    Message stored;
    TEST_ASSERT(rig.store.getMessageByPacketId(sent.packetId, &stored), "Row found");
    TEST_ASSERT(stored.radioStatus == RADIO_DELIVERED, "Delivered after ACK");
    TEST_ASSERT(rig.listener.statuses.size() == 2 &&
                rig.listener.statuses[1].radioStatus == RADIO_DELIVERED, "Listener saw delivered");
}

void testSendNak() {
    printf("\n=== Test: Send Text Then NAK ===\n");

    Rig rig;
    Message sent;
    TEST_ASSERT(rig.session.sendText("anyone?", PEER, 0, &sent), "Direct message sent");
    rig.session.handleInbound(makeRoutingFrame(SELF, SELF, sent.packetId,
                                               meshtastic_Routing_Error_MAX_RETRANSMIT));
    Message stored;
    TEST_ASSERT(rig.store.getMessageByPacketId(sent.packetId, &stored) && stored.radioStatus == RADIO_FAILED,
                "Failed after retransmits exhausted");
    TEST_ASSERT(DeliveryTracker::displayStatus(stored) == "failed", "Displayed as failed");
}

void testEchoDeduplicated() {
    printf("\n=== Test: Own Echo Not Stored Twice ===\n");

    Rig rig;
    Message sent;
    TEST_ASSERT(rig.session.sendText("echo me", BROADCAST_ADDR, 0, &sent), "Text sent");
    TEST_ASSERT(rig.session.handleInbound(makeTextFrame(SELF, BROADCAST_ADDR, sent.packetId, 0, "echo me")),
                "Echo decoded");
    TEST_ASSERT(rig.store.getMessageCount() == 1, "Still one row");
    TEST_ASSERT(rig.listener.messages.size() == 1, "Echo not announced");
}

void testIncomingText() {
    printf("\n=== Test: Incoming Text ===\n");

    Rig rig;
    TEST_ASSERT(rig.session.handleInbound(makeTextFrame(PEER, BROADCAST_ADDR, 77, 1, "hi all")), "Broadcast decoded");
    TEST_ASSERT(rig.listener.messages.size() == 1, "Broadcast stored");
    TEST_ASSERT(rig.listener.messages[0].from == PEER && rig.listener.messages[0].channel == 1, "Sender and channel");
    TEST_ASSERT(!rig.listener.messages[0].isOutgoing, "Incoming");
    TEST_ASSERT(rig.listener.messages[0].timestamp == rig.clock.getEpochMillis(), "Stamped at receipt");

    rig.session.handleInbound(makeTextFrame(PEER, BROADCAST_ADDR, 77, 1, "hi all"));
    TEST_ASSERT(rig.store.getMessageCount() == 1, "Rebroadcast deduplicated");

    rig.session.handleInbound(makeTextFrame(PEER, SELF, 78, 0, "just you"));
    TEST_ASSERT(rig.store.getMessageCount() == 2, "Direct message stored");

    rig.session.handleInbound(makeTextFrame(PEER, OTHER, 79, 0, "not for you"));
    TEST_ASSERT(rig.store.getMessageCount() == 2, "Message for another node dropped");
}

void testLearnNodeFromDirectMessage() {
    printf("\n=== Test: Learn Local Node From Direct Message ===\n");

    Rig rig(false);
    TEST_ASSERT(rig.session.myNodeNum() == 0, "Local node unknown");

    rig.session.handleInbound(makeTextFrame(PEER, OTHER, 5, 0, "hello"));
    TEST_ASSERT(rig.session.myNodeNum() == OTHER, "Recipient of a direct message is us");
    TEST_ASSERT(rig.store.getMessageCount() == 1, "Message stored");

    Message sent;
    TEST_ASSERT(rig.session.sendText("reply", PEER, 0, &sent) && sent.from == OTHER, "Can send once known");
}

void testSendValidation() {
    printf("\n=== Test: Send Validation ===\n");

    Rig unknown(false);
    TEST_ASSERT(!unknown.session.sendText("too early", BROADCAST_ADDR, 0, nullptr), "No local node: refused");
    TEST_ASSERT(unknown.errors.has(ERR_VALIDATION, "Data"), "Validation error reported");
    TEST_ASSERT(unknown.link.writes.empty(), "Nothing written");

    Rig rig;
    TEST_ASSERT(!rig.session.sendText("  \t ", BROADCAST_ADDR, 0, nullptr), "Blank text refused");
    TEST_ASSERT(rig.store.getMessageCount() == 0, "Nothing stored");

    std::string tooLong(234, 'x');
    TEST_ASSERT(!rig.session.sendText(tooLong, BROADCAST_ADDR, 0, nullptr), "Oversized text refused");
    TEST_ASSERT(rig.link.writes.empty() && rig.store.getMessageCount() == 0, "Nothing written or stored");
}

void testTransportFailure() {
    printf("\n=== Test: Transport Failure ===\n");

    Rig rig;
    rig.link.connected = false;
    Message sent;
    TEST_ASSERT(!rig.session.sendText("offline", BROADCAST_ADDR, 0, &sent), "Send fails");
    TEST_ASSERT(rig.errors.has(ERR_TRANSPORT, "text"), "Transport error reported");

    Message stored;
    TEST_ASSERT(rig.store.getMessageByPacketId(sent.packetId, &stored), "Row persisted before the write");
    TEST_ASSERT(stored.radioStatus == RADIO_FAILED, "Marked failed");
    TEST_ASSERT(rig.listener.messages.size() == 1, "Listener still saw the message");
}

void testMqttProxyCorrelation() {
    printf("\n=== Test: MQTT Proxy Relay ===\n");

    Rig rig;
    FakeBroker broker;
    rig.session.setMqttBridge(&broker);
    rig.session.handleInbound(makeChannelFrame(0, meshtastic_Channel_Role_PRIMARY, "LongFast", true, true, 32));
    TEST_ASSERT(rig.listener.channels.size() == 1, "Channel announced");
    TEST_ASSERT(rig.table.uplinkEnabled(0), "Channel 0 uplinks");

    Message sent;
    TEST_ASSERT(rig.session.sendText("via mqtt", BROADCAST_ADDR, 0, &sent), "Text sent");
    TEST_ASSERT(sent.mqttStatus == MQTT_PENDING, "MQTT track pending");

    TEST_ASSERT(rig.session.handleInbound(makeUplinkProxyFrame(UPLINK_TOPIC, SELF, sent.packetId)),
                "Proxy publish decoded");
    TEST_ASSERT(broker.topics.size() == 1 && broker.topics[0] == UPLINK_TOPIC, "Published to the broker");

    Message stored;
    TEST_ASSERT(rig.store.getMessageByPacketId(sent.packetId, &stored) && stored.mqttStatus == MQTT_SENT,
                "MQTT sent");
    TEST_ASSERT(DeliveryTracker::displayStatus(stored) == "delivered", "Relayed shows delivered");

    // Someone else's packet relayed through our node is published but not tracked
    rig.session.handleInbound(makeUplinkProxyFrame(UPLINK_TOPIC, PEER, 0x1234));
    TEST_ASSERT(broker.topics.size() == 2, "Foreign packet still published");

    broker.accept = false;
    Message second;
    rig.session.sendText("broker down", BROADCAST_ADDR, 0, &second);
    rig.session.handleInbound(makeUplinkProxyFrame(UPLINK_TOPIC, SELF, second.packetId));
    TEST_ASSERT(rig.store.getMessageByPacketId(second.packetId, &stored) && stored.mqttStatus == MQTT_FAILED,
                "Rejected publish fails the MQTT track");
    TEST_ASSERT(stored.radioStatus == RADIO_SENT, "Radio track unaffected");
}

void testDirectMessageHasNoMqttTrack() {
    printf("\n=== Test: Direct Message Has No MQTT Track ===\n");

    Rig rig;
    rig.session.handleInbound(makeChannelFrame(0, meshtastic_Channel_Role_PRIMARY, "LongFast", true, true, 32));
    TEST_ASSERT(rig.table.uplinkEnabled(0), "Channel 0 uplinks");

    Message dm;
    TEST_ASSERT(rig.session.sendText("just us", PEER, 0, &dm), "Direct message sent");
    TEST_ASSERT(dm.mqttStatus == MQTT_NOT_APPLICABLE, "MQTT not applicable");

    Message stored;
    TEST_ASSERT(rig.store.getMessageByPacketId(dm.packetId, &stored) && stored.mqttStatus == MQTT_NOT_APPLICABLE,
                "Stored as not applicable");

    Message loc;
    TEST_ASSERT(rig.session.sendLocation(50.85, 4.35, false, 0, PEER, 0, &loc), "Direct location sent");
    TEST_ASSERT(loc.mqttStatus == MQTT_NOT_APPLICABLE, "Direct location not uplinked either");

    Message broadcast;
    TEST_ASSERT(rig.session.sendText("everyone", BROADCAST_ADDR, 0, &broadcast), "Channel message sent");
    TEST_ASSERT(broadcast.mqttStatus == MQTT_PENDING, "Channel message still tracked");
}

void testBrokerDownlink() {
    printf("\n=== Test: Broker Downlink ===\n");

    Rig rig;
    const uint8_t payload[] = { 0x0A, 0x02, 0x08, 0x01 };
    TEST_ASSERT(rig.session.onBrokerMessage("msh/EU_868/2/e/LongFast/!deadbeef", payload, sizeof(payload), false),
                "Downlink forwarded");

    meshtastic_ToRadio toRadio;
    TEST_ASSERT(rig.link.writes.size() == 1 && decodeToRadio(rig.link.writes[0], &toRadio), "Write decodes");
    TEST_ASSERT(toRadio.which_payload_variant == meshtastic_ToRadio_mqttClientProxyMessage_tag, "Proxy message");
    TEST_ASSERT(strcmp(toRadio.mqttClientProxyMessage.topic, "msh/EU_868/2/e/LongFast/!deadbeef") == 0, "Topic kept");
    TEST_ASSERT(toRadio.mqttClientProxyMessage.data.size == sizeof(payload), "Payload kept");
}

void testConfigRequest() {
    printf("\n=== Test: Config Request And Completion ===\n");

    Rig rig;
    TEST_ASSERT(rig.session.requestConfig(), "Config requested");
    meshtastic_ToRadio toRadio;
    TEST_ASSERT(decodeToRadio(rig.link.writes.back(), &toRadio), "Write decodes");
    TEST_ASSERT(toRadio.which_payload_variant == meshtastic_ToRadio_want_config_id_tag, "want_config_id");
    uint32_t configId = toRadio.want_config_id;
    TEST_ASSERT(configId == (uint32_t)(rig.clock.getEpochMillis() / 1000), "Id is the epoch second");

    rig.session.handleInbound(makeNodeInfoFrame(PEER, "Peer Node", "PEER"));
    TEST_ASSERT(rig.listener.nodes.size() == 1 && rig.listener.nodes[0].longName == "Peer Node", "Node announced");

    rig.session.handleInbound(makeConfigCompleteFrame(configId - 60));
    TEST_ASSERT(!rig.session.configComplete() && rig.listener.configCompletes == 0, "Stale completion ignored");

    rig.session.handleInbound(makeConfigCompleteFrame(configId));
    TEST_ASSERT(rig.session.configComplete() && rig.listener.configCompletes == 1, "Matching completion");

    rig.clock.advance(5000);
    size_t before = rig.link.writes.size();
    TEST_ASSERT(rig.session.handleInbound(makeRebootedFrame()), "Reboot notice decoded");
    TEST_ASSERT(rig.link.writes.size() == before + 1, "Config requested again");
    TEST_ASSERT(decodeToRadio(rig.link.writes.back(), &toRadio) &&
                toRadio.which_payload_variant == meshtastic_ToRadio_want_config_id_tag &&
                toRadio.want_config_id == configId + 5, "New request id");
    TEST_ASSERT(!rig.session.configComplete(), "Completion reset");
}

void testSendLocation() {
    printf("\n=== Test: Send Location ===\n");

    Rig rig;
    Message sent;
    TEST_ASSERT(rig.session.sendLocation(50.8503, 4.3517, true, 56.0, BROADCAST_ADDR, 0, &sent), "Location sent");

    meshtastic_ToRadio toRadio;
    TEST_ASSERT(decodeToRadio(rig.link.writes.back(), &toRadio), "Write decodes");
    TEST_ASSERT(toRadio.packet.decoded.portnum == meshtastic_PortNum_POSITION_APP, "Position port");

    Message stored;
    TEST_ASSERT(rig.store.getMessageByPacketId(sent.packetId, &stored), "Row found");
    TEST_ASSERT(stored.type == MSG_LOCATION && stored.text == LOCATION_MESSAGE_TEXT, "Stored as location");
    TEST_ASSERT(stored.hasLocation && stored.location.latitude > 50.85 && stored.location.latitude < 50.851,
                "Coordinates stored");

    size_t rows = rig.store.getMessageCount();
    TEST_ASSERT(rig.session.broadcastPosition(50.8503, 4.3517, false, 0), "Position given to the node");
    TEST_ASSERT(decodeToRadio(rig.link.writes.back(), &toRadio) && !toRadio.packet.want_ack &&
                toRadio.packet.to == SELF, "Addressed to the local node without want_ack");
    TEST_ASSERT((size_t)rig.store.getMessageCount() == rows, "Position broadcast not stored");
}

void testMalformedFrame() {
    printf("\n=== Test: Malformed Frame ===\n");

    Rig rig;
    TEST_ASSERT(!rig.session.handleInbound("%%%not-base64%%%"), "Garbage rejected");
    TEST_ASSERT(rig.errors.count(ERR_DECODE) == 1, "Decode error reported");
    TEST_ASSERT(rig.session.handleInbound(makeTextFrame(PEER, BROADCAST_ADDR, 1, 0, "still alive")),
                "Next frame handled normally");
}

int main() {
    printf("======================================\n");
    printf("  Chat Session Test Suite\n");
    printf("======================================\n");

    testSendAndAck();
    testSendNak();
    testEchoDeduplicated();
    testIncomingText();
    testLearnNodeFromDirectMessage();
    testSendValidation();
    testTransportFailure();
    testMqttProxyCorrelation();
    testDirectMessageHasNoMqttTrack();
    testBrokerDownlink();
    testConfigRequest();
    testSendLocation();
    testMalformedFrame();

    printf("\n======================================\n");
    printf("  Results: %d passed, %d failed\n", tests_passed, tests_failed);
    printf("======================================\n");

    return tests_failed > 0 ? 1 : 0;
}
