/**
 * test_message_store.cpp - Unit tests for the SQLite message history
 *
 * Build and run with:
 *   cmake -S . -B build && cmake --build build --target test_message_store && ./build/test_message_store
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "test_support.h"

#include "message_store.h"

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

#define SELF  100u
#define PEER  200u
#define OTHER 300u
#define T0    1700000000000LL

static Message makeMessage(const char* id, uint32_t from, uint32_t to, const char* text, int64_t timestamp) {
    Message m;
    m.id = id;
    m.from = from;
    m.to = to;
    m.text = text;
    m.timestamp = timestamp;
    m.hasChannel = true;
    m.channel = 0;
    return m;
}

static Message makeOutgoing(const char* id, uint32_t packetId, MqttStatus mqtt, int64_t timestamp) {
    Message m = makeMessage(id, SELF, BROADCAST_ADDR, id, timestamp);
    m.isOutgoing = true;
    m.hasPacketId = true;
    m.packetId = packetId;
    m.hasDualStatus = true;
    m.radioStatus = RADIO_PENDING;
    m.mqttStatus = mqtt;
    m.status = "pending";
    return m;
}

void testOpenAndSchema() {
    printf("\n=== Test: Open and Schema Version ===\n");

    ErrorRecorder errors;
    MessageStore store(errors.sink());
    TEST_ASSERT(!store.isOpen(), "Closed before open()");
    TEST_ASSERT(store.addMessage(makeMessage("x", 1, 2, "x", T0)) == ADD_FAILED, "Writes fail while closed");
    TEST_ASSERT(errors.count(ERR_STORE) == 1, "Closed store reports ERR_STORE");

    TEST_ASSERT(store.open(":memory:"), "In-memory database opened");
    TEST_ASSERT(store.schemaVersion() == STORE_SCHEMA_VERSION, "Migrated to the current schema");
    TEST_ASSERT(store.getMessageCount() == 0, "Empty history");
}

void testDeduplication() {
    printf("\n=== Test: Deduplication Window ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");

    TEST_ASSERT(store.addMessage(makeMessage("a", PEER, SELF, "hello", T0)) == ADD_INSERTED, "First copy inserted");
    TEST_ASSERT(store.addMessage(makeMessage("b", PEER, SELF, "hello", T0 + 3000)) == ADD_DUPLICATE,
                "Same from/to/text 3 s later dropped");
    TEST_ASSERT(store.addMessage(makeMessage("c", PEER, SELF, "hello", T0 - 4999)) == ADD_DUPLICATE,
                "Window applies in both directions");
    TEST_ASSERT(store.addMessage(makeMessage("d", PEER, SELF, "hello", T0 + 6000)) == ADD_INSERTED,
                "Same content 6 s later kept");
    TEST_ASSERT(store.addMessage(makeMessage("e", PEER, SELF, "hello!", T0 + 100)) == ADD_INSERTED,
                "Different text kept");
    TEST_ASSERT(store.addMessage(makeMessage("f", OTHER, SELF, "hello", T0 + 100)) == ADD_INSERTED,
                "Different sender kept");
    TEST_ASSERT(store.addMessage(makeMessage("a", PEER, SELF, "other text", T0 + 60000)) == ADD_DUPLICATE,
                "Existing id dropped");
    TEST_ASSERT(store.getMessageCount() == 4, "Four distinct messages stored");
}

void testOrderingAndLimit() {
    printf("\n=== Test: Ordering and Limit ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");

    int64_t stamps[] = { 50000, 10000, 40000, 20000, 30000 };
    for (int i = 0; i < 5; i++) {
        char id[8];
        char text[16];
        snprintf(id, sizeof(id), "m%d", i);
        snprintf(text, sizeof(text), "msg %d", (int)(stamps[i] / 10000));
        store.addMessage(makeMessage(id, PEER, SELF, text, T0 + stamps[i]));
    }

    std::vector<Message> all = store.getMessages();
    TEST_ASSERT(all.size() == 5, "All messages returned");
    bool ascending = true;
    for (size_t i = 1; i < all.size(); i++) {
        if (all[i - 1].timestamp > all[i].timestamp) ascending = false;
    }
    TEST_ASSERT(ascending, "Ascending by timestamp");

    std::vector<Message> last = store.getMessages(3);
    TEST_ASSERT(last.size() == 3, "Limit honored");
    TEST_ASSERT(last[0].text == "msg 3" && last[2].text == "msg 5", "Limit keeps the most recent");
}

void testConversationQueries() {
    printf("\n=== Test: Chat and Channel Queries ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");

    Message toPeer = makeMessage("1", SELF, PEER, "to peer", T0);
    Message fromPeer = makeMessage("2", PEER, SELF, "from peer", T0 + 1000);
    Message toOther = makeMessage("3", SELF, OTHER, "to other", T0 + 2000);
    Message peerToOther = makeMessage("4", PEER, OTHER, "not ours", T0 + 3000);
    Message bcast1 = makeMessage("5", PEER, BROADCAST_ADDR, "channel one", T0 + 4000);
    bcast1.channel = 1;
    Message dmOnCh1 = makeMessage("6", PEER, SELF, "dm on ch1", T0 + 5000);
    dmOnCh1.channel = 1;
    Message bcast0 = makeMessage("7", OTHER, BROADCAST_ADDR, "channel zero", T0 + 6000);

    store.addMessage(toPeer);
    store.addMessage(fromPeer);
    store.addMessage(toOther);
    store.addMessage(peerToOther);
    store.addMessage(bcast1);
    store.addMessage(dmOnCh1);
    store.addMessage(bcast0);

    std::vector<Message> chat = store.getMessagesByChat(PEER, SELF);
    TEST_ASSERT(chat.size() == 3, "Both directions of the conversation");
    TEST_ASSERT(chat[0].text == "to peer" && chat[2].text == "dm on ch1", "Conversation ascending");

    std::vector<Message> ch1 = store.getMessagesByChannel(1);
    TEST_ASSERT(ch1.size() == 1 && ch1[0].text == "channel one", "Channel query holds broadcasts only");

    std::vector<Message> ch0 = store.getMessagesByChannel(0);
    TEST_ASSERT(ch0.size() == 1 && ch0[0].text == "channel zero", "Channel 0 broadcast");

    Message loaded;
    TEST_ASSERT(store.getMessageById("2", &loaded) && loaded.from == PEER, "Lookup by id");
    TEST_ASSERT(!loaded.hasPacketId, "Incoming row has no packet id");
    TEST_ASSERT(!store.getMessageById("missing", &loaded), "Unknown id not found");
}

void testRadioStatusProgression() {
    printf("\n=== Test: Radio Status Progression ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");
    TEST_ASSERT(store.addMessage(makeOutgoing("out", 77, MQTT_NOT_APPLICABLE, T0)) == ADD_INSERTED, "Pending row stored");

    TEST_ASSERT(store.updateMessageStatus(77, RADIO_SENT) == 1, "pending -> sent");
    TEST_ASSERT(store.updateMessageStatus(77, RADIO_PENDING) == 0, "sent -> pending refused");
    TEST_ASSERT(store.updateMessageStatus(77, RADIO_DELIVERED) == 1, "sent -> delivered");
    TEST_ASSERT(store.updateMessageStatus(77, RADIO_FAILED) == 0, "delivered -> failed refused");
    TEST_ASSERT(store.updateMessageStatus(77, RADIO_SENT) == 0, "delivered -> sent refused");

    Message m;
    TEST_ASSERT(store.getMessageByPacketId(77, &m), "Row found by packet id");
    TEST_ASSERT(m.radioStatus == RADIO_DELIVERED, "Radio track is delivered");
    TEST_ASSERT(m.status == "delivered", "Legacy status rewritten");

    TEST_ASSERT(store.addMessage(makeOutgoing("fail", 78, MQTT_NOT_APPLICABLE, T0 + 10000)) == ADD_INSERTED,
                "Second row stored");
    TEST_ASSERT(store.updateMessageStatus(78, RADIO_FAILED) == 1, "pending -> failed");
    TEST_ASSERT(store.updateMessageStatus(78, RADIO_DELIVERED) == 0, "failed -> delivered refused");
    TEST_ASSERT(store.getMessageByPacketId(78, &m) && m.status == "failed", "Failure kept");

    TEST_ASSERT(store.updateMessageStatus(999, RADIO_SENT) == 0, "Unknown packet id changes nothing");
}

void testMqttStatus() {
    printf("\n=== Test: MQTT Status Track ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");
    store.addMessage(makeOutgoing("up", 55, MQTT_PENDING, T0));
    store.addMessage(makeOutgoing("local", 56, MQTT_NOT_APPLICABLE, T0 + 10000));

    TEST_ASSERT(store.updateMessageStatus(55, RADIO_SENT) == 1, "Radio sent");
    Message m;
    TEST_ASSERT(store.getMessageByPacketId(55, &m) && m.status == "sent", "sent while MQTT pending");

    TEST_ASSERT(store.updateMqttStatus(55, MQTT_SENT) == 1, "MQTT pending -> sent");
    TEST_ASSERT(store.getMessageByPacketId(55, &m) && m.mqttStatus == MQTT_SENT, "MQTT track is sent");
    TEST_ASSERT(m.radioStatus == RADIO_SENT && m.status == "delivered", "Radio sent + MQTT sent reads delivered");
    TEST_ASSERT(store.updateMqttStatus(55, MQTT_FAILED) == 0, "MQTT sent -> failed refused");

    TEST_ASSERT(store.updateMqttStatus(56, MQTT_SENT) == 0, "not_applicable never changes");
    TEST_ASSERT(store.getMessageByPacketId(56, &m) && m.mqttStatus == MQTT_NOT_APPLICABLE, "Still not_applicable");
    TEST_ASSERT(store.updateMqttStatus(55, MQTT_PENDING) == 0, "pending is not a target state");
}

void testLegacyRows() {
    printf("\n=== Test: Rows Without Dual Status ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");

    Message legacy = makeMessage("old", SELF, PEER, "old send", T0);
    legacy.isOutgoing = true;
    legacy.hasPacketId = true;
    legacy.packetId = 42;
    legacy.status = "sent";
    store.addMessage(legacy);

    Message m;
    TEST_ASSERT(store.getMessageById("old", &m), "Legacy row loaded");
    TEST_ASSERT(!m.hasDualStatus && m.status == "sent", "Only the legacy status is present");

    TEST_ASSERT(store.updateMessageStatus(42, RADIO_DELIVERED) == 1, "Legacy sent -> delivered");
    TEST_ASSERT(store.getMessageById("old", &m), "Row reloaded");
    TEST_ASSERT(m.hasDualStatus && m.radioStatus == RADIO_DELIVERED, "Radio track now recorded");
    TEST_ASSERT(m.mqttStatus == MQTT_NOT_APPLICABLE, "MQTT track defaults to not_applicable");
    TEST_ASSERT(m.status == "delivered", "Legacy status kept in step");

    Message done = makeMessage("old2", SELF, PEER, "older send", T0 - 60000);
    done.isOutgoing = true;
    done.hasPacketId = true;
    done.packetId = 43;
    done.status = "delivered";
    store.addMessage(done);
    TEST_ASSERT(store.updateMessageStatus(43, RADIO_SENT) == 0, "Legacy terminal status protected");
}

void testLocationRow() {
    printf("\n=== Test: Location Message Fields ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");

    Message m = makeOutgoing("loc", 12, MQTT_NOT_APPLICABLE, T0);
    m.type = MSG_LOCATION;
    m.text = "\xF0\x9F\x93\x8D Location";
    m.hasLocation = true;
    m.location.latitude = 52.3676;
    m.location.longitude = 4.9041;
    m.location.hasTime = true;
    m.location.time = 1700000000;
    TEST_ASSERT(store.addMessage(m) == ADD_INSERTED, "Location row stored");

    Message back;
    TEST_ASSERT(store.getMessageById("loc", &back), "Location row loaded");
    TEST_ASSERT(back.type == MSG_LOCATION && back.hasLocation, "Type and location present");
    TEST_ASSERT(back.location.latitude == 52.3676 && back.location.longitude == 4.9041, "Coordinates kept");
    TEST_ASSERT(!back.location.hasAltitude && back.location.hasTime && back.location.time == 1700000000,
                "Optional altitude absent, time present");
    TEST_ASSERT(back.text == m.text, "Display text kept");
}

void testTrim() {
    printf("\n=== Test: Trim Old Messages ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");
    for (int i = 0; i < 10; i++) {
        char id[8];
        snprintf(id, sizeof(id), "t%d", i);
        store.addMessage(makeMessage(id, PEER, SELF, id, T0 + i * 10000));
    }
    TEST_ASSERT(store.deleteOldMessages(4) == 6, "Six rows deleted");
    TEST_ASSERT(store.getMessageCount() == 4, "Four rows remain");
    std::vector<Message> rest = store.getMessages();
    TEST_ASSERT(rest.size() == 4 && rest[0].id == "t6" && rest[3].id == "t9", "Newest rows kept");
    TEST_ASSERT(store.deleteOldMessages(4) == 0, "Nothing more to trim");
}

void testImport() {
    printf("\n=== Test: Bulk Import ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");
    store.addMessage(makeMessage("keep", PEER, SELF, "original", T0));

    std::vector<Message> batch;
    batch.push_back(makeMessage("keep", PEER, SELF, "replacement", T0));
    batch.push_back(makeMessage("n1", PEER, SELF, "new one", T0 + 1000));
    batch.push_back(makeMessage("n2", OTHER, SELF, "new two", T0 + 2000));

    TEST_ASSERT(store.importMessages(batch) == 2, "Two rows imported");
    Message m;
    TEST_ASSERT(store.getMessageById("keep", &m) && m.text == "original", "Existing row left as it was");
    TEST_ASSERT(store.getMessageCount() == 3, "Three rows total");
    TEST_ASSERT(store.importMessages(std::vector<Message>()) == 0, "Empty import is a no-op");
}

void testPrefs() {
    printf("\n=== Test: Client Preferences ===\n");

    MessageStore store;
    TEST_ASSERT(store.open(":memory:"), "Store opened");

    ClientPrefs prefs;
    TEST_ASSERT(!store.loadPrefs(&prefs), "Nothing saved yet");

    prefs.userName = "Jane Q Public";
    prefs.userPhone = "+31 20 000 0000";
    prefs.gpsEnabled = true;
    prefs.lastDeviceId = "AA:BB:CC:DD:EE:FF";
    prefs.lastDeviceName = "Meshtastic_1a2b";
    prefs.lastDeviceSavedAt = T0;
    prefs.hasMqtt = true;
    prefs.mqtt.enabled = true;
    prefs.mqtt.address = "mqtt.example.org";
    prefs.mqtt.username = "meshdev";
    prefs.mqtt.password = "large4cats";
    prefs.mqtt.tlsEnabled = true;
    prefs.mqtt.proxyToClientEnabled = false;
    prefs.mqtt.root = "msh/EU";
    TEST_ASSERT(store.savePrefs(prefs), "Preferences saved");

    ClientPrefs back;
    TEST_ASSERT(store.loadPrefs(&back), "Preferences loaded");
    TEST_ASSERT(back.userName == prefs.userName && back.userPhone == prefs.userPhone, "User fields");
    TEST_ASSERT(back.gpsEnabled && back.lastDeviceSavedAt == T0, "Flag and timestamp");
    TEST_ASSERT(back.lastDeviceId == prefs.lastDeviceId && back.lastDeviceName == prefs.lastDeviceName,
                "Last device");
    TEST_ASSERT(back.hasMqtt && back.mqtt.sameUserFields(prefs.mqtt), "MQTT settings");
    TEST_ASSERT(back.mqtt.root == "msh/EU", "MQTT root");

    prefs.userName = "Jane";
    TEST_ASSERT(store.savePrefs(prefs) && store.loadPrefs(&back) && back.userName == "Jane", "Overwrite");
}

void testMigrationFromV1() {
    printf("\n=== Test: Migration From Schema v1 ===\n");

    const char* path = "test_message_store_v1.db";
    remove(path);

    sqlite3* db = nullptr;
    TEST_ASSERT(sqlite3_open(path, &db) == SQLITE_OK, "Raw v1 database created");
    const char* v1 =
        "CREATE TABLE messages (id TEXT PRIMARY KEY, packet_id INTEGER, from_node INTEGER NOT NULL,"
        " to_node INTEGER NOT NULL, text TEXT NOT NULL, timestamp INTEGER NOT NULL,"
        " is_outgoing INTEGER NOT NULL DEFAULT 0, channel INTEGER, status TEXT, type TEXT DEFAULT 'text',"
        " location_lat REAL, location_lon REAL, location_alt REAL, location_time INTEGER);"
        "INSERT INTO messages (id, packet_id, from_node, to_node, text, timestamp, is_outgoing, channel, status)"
        " VALUES ('100-5', 5, 100, 200, 'from v1', 1700000000000, 1, 0, 'sent');"
        "PRAGMA user_version = 1;";
    TEST_ASSERT(sqlite3_exec(db, v1, nullptr, nullptr, nullptr) == SQLITE_OK, "v1 schema and row written");
    sqlite3_close(db);

    MessageStore store;
    TEST_ASSERT(store.open(path), "v1 database opened");
    TEST_ASSERT(store.schemaVersion() == STORE_SCHEMA_VERSION, "Migrated forward");

    Message m;
    TEST_ASSERT(store.getMessageById("100-5", &m), "Old row readable");
    TEST_ASSERT(!m.hasDualStatus && m.status == "sent", "Old row keeps its legacy status");
    TEST_ASSERT(store.updateMessageStatus(5, RADIO_DELIVERED) == 1, "Old row can still be delivered");

    ClientPrefs prefs;
    TEST_ASSERT(store.savePrefs(prefs), "Settings table created by migration");
    store.close();

    TEST_ASSERT(store.open(path) && store.schemaVersion() == STORE_SCHEMA_VERSION, "Reopen is a no-op migration");
    store.close();
    remove(path);
    remove("test_message_store_v1.db-wal");
    remove("test_message_store_v1.db-shm");
}

int main() {
    printf("======================================\n");
    printf("  Message Store Test Suite\n");
    printf("======================================\n");

    testOpenAndSchema();
    testDeduplication();
    testOrderingAndLimit();
    testConversationQueries();
    testRadioStatusProgression();
    testMqttStatus();
    testLegacyRows();
    testLocationRow();
    testTrim();
    testImport();
    testPrefs();
    testMigrationFromV1();

    printf("\n======================================\n");
    printf("  Results: %d passed, %d failed\n", tests_passed, tests_failed);
    printf("======================================\n");

    return tests_failed > 0 ? 1 : 0;
}
