/**
 * message_store.cpp - SQLite message history implementation
 * 
 */

#include "message_store.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <sqlite3.h>

#include "mesh_log.h"

#define TAG "Store"

// Column list shared by every SELECT; rowToMessage() depends on this order
#define MESSAGE_COLUMNS \
    "id, packet_id, from_node, to_node, text, timestamp, is_outgoing, channel, status, type, " \
    "location_lat, location_lon, location_alt, location_time, radio_status, mqtt_status"

// Rank of a row's radio state; terminal states share the top rank
#define RADIO_RANK_SQL(col) \
    "(CASE " col " WHEN 'pending' THEN 0 WHEN 'sent' THEN 1 " \
    "WHEN 'delivered' THEN 2 WHEN 'failed' THEN 2 ELSE -1 END)"

// Legacy single status derived from the dual fields
static const char* DERIVE_STATUS_SQL =
    "UPDATE messages SET status = CASE "
    "WHEN radio_status = 'failed' THEN 'failed' "
    "WHEN radio_status = 'delivered' THEN 'delivered' "
    "WHEN radio_status = 'sent' AND mqtt_status = 'sent' THEN 'delivered' "
    "ELSE radio_status END "
    "WHERE packet_id = ? AND radio_status IS NOT NULL";

static const char* MIGRATION_V1 =
    "CREATE TABLE IF NOT EXISTS messages ("
    "  id TEXT PRIMARY KEY,"
    "  packet_id INTEGER,"
    "  from_node INTEGER NOT NULL,"
    "  to_node INTEGER NOT NULL,"
    "  text TEXT NOT NULL,"
    "  timestamp INTEGER NOT NULL,"
    "  is_outgoing INTEGER NOT NULL DEFAULT 0,"
    "  channel INTEGER,"
    "  status TEXT,"
    "  type TEXT DEFAULT 'text',"
    "  location_lat REAL,"
    "  location_lon REAL,"
    "  location_alt REAL,"
    "  location_time INTEGER"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_messages_timestamp ON messages(timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_messages_from_to ON messages(from_node, to_node);"
    "CREATE INDEX IF NOT EXISTS idx_messages_channel ON messages(channel);"
    "CREATE INDEX IF NOT EXISTS idx_messages_packet_id ON messages(packet_id);";

static const char* MIGRATION_V2 =
    "ALTER TABLE messages ADD COLUMN radio_status TEXT;"
    "ALTER TABLE messages ADD COLUMN mqtt_status TEXT;";

static const char* MIGRATION_V3 =
    "CREATE TABLE IF NOT EXISTS settings ("
    "  key TEXT PRIMARY KEY,"
    "  value TEXT NOT NULL"
    ");";

static const char* const MIGRATIONS[STORE_SCHEMA_VERSION] = {
    MIGRATION_V1,
    MIGRATION_V2,
    MIGRATION_V3
};

namespace {

// Owns one prepared statement
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : _stmt(nullptr) {
        _rc = sqlite3_prepare_v2(db, sql, -1, &_stmt, nullptr);
    }
    ~Statement() { sqlite3_finalize(_stmt); }

    bool ok() const { return _rc == SQLITE_OK && _stmt != nullptr; }
    sqlite3_stmt* get() { return _stmt; }

    void bindInt(int idx, int64_t v) { sqlite3_bind_int64(_stmt, idx, v); }
    void bindDouble(int idx, double v) { sqlite3_bind_double(_stmt, idx, v); }
    void bindNull(int idx) { sqlite3_bind_null(_stmt, idx); }
    void bindText(int idx, const std::string& v) {
        sqlite3_bind_text(_stmt, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
    }

    int step() { return sqlite3_step(_stmt); }

private:
    sqlite3_stmt* _stmt;
    int _rc;

    Statement(const Statement&);
    Statement& operator=(const Statement&);
};

std::string columnText(sqlite3_stmt* s, int col) {
    const unsigned char* t = sqlite3_column_text(s, col);
    return t ? std::string((const char*)t, sqlite3_column_bytes(s, col)) : std::string();
}

bool columnNull(sqlite3_stmt* s, int col) {
    return sqlite3_column_type(s, col) == SQLITE_NULL;
}

Message rowToMessage(sqlite3_stmt* s) {
    Message m;
    m.id = columnText(s, 0);
    m.hasPacketId = !columnNull(s, 1);
    m.packetId = (uint32_t)sqlite3_column_int64(s, 1);
    m.from = (uint32_t)sqlite3_column_int64(s, 2);
    m.to = (uint32_t)sqlite3_column_int64(s, 3);
    m.text = columnText(s, 4);
    m.timestamp = sqlite3_column_int64(s, 5);
    m.isOutgoing = sqlite3_column_int(s, 6) != 0;
    m.hasChannel = !columnNull(s, 7);
    m.channel = (uint32_t)sqlite3_column_int64(s, 7);
    m.status = columnText(s, 8);
    if (!parseMessageType(columnText(s, 9), &m.type)) {
        m.type = MSG_TEXT;
    }
    if (!columnNull(s, 10) && !columnNull(s, 11)) {
        m.hasLocation = true;
        m.location.latitude = sqlite3_column_double(s, 10);
        m.location.longitude = sqlite3_column_double(s, 11);
        m.location.hasAltitude = !columnNull(s, 12);
        m.location.altitude = sqlite3_column_double(s, 12);
        m.location.hasTime = !columnNull(s, 13);
        m.location.time = (uint32_t)sqlite3_column_int64(s, 13);
    }
    if (!columnNull(s, 14) && parseRadioStatus(columnText(s, 14), &m.radioStatus)) {
        m.hasDualStatus = true;
        if (columnNull(s, 15) || !parseMqttStatus(columnText(s, 15), &m.mqttStatus)) {
            m.mqttStatus = MQTT_NOT_APPLICABLE;
        }
    }
    return m;
}

int radioRank(RadioStatus status) {
    switch (status) {
        case RADIO_PENDING:   return 0;
        case RADIO_SENT:      return 1;
        case RADIO_DELIVERED: return 2;
        case RADIO_FAILED:    return 2;
    }
    return 0;
}

}  // namespace

MessageStore::MessageStore(const ErrorSink& onError)
    : _db(nullptr), _onError(onError) {
}

MessageStore::~MessageStore() {
    close();
}

void MessageStore::fail(const char* op) {
    std::string msg = _db ? sqlite3_errmsg(_db) : "database not open";
    MESH_LOGE(TAG, "%s failed: %s", op, msg.c_str());
    if (_onError) {
        _onError(MeshError(ERR_STORE, op, msg));
    }
}

bool MessageStore::exec(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(_db, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        MESH_LOGE(TAG, "exec: %s", errmsg ? errmsg : sqlite3_errstr(rc));
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

int MessageStore::userVersion() {
    Statement st(_db, "PRAGMA user_version;");
    if (!st.ok() || st.step() != SQLITE_ROW) {
        return -1;
    }
    return sqlite3_column_int(st.get(), 0);
}

bool MessageStore::migrate() {
    int from = userVersion();
    if (from < 0) {
        return false;
    }
    if (from > STORE_SCHEMA_VERSION) {
        MESH_LOGE(TAG, "database schema v%d is newer than this build (v%d)", from, STORE_SCHEMA_VERSION);
        return false;
    }

    for (int v = from; v < STORE_SCHEMA_VERSION; v++) {
        MESH_LOGI(TAG, "migrating schema v%d -> v%d", v, v + 1);
        if (!exec("BEGIN;")) {
            return false;
        }
        char pragma[48];
        snprintf(pragma, sizeof(pragma), "PRAGMA user_version = %d;", v + 1);
        if (!exec(MIGRATIONS[v]) || !exec(pragma)) {
            if (!exec("ROLLBACK;")) {
                MESH_LOGE(TAG, "rollback of v%d migration failed", v + 1);
            }
            return false;
        }
        if (!exec("COMMIT;")) {
            return false;
        }
    }
    return true;
}

bool MessageStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db != nullptr) {
        sqlite3_close(_db);
        _db = nullptr;
    }

    int rc = sqlite3_open_v2(path.c_str(), &_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        fail("open");
        sqlite3_close(_db);
        _db = nullptr;
        return false;
    }

    if (!exec("PRAGMA journal_mode = WAL;") || !migrate()) {
        fail("migrate");
        sqlite3_close(_db);
        _db = nullptr;
        return false;
    }
    MESH_LOGI(TAG, "opened %s (schema v%d)", path.c_str(), STORE_SCHEMA_VERSION);
    return true;
}

void MessageStore::close() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db != nullptr) {
        sqlite3_close(_db);
        _db = nullptr;
    }
}

bool MessageStore::isOpen() const {
    return _db != nullptr;
}

int MessageStore::schemaVersion() {
    std::lock_guard<std::mutex> lock(_mutex);
    return _db ? userVersion() : -1;
}

bool MessageStore::isDuplicate(const Message& m, bool* duplicate) {
    Statement st(_db,
        "SELECT COUNT(*) FROM messages WHERE id = ? OR "
        "(from_node = ? AND to_node = ? AND text = ? AND ABS(timestamp - ?) < ?)");
    if (!st.ok()) {
        return false;
    }
    st.bindText(1, m.id);
    st.bindInt(2, m.from);
    st.bindInt(3, m.to);
    st.bindText(4, m.text);
    st.bindInt(5, m.timestamp);
    st.bindInt(6, DEDUP_WINDOW_MILLIS);
    if (st.step() != SQLITE_ROW) {
        return false;
    }
    *duplicate = sqlite3_column_int64(st.get(), 0) > 0;
    return true;
}

bool MessageStore::insertRow(const Message& m, bool ignoreConflict, bool* inserted) {
    Statement st(_db, ignoreConflict ?
        "INSERT OR IGNORE INTO messages (" MESSAGE_COLUMNS ") "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)" :
        "INSERT INTO messages (" MESSAGE_COLUMNS ") "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!st.ok()) {
        return false;
    }

    st.bindText(1, m.id);
    if (m.hasPacketId) st.bindInt(2, m.packetId); else st.bindNull(2);
    st.bindInt(3, m.from);
    st.bindInt(4, m.to);
    st.bindText(5, m.text);
    st.bindInt(6, m.timestamp);
    st.bindInt(7, m.isOutgoing ? 1 : 0);
    if (m.hasChannel) st.bindInt(8, m.channel); else st.bindNull(8);
    if (!m.status.empty()) st.bindText(9, m.status); else st.bindNull(9);
    st.bindText(10, messageTypeName(m.type));
    if (m.hasLocation) {
        st.bindDouble(11, m.location.latitude);
        st.bindDouble(12, m.location.longitude);
        if (m.location.hasAltitude) st.bindDouble(13, m.location.altitude); else st.bindNull(13);
        if (m.location.hasTime) st.bindInt(14, m.location.time); else st.bindNull(14);
    } else {
        st.bindNull(11);
        st.bindNull(12);
        st.bindNull(13);
        st.bindNull(14);
    }
    if (m.hasDualStatus) {
        st.bindText(15, radioStatusName(m.radioStatus));
        st.bindText(16, mqttStatusName(m.mqttStatus));
    } else {
        st.bindNull(15);
        st.bindNull(16);
    }

    if (st.step() != SQLITE_DONE) {
        return false;
    }
    *inserted = sqlite3_changes(_db) > 0;
    return true;
}

AddResult MessageStore::addMessage(const Message& message) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("addMessage");
        return ADD_FAILED;
    }

    bool duplicate = false;
    if (!isDuplicate(message, &duplicate)) {
        fail("addMessage");
        return ADD_FAILED;
    }
    if (duplicate) {
        MESH_LOGD(TAG, "duplicate of %s dropped", message.id.c_str());
        return ADD_DUPLICATE;
    }

    bool inserted = false;
    if (!insertRow(message, true, &inserted)) {
        fail("addMessage");
        return ADD_FAILED;
    }
    return inserted ? ADD_INSERTED : ADD_DUPLICATE;
}

std::vector<Message> MessageStore::query(const char* sql, const std::vector<int64_t>& args) {
    std::vector<Message> out;
    Statement st(_db, sql);
    if (!st.ok()) {
        fail("query");
        return out;
    }
    for (size_t i = 0; i < args.size(); i++) {
        st.bindInt((int)i + 1, args[i]);
    }
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
        out.push_back(rowToMessage(st.get()));
    }
    if (rc != SQLITE_DONE) {
        fail("query");
        out.clear();
        return out;
    }
    // Fetched newest first so the limit keeps the newest rows; present oldest first
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<Message> MessageStore::getMessages(size_t limit) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("getMessages");
        return std::vector<Message>();
    }
    std::vector<int64_t> args;
    args.push_back((int64_t)limit);
    return query("SELECT " MESSAGE_COLUMNS " FROM messages "
                 "ORDER BY timestamp DESC, rowid DESC LIMIT ?", args);
}

std::vector<Message> MessageStore::getMessagesByChat(uint32_t nodeNum, uint32_t myNodeNum, size_t limit) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("getMessagesByChat");
        return std::vector<Message>();
    }
    std::vector<int64_t> args;
    args.push_back(nodeNum);
    args.push_back(myNodeNum);
    args.push_back(myNodeNum);
    args.push_back(nodeNum);
    args.push_back((int64_t)limit);
    return query("SELECT " MESSAGE_COLUMNS " FROM messages "
                 "WHERE (from_node = ? AND to_node = ?) OR (from_node = ? AND to_node = ?) "
                 "ORDER BY timestamp DESC, rowid DESC LIMIT ?", args);
}

std::vector<Message> MessageStore::getMessagesByChannel(uint32_t channel, size_t limit) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("getMessagesByChannel");
        return std::vector<Message>();
    }
    std::vector<int64_t> args;
    args.push_back(channel);
    args.push_back((int64_t)BROADCAST_ADDR);
    args.push_back((int64_t)limit);
    return query("SELECT " MESSAGE_COLUMNS " FROM messages "
                 "WHERE channel = ? AND to_node = ? "
                 "ORDER BY timestamp DESC, rowid DESC LIMIT ?", args);
}

bool MessageStore::getMessageById(const std::string& id, Message* out) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        return false;
    }
    Statement st(_db, "SELECT " MESSAGE_COLUMNS " FROM messages WHERE id = ?");
    if (!st.ok()) {
        fail("getMessageById");
        return false;
    }
    st.bindText(1, id);
    if (st.step() != SQLITE_ROW) {
        return false;
    }
    if (out != nullptr) *out = rowToMessage(st.get());
    return true;
}

bool MessageStore::getMessageByPacketId(uint32_t packetId, Message* out) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        return false;
    }
    Statement st(_db, "SELECT " MESSAGE_COLUMNS " FROM messages WHERE packet_id = ? "
                      "ORDER BY timestamp DESC LIMIT 1");
    if (!st.ok()) {
        fail("getMessageByPacketId");
        return false;
    }
    st.bindInt(1, packetId);
    if (st.step() != SQLITE_ROW) {
        return false;
    }
    if (out != nullptr) *out = rowToMessage(st.get());
    return true;
}

int MessageStore::updateMessageStatus(uint32_t packetId, RadioStatus status) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("updateMessageStatus");
        return -1;
    }
    if (!exec("BEGIN;")) {
        fail("updateMessageStatus");
        return -1;
    }

    int changed = -1;
    {
        Statement st(_db,
            "UPDATE messages SET radio_status = ?, "
            "mqtt_status = COALESCE(mqtt_status, 'not_applicable') "
            "WHERE packet_id = ? AND " RADIO_RANK_SQL("COALESCE(radio_status, status)") " < ?");
        if (st.ok()) {
            st.bindText(1, radioStatusName(status));
            st.bindInt(2, packetId);
            st.bindInt(3, radioRank(status));
            if (st.step() == SQLITE_DONE) {
                changed = sqlite3_changes(_db);
            }
        }
    }
    if (changed > 0) {
        Statement derive(_db, DERIVE_STATUS_SQL);
        derive.bindInt(1, packetId);
        if (!derive.ok() || derive.step() != SQLITE_DONE) {
            changed = -1;
        }
    }

    if (changed < 0) {
        fail("updateMessageStatus");
        if (!exec("ROLLBACK;")) {
            MESH_LOGE(TAG, "rollback failed");
        }
        return -1;
    }
    if (!exec("COMMIT;")) {
        fail("updateMessageStatus");
        return -1;
    }
    if (changed == 0) {
        MESH_LOGD(TAG, "radio %s for %08X ignored (unknown or already final)",
                  radioStatusName(status), packetId);
    }
    return changed;
}

int MessageStore::updateMqttStatus(uint32_t packetId, MqttStatus status) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("updateMqttStatus");
        return -1;
    }
    if (status == MQTT_PENDING || status == MQTT_NOT_APPLICABLE) {
        return 0;  // both are initial states only
    }
    if (!exec("BEGIN;")) {
        fail("updateMqttStatus");
        return -1;
    }

    int changed = -1;
    {
        Statement st(_db, "UPDATE messages SET mqtt_status = ? "
                          "WHERE packet_id = ? AND mqtt_status = 'pending'");
        if (st.ok()) {
            st.bindText(1, mqttStatusName(status));
            st.bindInt(2, packetId);
            if (st.step() == SQLITE_DONE) {
                changed = sqlite3_changes(_db);
            }
        }
    }
    if (changed > 0) {
        Statement derive(_db, DERIVE_STATUS_SQL);
        derive.bindInt(1, packetId);
        if (!derive.ok() || derive.step() != SQLITE_DONE) {
            changed = -1;
        }
    }

    if (changed < 0) {
        fail("updateMqttStatus");
        if (!exec("ROLLBACK;")) {
            MESH_LOGE(TAG, "rollback failed");
        }
        return -1;
    }
    if (!exec("COMMIT;")) {
        fail("updateMqttStatus");
        return -1;
    }
    return changed;
}

int MessageStore::deleteOldMessages(size_t keepCount) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("deleteOldMessages");
        return -1;
    }
    Statement st(_db, "DELETE FROM messages WHERE id NOT IN ("
                      "SELECT id FROM messages ORDER BY timestamp DESC, rowid DESC LIMIT ?)");
    if (!st.ok()) {
        fail("deleteOldMessages");
        return -1;
    }
    st.bindInt(1, (int64_t)keepCount);
    if (st.step() != SQLITE_DONE) {
        fail("deleteOldMessages");
        return -1;
    }
    int deleted = sqlite3_changes(_db);
    if (deleted > 0) {
        MESH_LOGI(TAG, "trimmed %d old messages (keeping %u)", deleted, (unsigned)keepCount);
    }
    return deleted;
}

int MessageStore::importMessages(const std::vector<Message>& messages) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("importMessages");
        return -1;
    }
    if (!exec("BEGIN;")) {
        fail("importMessages");
        return -1;
    }

    int count = 0;
    for (size_t i = 0; i < messages.size(); i++) {
        bool inserted = false;
        if (!insertRow(messages[i], true, &inserted)) {
            fail("importMessages");
            if (!exec("ROLLBACK;")) {
                MESH_LOGE(TAG, "rollback failed");
            }
            return -1;
        }
        if (inserted) {
            count++;
        }
    }

    if (!exec("COMMIT;")) {
        fail("importMessages");
        return -1;
    }
    MESH_LOGI(TAG, "imported %d of %u messages", count, (unsigned)messages.size());
    return count;
}

int64_t MessageStore::getMessageCount() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("getMessageCount");
        return -1;
    }
    Statement st(_db, "SELECT COUNT(*) FROM messages");
    if (!st.ok() || st.step() != SQLITE_ROW) {
        fail("getMessageCount");
        return -1;
    }
    return sqlite3_column_int64(st.get(), 0);
}

/* ---------------------------------- Preferences ------------------------------------- */

bool MessageStore::putSetting(const char* key, const std::string& value) {
    Statement st(_db, "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)");
    if (!st.ok()) {
        return false;
    }
    st.bindText(1, key);
    st.bindText(2, value);
    return st.step() == SQLITE_DONE;
}

static std::string boolText(bool v) {
    return v ? "1" : "0";
}

bool MessageStore::savePrefs(const ClientPrefs& prefs) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr) {
        fail("savePrefs");
        return false;
    }
    if (!exec("BEGIN;")) {
        fail("savePrefs");
        return false;
    }

    char savedAt[24];
    snprintf(savedAt, sizeof(savedAt), "%lld", (long long)prefs.lastDeviceSavedAt);

    bool ok = putSetting("user.name", prefs.userName) &&
              putSetting("user.phone", prefs.userPhone) &&
              putSetting("gps.enabled", boolText(prefs.gpsEnabled)) &&
              putSetting("device.id", prefs.lastDeviceId) &&
              putSetting("device.name", prefs.lastDeviceName) &&
              putSetting("device.saved_at", savedAt) &&
              putSetting("mqtt.present", boolText(prefs.hasMqtt));
    if (ok && prefs.hasMqtt) {
        const MqttSettings& m = prefs.mqtt;
        ok = putSetting("mqtt.enabled", boolText(m.enabled)) &&
             putSetting("mqtt.address", m.address) &&
             putSetting("mqtt.username", m.username) &&
             putSetting("mqtt.password", m.password) &&
             putSetting("mqtt.encryption", boolText(m.encryptionEnabled)) &&
             putSetting("mqtt.json", boolText(m.jsonEnabled)) &&
             putSetting("mqtt.tls", boolText(m.tlsEnabled)) &&
             putSetting("mqtt.map_reporting", boolText(m.mapReportingEnabled)) &&
             putSetting("mqtt.root", m.root) &&
             putSetting("mqtt.proxy_to_client", boolText(m.proxyToClientEnabled));
    }

    if (!ok) {
        fail("savePrefs");
        if (!exec("ROLLBACK;")) {
            MESH_LOGE(TAG, "rollback failed");
        }
        return false;
    }
    if (!exec("COMMIT;")) {
        fail("savePrefs");
        return false;
    }
    return true;
}

bool MessageStore::loadPrefs(ClientPrefs* prefs) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db == nullptr || prefs == nullptr) {
        return false;
    }
    Statement st(_db, "SELECT key, value FROM settings");
    if (!st.ok()) {
        fail("loadPrefs");
        return false;
    }

    ClientPrefs p;
    bool any = false;
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
        std::string key = columnText(st.get(), 0);
        std::string value = columnText(st.get(), 1);
        any = true;
        if (key == "user.name") p.userName = value;
        else if (key == "user.phone") p.userPhone = value;
        else if (key == "gps.enabled") p.gpsEnabled = value == "1";
        else if (key == "device.id") p.lastDeviceId = value;
        else if (key == "device.name") p.lastDeviceName = value;
        else if (key == "device.saved_at") p.lastDeviceSavedAt = strtoll(value.c_str(), nullptr, 10);
        else if (key == "mqtt.present") p.hasMqtt = value == "1";
        else if (key == "mqtt.enabled") p.mqtt.enabled = value == "1";
        else if (key == "mqtt.address") p.mqtt.address = value;
        else if (key == "mqtt.username") p.mqtt.username = value;
        else if (key == "mqtt.password") p.mqtt.password = value;
        else if (key == "mqtt.encryption") p.mqtt.encryptionEnabled = value == "1";
        else if (key == "mqtt.json") p.mqtt.jsonEnabled = value == "1";
        else if (key == "mqtt.tls") p.mqtt.tlsEnabled = value == "1";
        else if (key == "mqtt.map_reporting") p.mqtt.mapReportingEnabled = value == "1";
        else if (key == "mqtt.root") p.mqtt.root = value;
        else if (key == "mqtt.proxy_to_client") p.mqtt.proxyToClientEnabled = value == "1";
    }
    if (rc != SQLITE_DONE) {
        fail("loadPrefs");
        return false;
    }
    if (!any) {
        return false;
    }
    *prefs = p;
    return true;
}
