/**
 * message_store.h - Persistent message history for meshlink (SQLite)
 * 
 * One `messages` table keyed by the application message id, indexed for the
 * three conversation queries. The schema is versioned with PRAGMA
 * user_version and migrated forward on open:
 * 
 *   v1  messages table and indexes
 *   v2  radio_status / mqtt_status columns (dual delivery tracking)
 *   v3  settings table (client preferences)
 * 
 * Writes are deduplicated: a message with the same from/to/text as a stored
 * one within DEDUP_WINDOW_MILLIS, or with an existing id, is dropped without
 * error.
 * 
 * Status updates are keyed by radio packet id and never move a row out of a
 * terminal state (delivered/failed) or backwards (sent -> pending). The legacy
 * `status` column is rewritten from the dual fields on every update.
 * 
 * All methods are thread safe. Failures are reported through the ErrorSink
 * as ERR_STORE and surface as a false/-1/empty result.
 */

#ifndef MESSAGE_STORE_H
#define MESSAGE_STORE_H

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "mesh_config.h"
#include "mesh_errors.h"
#include "mesh_types.h"

struct sqlite3;

#define STORE_SCHEMA_VERSION  3

enum AddResult {
    ADD_INSERTED,
    ADD_DUPLICATE,
    ADD_FAILED
};

class MessageStore {
public:
    explicit MessageStore(const ErrorSink& onError = ErrorSink());
    ~MessageStore();

    /**
     * Open (or create) the database and run pending migrations.
     * 
     * @param path File path, or ":memory:"
     * @return true if the store is ready
     */
    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    /** Current PRAGMA user_version, -1 if closed */
    int schemaVersion();

    /**
     * Insert a message unless it duplicates a stored one.
     */
    AddResult addMessage(const Message& message);

    /**
     * Most recent messages across all conversations, ascending by timestamp
     */
    std::vector<Message> getMessages(size_t limit = DEFAULT_HISTORY_LIMIT);

    /**
     * Direct conversation between nodeNum and the local node, ascending
     */
    std::vector<Message> getMessagesByChat(uint32_t nodeNum, uint32_t myNodeNum,
                                           size_t limit = DEFAULT_CHAT_LIMIT);

    /**
     * Broadcast messages on one channel, ascending
     */
    std::vector<Message> getMessagesByChannel(uint32_t channel, size_t limit = DEFAULT_CHAT_LIMIT);

    bool getMessageById(const std::string& id, Message* out);
    bool getMessageByPacketId(uint32_t packetId, Message* out);

    /**
     * Advance the radio track of the row(s) with this packet id.
     * 
     * @return rows changed (0 if none matched or the update was a
     *         regression), -1 on error
     */
    int updateMessageStatus(uint32_t packetId, RadioStatus status);

    /**
     * Advance the MQTT track. Rows whose MQTT track is not_applicable or
     * already terminal are left alone.
     */
    int updateMqttStatus(uint32_t packetId, MqttStatus status);

    /**
     * Keep the keepCount most recent messages, delete the rest.
     * @return rows deleted, -1 on error
     */
    int deleteOldMessages(size_t keepCount = MAX_STORED_MESSAGES);

    /**
     * Bulk insert-or-ignore by id, in one transaction. Rows already present
     * are kept as they are.
     * @return rows inserted, -1 on error (nothing inserted)
     */
    int importMessages(const std::vector<Message>& messages);

    /** Number of stored messages, -1 on error */
    int64_t getMessageCount();

    bool savePrefs(const ClientPrefs& prefs);

    /**
     * @return false if no preferences were saved yet
     */
    bool loadPrefs(ClientPrefs* prefs);

private:
    sqlite3* _db;
    std::mutex _mutex;
    ErrorSink _onError;

    bool migrate();
    bool exec(const char* sql);
    int userVersion();
    void fail(const char* op);
    std::vector<Message> query(const char* sql, const std::vector<int64_t>& args);
    bool insertRow(const Message& m, bool ignoreConflict, bool* inserted);
    bool isDuplicate(const Message& m, bool* duplicate);
    bool putSetting(const char* key, const std::string& value);
};

#endif // MESSAGE_STORE_H
