/**
 * mesh_config.h - Compile-time configuration for meshlink
 * 
 * Every value can be overridden with a -D build flag.
 */

#ifndef MESH_CONFIG_H
#define MESH_CONFIG_H

/* ---------------------------------- CONFIGURATION ------------------------------------- */

#define MESHLINK_VERSION_TEXT   "meshlink 1.0 (protocol core)"

// Node address meaning "everyone on the channel"
#define BROADCAST_ADDR          0xFFFFFFFFu

// Device settle delays after an MQTT module config write
#ifndef MQTT_SETTLE_MILLIS
  #define MQTT_SETTLE_MILLIS        3000    // device may restart its network stack
#endif
#ifndef MQTT_EXTRA_SETTLE_MILLIS
  #define MQTT_EXTRA_SETTLE_MILLIS  2000    // second wait when the first check finds the device disconnected
#endif

// Gap between consecutive channel admin writes
#ifndef CHANNEL_WRITE_GAP_MILLIS
  #define CHANNEL_WRITE_GAP_MILLIS  500
#endif

// Optimistic owner/channel writes not echoed back within this window are marked failed
#ifndef OVERLAY_CONFIRM_MILLIS
  #define OVERLAY_CONFIRM_MILLIS    30000
#endif

// Two messages with equal from/to/text closer than this are the same message
#ifndef DEDUP_WINDOW_MILLIS
  #define DEDUP_WINDOW_MILLIS       5000
#endif

// Outgoing packets awaiting a routing response; the oldest is dropped beyond this
// and a late ACK for it is still resolved through the store
#ifndef MAX_IN_FLIGHT_PACKETS
  #define MAX_IN_FLIGHT_PACKETS     64
#endif

#ifndef MAX_STORED_MESSAGES
  #define MAX_STORED_MESSAGES       500
#endif
#define DEFAULT_HISTORY_LIMIT       500     // getMessages()
#define DEFAULT_CHAT_LIMIT          100     // getMessagesByChat() / getMessagesByChannel()

#define MAX_CHANNELS                8       // indices 0..7, 0 is primary
#define SHORT_NAME_MAX_LEN          4
#define CHANNEL_NAME_MAX_LEN        11
#define FULL_POSITION_PRECISION     32

// Envelope buffer sizes (bytes before base64 framing)
#define TO_RADIO_MAX_BYTES          512
#define FROM_RADIO_MAX_BYTES        512
#define ADMIN_PAYLOAD_MAX_BYTES     233     // Data.payload limit

#define DEFAULT_MQTT_ROOT           "msh"
#define CHANNEL_URL_PREFIX          "https://meshtastic.org/e/#"
#define CHANNEL_URL_MARKER          "meshtastic.org/e/#"

/* --------------------------------End of configuration------------------------------------ */

#endif // MESH_CONFIG_H
