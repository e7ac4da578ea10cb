#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "mesh_config.h"
#include "mesh_types.h"
#include "mesh_errors.h"
#include "mesh_clock.h"
#include "mesh_codec.h"
#include "mesh_enums.h"
#include "mesh_log.h"
#include "random_source.h"
#include "base64.h"
#include "device_link.h"
#include "frame_writer.h"
#include "node_db.h"
#include "channel_table.h"
#include "message_store.h"
#include "delivery_tracker.h"
#include "config_reconciler.h"
#include "channel_manager.h"
#include "chat_session.h"

/* ---------------------------------- CONFIGURATION ------------------------------------- */

#ifndef DEFAULT_DB_PATH
  #define DEFAULT_DB_PATH     "meshlink.db"
#endif

#define LOOP_POLL_MILLIS      100     // stdin poll timeout between loop() ticks
#define COMMAND_MAX_LEN       1024
#define HISTORY_SHOW_DEFAULT  20

/* --------------------------------End of configuration------------------------------------ */

static uint32_t parseNodeNum(const char* sp) {
  while (*sp == ' ') sp++;
  if (*sp == '!') return (uint32_t)strtoul(sp + 1, nullptr, 16);   // !a1b2c3d4 form
  if (memcmp(sp, "0x", 2) == 0) return (uint32_t)strtoul(sp + 2, nullptr, 16);
  return (uint32_t)strtoul(sp, nullptr, 10);
}

static std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// Outbound frames go to stdout as "TX <base64>", for a BLE bridge to pick up
class StdioLink : public DeviceLink {
  bool _connected;
  bool _polling;

public:
  StdioLink() : _connected(true), _polling(true) { }

  bool writeToDevice(const std::string& base64Payload) override {
    if (!_connected) return false;
    printf("TX %s\n", base64Payload.c_str());
    fflush(stdout);
    return !ferror(stdout);
  }

  bool isDeviceConnected() override { return _connected; }
  void stopPolling() override { _polling = false; }
  void startPolling() override { _polling = true; }

  void setConnected(bool connected) { _connected = connected; }
  bool polling() const { return _polling; }
};

class MeshConsole : public ChatSessionListener {
  SystemClock _clock;
  OpenSslRandom _rng;
  StdioLink _link;
  MeshCodec _codec;
  FrameWriter _writer;
  NodeDb _nodes;
  ChannelTable _table;
  MessageStore _store;
  DeliveryTracker _tracker;
  ConfigReconciler _config;
  ChannelManager _channels;
  ChatSession _session;

  ClientPrefs _prefs;
  bool _chatIsChannel;
  uint32_t _chatId;     // node number, or channel index
  char command[COMMAND_MAX_LEN];
  size_t command_len;

  void reportError(const MeshError& err) {
    printf("   ERROR (%s): %s\n", meshErrorKindName(err.kind), err.message.c_str());
  }

  std::string nodeName(uint32_t nodeNum) {
    if (nodeNum == BROADCAST_ADDR) return "^all";
    NodeInfo n;
    if (_nodes.get(nodeNum, &n) && n.hasUser && !n.shortName.empty()) return n.shortName;
    char buf[12];
    snprintf(buf, sizeof(buf), "!%08x", nodeNum);
    return buf;
  }

  void printMessage(const Message& m) {
    time_t secs = (time_t)(m.timestamp / 1000);
    struct tm tmv;
    localtime_r(&secs, &tmv);
    std::string status = DeliveryTracker::displayStatus(m);
    char where[8] = "";
    if (m.isChannelMessage()) snprintf(where, sizeof(where), " #%u", m.channel);
    printf("   [%02d:%02d] %s -> %s%s: %s", tmv.tm_hour, tmv.tm_min, nodeName(m.from).c_str(),
           nodeName(m.to).c_str(), where, m.type == MSG_LOCATION ? "" : m.text.c_str());
    if (m.type == MSG_LOCATION && m.hasLocation) {
      printf("location %.6f,%.6f", m.location.latitude, m.location.longitude);
    }
    if (!status.empty()) printf("  (%s)", status.c_str());
    printf("\n");
  }

  // Push saved owner/MQTT settings; writes are skipped when the device already matches
  void applyPrefs() {
    if (!_prefs.userName.empty()) {
      _config.setOwner(_prefs.userName, ConfigReconciler::generateShortName(_prefs.userName), false);
    }
    if (_prefs.hasMqtt) {
      _config.setMqttConfig(_prefs.mqtt, false);
    }
    _channels.ensureChannelSettings(_table.effective());
  }

  void savePrefs() {
    if (!_store.savePrefs(_prefs)) {
      printf("   ERROR: unable to save preferences\n");
    }
  }

  void sendToChat(const char* text) {
    uint32_t to = _chatIsChannel ? BROADCAST_ADDR : _chatId;
    uint32_t channel = _chatIsChannel ? _chatId : 0;
    Message m;
    if (_session.sendText(text, to, channel, &m)) {
      printf("   (sent, packet %08x)\n", m.packetId);
    } else {
      printf("   ERROR: unable to send.\n");
    }
  }

  // "<lat> <lon> [alt]"
  bool parseLocation(const char* args, double* lat, double* lon, bool* hasAlt, double* alt) {
    int n = sscanf(args, "%lf %lf %lf", lat, lon, alt);
    *hasAlt = n == 3;
    return n >= 2;
  }

  void importFrom(const char* path) {
    MessageStore other;
    if (!other.open(path)) {
      printf("   ERROR: cannot open %s\n", path);
      return;
    }
    int64_t total = other.getMessageCount();
    std::vector<Message> rows = other.getMessages(total > 0 ? (size_t)total : 0);
    int n = _store.importMessages(rows);
    if (n < 0) {
      printf("   ERROR: import failed\n");
    } else {
      printf("   imported %d of %u messages\n", n, (unsigned)rows.size());
    }
  }

  void mqttCommand(const char* args) {
    MqttSettings s = _prefs.hasMqtt ? _prefs.mqtt : MqttSettings();
    MqttSettings device;
    if (!_prefs.hasMqtt && _config.getMqttConfig(&device)) {
      s = device;
    }

    if (strcmp(args, "show") == 0 || *args == 0) {
      if (_config.getMqttConfig(&device)) {
        printf("   device: enabled=%d address='%s' user='%s' tls=%d enc=%d proxy=%d root=%s\n",
               device.enabled, device.address.c_str(), device.username.c_str(), device.tlsEnabled,
               device.encryptionEnabled, device.proxyToClientEnabled, device.root.c_str());
      } else {
        printf("   device: (not reported yet)\n");
      }
      printf("   state: %s%s\n", syncStateName(_config.mqttState()),
             _config.pollingResumeOwed() ? ", polling resume owed" : "");
      return;
    }

    bool force = false;
    if (memcmp(args, "force ", 6) == 0) {
      force = true;
      args += 6;
    }

    if (memcmp(args, "on ", 3) == 0) {
      char address[128] = "", user[64] = "", pass[64] = "";
      int n = sscanf(&args[3], "%127s %63s %63s", address, user, pass);
      if (n < 1) {
        printf("   ERROR: usage: mqtt on <address> [user] [pass]\n");
        return;
      }
      s.enabled = true;
      s.address = address;
      if (n >= 2) s.username = user;
      if (n >= 3) s.password = pass;
    } else if (strcmp(args, "off") == 0) {
      s.enabled = false;
    } else if (strcmp(args, "proxy on") == 0) {
      s.proxyToClientEnabled = true;
    } else if (strcmp(args, "proxy off") == 0) {
      s.proxyToClientEnabled = false;
    } else if (strcmp(args, "tls on") == 0 || strcmp(args, "tls off") == 0) {
      s.tlsEnabled = args[5] == 'n';
    } else if (memcmp(args, "root ", 5) == 0) {
      s.root = trim(&args[5]);
    } else {
      printf("   ERROR: unknown mqtt option: %s\n", args);
      return;
    }

    _prefs.hasMqtt = true;
    _prefs.mqtt = s;
    savePrefs();
    if (_config.setMqttConfig(s, force)) {
      printf("   OK%s\n", _config.mqttWriteInProgress() ? " - waiting for device to settle" : " - already set");
    }
  }

public:
  MeshConsole()
    : _codec(_rng, _clock),
      _writer(_link),
      _store([this](const MeshError& e) { reportError(e); }),
      _tracker(_store),
      _config(_codec, _writer, _nodes, _clock, [this](const MeshError& e) { reportError(e); }),
      _channels(_codec, _writer, _nodes, _table, _rng, _clock, [this](const MeshError& e) { reportError(e); }),
      _session(_codec, _writer, _nodes, _store, _tracker, _config, _channels, _clock,
               [this](const MeshError& e) { reportError(e); }),
      _chatIsChannel(true), _chatId(0), command_len(0) {
    command[0] = 0;
  }

  bool begin(const char* dbPath, uint32_t nodeNum) {
    if (!_store.open(dbPath)) {
      return false;
    }
    if (!_store.loadPrefs(&_prefs)) {
      _prefs = ClientPrefs();
    }
    if (nodeNum != 0) {
      _nodes.setMyNodeNum(nodeNum);
    }
    _session.setListener(this);
    return true;
  }

  void showWelcome() {
    printf("===== meshlink Terminal =====\n\n");
    printf("%s\n", MESHLINK_VERSION_TEXT);
    printf("   %lld messages stored\n", (long long)_store.getMessageCount());
    if (!_prefs.userName.empty()) printf("   user: %s\n", _prefs.userName.c_str());
    printf("   (enter 'help' for basic commands)\n\n");
    fflush(stdout);
  }

  void start() {
    _session.requestConfig();
  }

  void onMessage(const Message& message) override {
    if (!message.isOutgoing) printMessage(message);
  }

  void onStatusChanged(const Message& message) override {
    printf("   packet %08x: %s\n", message.packetId, DeliveryTracker::displayStatus(message).c_str());
  }

  void onConfigComplete() override {
    printf("   (device config received, %u nodes, %u channels)\n",
           (unsigned)_nodes.size(), (unsigned)_table.effective().size());
    applyPrefs();
  }

  void onData(const PacketHeader& packet, uint32_t portnum, const std::vector<uint8_t>& payload) override {
    printf("   %s from %s, %u bytes\n", MeshEnums::portNum(portnum).c_str(),
           nodeName(packet.from).c_str(), (unsigned)payload.size());
  }

  void handleCommand(const char* command) {
    while (*command == ' ') command++;  // skip leading spaces

    if (memcmp(command, "rx ", 3) == 0) {   // inbound FromRadio frame from the BLE bridge
      _session.handleInbound(trim(&command[3]));
    } else if (memcmp(command, "send ", 5) == 0) {
      sendToChat(&command[5]);
    } else if (memcmp(command, "to ", 3) == 0) {   // select direct chat
      _chatIsChannel = false;
      _chatId = parseNodeNum(&command[3]);
      printf("   Chat with %s selected.\n", nodeName(_chatId).c_str());
    } else if (strcmp(command, "to") == 0) {
      if (_chatIsChannel) {
        printf("   Current: channel %u\n", _chatId);
      } else {
        printf("   Current: %s\n", nodeName(_chatId).c_str());
      }
    } else if (memcmp(command, "channel ", 8) == 0) {   // select channel chat
      int idx = atoi(&command[8]);
      if (idx < 0 || idx >= MAX_CHANNELS) {
        printf("   ERROR: channel must be 0..%d\n", MAX_CHANNELS - 1);
      } else {
        _chatIsChannel = true;
        _chatId = (uint32_t)idx;
        printf("   Channel %d selected.\n", idx);
      }
    } else if (memcmp(command, "loc ", 4) == 0) {   // location as a chat message
      double lat, lon, alt;
      bool hasAlt;
      if (!parseLocation(&command[4], &lat, &lon, &hasAlt, &alt)) {
        printf("   ERROR: usage: loc <lat> <lon> [alt]\n");
      } else if (_session.sendLocation(lat, lon, hasAlt, alt, _chatIsChannel ? BROADCAST_ADDR : _chatId,
                                       _chatIsChannel ? _chatId : 0, nullptr)) {
        printf("   (location sent)\n");
      }
    } else if (memcmp(command, "pos ", 4) == 0) {   // position for the node to broadcast
      double lat, lon, alt;
      bool hasAlt;
      if (!parseLocation(&command[4], &lat, &lon, &hasAlt, &alt)) {
        printf("   ERROR: usage: pos <lat> <lon> [alt]\n");
      } else if (_session.broadcastPosition(lat, lon, hasAlt, alt)) {
        printf("   OK\n");
      }
    } else if (memcmp(command, "history", 7) == 0) {
      size_t n = HISTORY_SHOW_DEFAULT;
      if (command[7] == ' ') n = (size_t)atoi(&command[8]);
      std::vector<Message> msgs = _store.getMessages(n);
      for (size_t i = 0; i < msgs.size(); i++) printMessage(msgs[i]);
    } else if (strcmp(command, "chat") == 0) {
      std::vector<Message> msgs = _chatIsChannel
          ? _store.getMessagesByChannel(_chatId)
          : _store.getMessagesByChat(_chatId, _nodes.myNodeNum());
      for (size_t i = 0; i < msgs.size(); i++) printMessage(msgs[i]);
    } else if (memcmp(command, "owner ", 6) == 0) {
      bool force = memcmp(&command[6], "force ", 6) == 0;
      std::string name = trim(&command[force ? 12 : 6]);
      std::string shortName = ConfigReconciler::generateShortName(name);
      _prefs.userName = name;
      savePrefs();
      if (_config.setOwner(name, shortName, force)) {
        printf("   OK (%s / %s)\n", name.c_str(), ConfigReconciler::normalizeShortName(shortName).c_str());
      }
    } else if (memcmp(command, "short ", 6) == 0) {
      std::string longName;
      if (!_config.getOwner(&longName, nullptr)) longName = _prefs.userName;
      if (_config.setOwner(longName, trim(&command[6]), false)) {
        printf("   OK\n");
      }
    } else if (memcmp(command, "mqtt", 4) == 0) {
      mqttCommand(command[4] == ' ' ? &command[5] : "");
    } else if (memcmp(command, "addch ", 6) == 0) {   // add from a share link
      Channel ch;
      if (_channels.parseChannelUrl(trim(&command[6]), &ch)) {
        int idx = _channels.addChannelFromQR(ch.name, ch.psk, ch.uplinkEnabled, ch.downlinkEnabled);
        if (idx > 0) printf("   Channel '%s' added at slot %d\n", ch.name.c_str(), idx);
      }
    } else if (memcmp(command, "delch ", 6) == 0) {
      if (_channels.deleteChannel((uint8_t)atoi(&command[6]))) printf("   OK\n");
    } else if (memcmp(command, "url", 3) == 0) {
      uint8_t idx = command[3] == ' ' ? (uint8_t)atoi(&command[4]) : (uint8_t)(_chatIsChannel ? _chatId : 0);
      Channel ch;
      std::string url;
      if (!_table.get(idx, &ch)) {
        printf("   ERROR: channel %u unknown\n", idx);
      } else if (_channels.getChannelUrl(ch, &url)) {
        printf("   %s\n", url.c_str());
      }
    } else if (memcmp(command, "psk", 3) == 0) {
      size_t len = command[3] == ' ' ? (size_t)atoi(&command[4]) : 32;
      std::vector<uint8_t> key;
      if (_channels.generatePsk(len, key)) {
        printf("   %s\n", Base64::encodeToString(&key[0], key.size()).c_str());
      }
    } else if (memcmp(command, "import ", 7) == 0) {
      importFrom(trim(&command[7]).c_str());
    } else if (strcmp(command, "ensure") == 0) {
      size_t n = _channels.ensureChannelSettings(_table.effective());
      printf("   %u channel update(s) queued\n", (unsigned)n);
    } else if (memcmp(command, "trim", 4) == 0) {
      size_t keep = command[4] == ' ' ? (size_t)atoi(&command[5]) : MAX_STORED_MESSAGES;
      int n = _store.deleteOldMessages(keep);
      if (n >= 0) printf("   %d deleted\n", n);
    } else if (strcmp(command, "nodes") == 0) {
      std::vector<NodeInfo> all = _nodes.all();
      for (size_t i = 0; i < all.size(); i++) {
        const NodeInfo& n = all[i];
        printf("   !%08x %-4s %-24s %s%s\n", n.nodeNum, n.shortName.c_str(), n.longName.c_str(),
               n.hwModel.c_str(), n.nodeNum == _nodes.myNodeNum() ? "  (self)" : "");
      }
    } else if (strcmp(command, "channels") == 0) {
      std::vector<Channel> all = _table.effective();
      for (size_t i = 0; i < all.size(); i++) {
        const Channel& c = all[i];
        if (c.role == CHANNEL_DISABLED) continue;
        printf("   %u %-11s %-9s %s up=%d down=%d prec=%u [%s]\n", c.index, c.name.c_str(),
               channelRoleName(c.role), c.hasEncryption() ? "enc" : "open", c.uplinkEnabled,
               c.downlinkEnabled, c.positionPrecision, syncStateName(_table.syncState(c.index)));
      }
    } else if (strcmp(command, "config") == 0) {
      _session.requestConfig();
    } else if (strcmp(command, "link down") == 0) {
      _link.setConnected(false);
    } else if (strcmp(command, "link up") == 0) {
      _link.setConnected(true);
      if (_config.resumePolling()) printf("   (polling resumed)\n");
    } else if (memcmp(command, "ver", 3) == 0) {
      printf("%s\n", MESHLINK_VERSION_TEXT);
    } else if (memcmp(command, "help", 4) == 0) {
      printf("Commands:\n");
      printf("   rx <base64 FromRadio frame>\n");
      printf("   to <node num|!hex>\n");
      printf("   to\n");
      printf("   channel <n>\n");
      printf("   send <text>\n");
      printf("   loc <lat> <lon> [alt]\n");
      printf("   pos <lat> <lon> [alt]\n");
      printf("   history {n}\n");
      printf("   chat\n");
      printf("   owner [force] <long name>\n");
      printf("   short <short name>\n");
      printf("   mqtt [force] {show|on <addr> [user] [pass]|off|proxy on|proxy off|tls on|tls off|root <r>}\n");
      printf("   addch <channel link>\n");
      printf("   delch <n>\n");
      printf("   url {n}\n");
      printf("   psk {16|32}\n");
      printf("   import <db file>\n");
      printf("   ensure\n");
      printf("   trim {keep}\n");
      printf("   nodes\n");
      printf("   channels\n");
      printf("   config\n");
      printf("   link {up|down}\n");
    } else {
      printf("   ERROR: unknown command: %s\n", command);
    }
    fflush(stdout);
  }

  // Reads what is available on stdin without blocking past the poll timeout
  bool checkInput() {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    int rc = poll(&pfd, 1, LOOP_POLL_MILLIS);
    if (rc <= 0) return true;

    char c;
    ssize_t n = read(STDIN_FILENO, &c, 1);
    if (n <= 0) return false;   // EOF

    if (c == '\n' || c == '\r') {
      command[command_len] = 0;
      if (command_len > 0) handleCommand(command);
      command_len = 0;
    } else if (command_len < sizeof(command) - 1) {
      command[command_len++] = c;
    }
    return true;
  }

  void loop() {
    _session.loop();
  }
};

static void usage(const char* prog) {
  fprintf(stderr, "usage: %s [--db PATH] [--node NUM] [--verbose]\n", prog);
}

int main(int argc, char** argv) {
  const char* dbPath = DEFAULT_DB_PATH;
  uint32_t nodeNum = 0;

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
      dbPath = argv[++i];
    } else if (strcmp(argv[i], "--node") == 0 && i + 1 < argc) {
      nodeNum = parseNodeNum(argv[++i]);
    } else if (strcmp(argv[i], "--verbose") == 0) {
      MeshLog::setLevel(MESHLINK_LOG_DEBUG);
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  MeshConsole console;
  if (!console.begin(dbPath, nodeNum)) {
    fprintf(stderr, "cannot open message store %s\n", dbPath);
    return 1;
  }
  console.showWelcome();
  console.start();

  while (console.checkInput()) {
    console.loop();
  }
  return 0;
}
