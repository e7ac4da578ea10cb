/**
 * config_reconciler.cpp - Converges device configuration with minimal writes
 * 
 */

#include "config_reconciler.h"

#include <cctype>
#include <vector>

#include "mesh_log.h"

#define TAG "Config"

// Length of the UTF-8 sequence starting with c (1 for stray continuation bytes)
static size_t utf8SeqLen(unsigned char c) {
    if (c >= 0xF0) return 4;
    if (c >= 0xE0) return 3;
    if (c >= 0xC0) return 2;
    return 1;
}

// First maxChars characters of s, ASCII letters uppercased
static std::string upperPrefix(const std::string& s, size_t maxChars) {
    std::string out;
    size_t i = 0;
    for (size_t n = 0; n < maxChars && i < s.size(); n++) {
        size_t len = utf8SeqLen((unsigned char)s[i]);
        if (len == 1) {
            out += (char)toupper((unsigned char)s[i]);
        } else {
            out += s.substr(i, len);
        }
        i += len;
    }
    return out;
}

ConfigReconciler::ConfigReconciler(MeshCodec& codec, FrameWriter& writer, NodeDb& nodes,
                                   MeshClock& clock, const ErrorSink& onError)
    : _codec(codec), _writer(writer), _nodes(nodes), _clock(clock), _onError(onError),
      _ownerState(SYNC_UNKNOWN), _ownerPending(false), _ownerWrittenAt(0),
      _mqttState(SYNC_UNKNOWN), _hasMqtt(false), _mqttPhase(MQTT_IDLE), _mqttDeadline(0),
      _pollingOwed(false), _hasMetadata(false) {
}

void ConfigReconciler::dispatch(const MeshError& err) {
    MESH_LOGE(TAG, "%s in %s: %s", meshErrorKindName(err.kind), err.section.c_str(), err.message.c_str());
    if (_onError) {
        _onError(err);
    }
}

std::string ConfigReconciler::generateShortName(const std::string& longName) {
    std::vector<std::string> words;
    std::string word;
    for (size_t i = 0; i < longName.size(); i++) {
        if (isspace((unsigned char)longName[i])) {
            if (!word.empty()) {
                words.push_back(word);
                word.clear();
            }
        } else {
            word += longName[i];
        }
    }
    if (!word.empty()) {
        words.push_back(word);
    }

    if (words.size() >= 2) {
        std::string initials;
        for (size_t i = 0; i < words.size(); i++) {
            std::string initial = upperPrefix(words[i], 1);
            if (initials.size() + initial.size() > SHORT_NAME_MAX_LEN) {
                break;
            }
            initials += initial;
        }
        return initials;
    }
    return words.empty() ? std::string() : normalizeShortName(upperPrefix(words[0], SHORT_NAME_MAX_LEN));
}

std::string ConfigReconciler::normalizeShortName(const std::string& shortName) {
    size_t end = 0;
    while (end < shortName.size()) {
        size_t len = utf8SeqLen((unsigned char)shortName[end]);
        if (end + len > SHORT_NAME_MAX_LEN) {
            break;
        }
        end += len;
    }
    return shortName.substr(0, end);
}

bool ConfigReconciler::sendAdmin(const AdminPayload& payload, const char* what, MeshError* err) {
    uint32_t self = _nodes.myNodeNum();
    EncodedFrame frame;
    if (!_codec.encodeAdminMessage(payload.bytes, payload.len, self, self, &frame, err)) {
        return false;
    }
    return _writer.write(frame, what, err);
}

/* ---------------------------------- Owner ------------------------------------- */

bool ConfigReconciler::ownerMatches(const std::string& longName, const std::string& shortName) const {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_ownerPending) {
            return _pendingLong == longName && _pendingShort == shortName;
        }
    }
    NodeInfo self;
    if (!_nodes.getSelf(&self) || !self.hasUser) {
        MESH_LOGD(TAG, "owner check: no device report yet");
        return false;
    }
    return self.longName == longName && self.shortName == shortName;
}

bool ConfigReconciler::setOwner(const std::string& longName, const std::string& shortName, bool force) {
    if (!_nodes.hasMyNodeNum()) {
        dispatch(MeshError(ERR_VALIDATION, "Owner", "local node number not known yet"));
        return false;
    }

    std::string shortNorm = normalizeShortName(shortName);
    if (!force && ownerMatches(longName, shortNorm)) {
        MESH_LOGD(TAG, "owner '%s'/'%s' already on device, skipped", longName.c_str(), shortNorm.c_str());
        return true;
    }

    AdminPayload payload;
    MeshError err;
    if (!MeshAdmin::buildSetOwner(longName, shortNorm, &payload, &err)) {
        dispatch(err);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _ownerState = SYNC_PENDING_WRITE;
    }
    MESH_LOGI(TAG, "writing owner '%s'/'%s'%s", longName.c_str(), shortNorm.c_str(), force ? " (forced)" : "");
    if (!sendAdmin(payload, "owner", &err)) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _ownerState = SYNC_FAILED;
        }
        dispatch(err);
        return false;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _ownerPending = true;
    _pendingLong = longName;
    _pendingShort = shortNorm;
    _ownerWrittenAt = _clock.getMillis();
    return true;
}

bool ConfigReconciler::getOwner(std::string* longName, std::string* shortName) const {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_ownerPending) {
            if (longName) *longName = _pendingLong;
            if (shortName) *shortName = _pendingShort;
            return true;
        }
    }
    NodeInfo self;
    if (!_nodes.getSelf(&self) || !self.hasUser) {
        return false;
    }
    if (longName) *longName = self.longName;
    if (shortName) *shortName = self.shortName;
    return true;
}

void ConfigReconciler::onNodeInfo(const NodeInfo& node) {
    _nodes.upsert(node);
    if (node.nodeNum != _nodes.myNodeNum() || !node.hasUser) {
        return;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_ownerPending) {
        _ownerState = SYNC_SYNCED;
        return;
    }
    if (node.longName == _pendingLong && node.shortName == _pendingShort) {
        MESH_LOGI(TAG, "owner write confirmed");
        _ownerPending = false;
        _ownerState = SYNC_SYNCED;
    } else {
        MESH_LOGD(TAG, "owner report '%s' differs from pending write, waiting", node.longName.c_str());
    }
}

/* ---------------------------------- MQTT ------------------------------------- */

bool ConfigReconciler::setMqttConfig(const MqttSettings& settings, bool force) {
    if (!_nodes.hasMyNodeNum()) {
        dispatch(MeshError(ERR_VALIDATION, "MQTT", "local node number not known yet"));
        return false;
    }
    if (settings.enabled && settings.address.empty()) {
        dispatch(MeshError(ERR_VALIDATION, "MQTT", "MQTT enabled without a broker address"));
        return false;
    }

    bool busy;
    bool matches;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        busy = _mqttPhase != MQTT_IDLE;
        matches = _hasMqtt && _mqtt.sameUserFields(settings);
    }
    if (busy) {
        dispatch(MeshError(ERR_CONFIG_CONFLICT, "MQTT", "an MQTT config write is still settling"));
        return false;
    }
    if (!force && matches) {
        MESH_LOGD(TAG, "mqtt config already on device, skipped");
        return true;
    }

    AdminPayload payload;
    MeshError err;
    if (!MeshAdmin::buildSetMqttConfig(settings, &payload, &err)) {
        dispatch(err);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        busy = _mqttPhase != MQTT_IDLE;
        if (!busy) {
            _mqttPhase = MQTT_SETTLING;
            _mqttState = SYNC_PENDING_WRITE;
            _mqttDesired = settings;
            _mqttDeadline = _clock.getMillis() + MQTT_SETTLE_MILLIS;
        }
    }
    if (busy) {
        dispatch(MeshError(ERR_CONFIG_CONFLICT, "MQTT", "an MQTT config write is still settling"));
        return false;
    }

    MESH_LOGI(TAG, "writing mqtt config (enabled=%d address='%s' proxy=%d)%s",
              settings.enabled, settings.address.c_str(), settings.proxyToClientEnabled,
              force ? " (forced)" : "");

    // Device may restart after this write
    _writer.link().stopPolling();
    if (!sendAdmin(payload, "mqtt", &err)) {
        _writer.link().startPolling();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _mqttPhase = MQTT_IDLE;
            _mqttState = SYNC_FAILED;
        }
        dispatch(err);
        return false;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _mqttDeadline = _clock.getMillis() + MQTT_SETTLE_MILLIS;
    return true;
}

void ConfigReconciler::finishMqttWrite(bool connected) {
    if (connected) {
        _writer.link().startPolling();
        std::lock_guard<std::mutex> lock(_mutex);
        _mqttPhase = MQTT_IDLE;
        _mqttState = SYNC_SYNCED;
        _mqtt = _mqttDesired;
        _hasMqtt = true;
        MESH_LOGI(TAG, "mqtt config applied, polling resumed");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _mqttPhase = MQTT_IDLE;
        _mqttState = SYNC_FAILED;
        _pollingOwed = true;
    }
    dispatch(MeshError(ERR_TRANSPORT, "MQTT", "device did not reconnect after MQTT config write"));
}

void ConfigReconciler::onMqttConfig(const MqttSettings& settings) {
    std::lock_guard<std::mutex> lock(_mutex);
    _mqtt = settings;
    _hasMqtt = true;
    if (_mqttPhase == MQTT_IDLE) {
        _mqttState = SYNC_SYNCED;
    }
}

bool ConfigReconciler::getMqttConfig(MqttSettings* out) const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_hasMqtt) {
        return false;
    }
    if (out != nullptr) *out = _mqtt;
    return true;
}

bool ConfigReconciler::mqttWriteInProgress() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _mqttPhase != MQTT_IDLE;
}

bool ConfigReconciler::pollingResumeOwed() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pollingOwed;
}

bool ConfigReconciler::resumePolling() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_pollingOwed) {
            return false;
        }
    }
    if (!_writer.link().isDeviceConnected()) {
        return false;
    }
    _writer.link().startPolling();
    std::lock_guard<std::mutex> lock(_mutex);
    _pollingOwed = false;
    MESH_LOGI(TAG, "polling resumed");
    return true;
}

/* ---------------------------------- Sections ------------------------------------- */

void ConfigReconciler::onConfig(const ConfigSection& section) {
    std::lock_guard<std::mutex> lock(_mutex);
    switch (section.kind) {
        case SECTION_DEVICE:    _config.device = section.device; break;
        case SECTION_POSITION:  _config.position = section.position; break;
        case SECTION_POWER:     _config.power = section.power; break;
        case SECTION_NETWORK:   _config.network = section.network; break;
        case SECTION_DISPLAY:   _config.display = section.display; break;
        case SECTION_LORA:      _config.lora = section.lora; break;
        case SECTION_BLUETOOTH: _config.bluetooth = section.bluetooth; break;
        case CONFIG_SECTION_COUNT: return;
    }
    _config.has[section.kind] = true;
    MESH_LOGD(TAG, "%s config received", configSectionName(section.kind));
}

void ConfigReconciler::onMetadata(const DeviceMetadata& metadata) {
    std::lock_guard<std::mutex> lock(_mutex);
    _metadata = metadata;
    _hasMetadata = true;
    MESH_LOGI(TAG, "firmware %s, hw %s", metadata.firmwareVersion.c_str(), metadata.hwModel.c_str());
}

DeviceConfig ConfigReconciler::getDeviceConfig() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _config;
}

bool ConfigReconciler::getMetadata(DeviceMetadata* out) const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_hasMetadata) {
        return false;
    }
    if (out != nullptr) *out = _metadata;
    return true;
}

SyncState ConfigReconciler::ownerState() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _ownerState;
}

SyncState ConfigReconciler::mqttState() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _mqttState;
}

SyncState ConfigReconciler::sectionState(ConfigSectionKind kind) const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (kind >= CONFIG_SECTION_COUNT) {
        return SYNC_UNKNOWN;
    }
    return _config.has[kind] ? SYNC_SYNCED : SYNC_UNKNOWN;
}

/* ---------------------------------- Timers ------------------------------------- */

void ConfigReconciler::loop() {
    unsigned long now = _clock.getMillis();

    MqttPhase phase;
    bool due;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_ownerPending && millisHasPassed(now, _ownerWrittenAt + OVERLAY_CONFIRM_MILLIS)) {
            MESH_LOGW(TAG, "owner write not confirmed by the device");
            _ownerPending = false;
            _ownerState = SYNC_FAILED;
        }
        phase = _mqttPhase;
        due = phase != MQTT_IDLE && millisHasPassed(now, _mqttDeadline);
    }
    if (!due) {
        return;
    }

    bool connected = _writer.link().isDeviceConnected();
    if (phase == MQTT_SETTLING && !connected) {
        MESH_LOGI(TAG, "device disconnected after mqtt write, waiting");
        std::lock_guard<std::mutex> lock(_mutex);
        _mqttPhase = MQTT_EXTRA_SETTLE;
        _mqttDeadline = now + MQTT_EXTRA_SETTLE_MILLIS;
        return;
    }
    finishMqttWrite(connected);
}

void ConfigReconciler::reset() {
    bool interrupted;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        interrupted = _mqttPhase != MQTT_IDLE;
        _ownerState = SYNC_UNKNOWN;
        _ownerPending = false;
        _mqttState = SYNC_UNKNOWN;
        _hasMqtt = false;
        _mqttPhase = MQTT_IDLE;
        _config = DeviceConfig();
        _hasMetadata = false;
    }
    if (!interrupted) {
        return;
    }

    // Polling was stopped for the MQTT write that never settled
    if (_writer.link().isDeviceConnected()) {
        MESH_LOGI(TAG, "mqtt settle interrupted by reset, polling resumed");
        _writer.link().startPolling();
        return;
    }
    MESH_LOGW(TAG, "mqtt settle interrupted by reset, polling resume owed");
    std::lock_guard<std::mutex> lock(_mutex);
    _pollingOwed = true;
}
