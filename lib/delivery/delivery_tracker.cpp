/**
 * delivery_tracker.cpp - Dual-track delivery state of outgoing messages
 */

#include "delivery_tracker.h"

#include "mesh_log.h"

#define TAG "Delivery"

DeliveryTracker::DeliveryTracker(MessageStore& store)
    : _store(store), _nextSeq(0) {
}

void DeliveryTracker::setListener(const StatusListener& listener) {
    std::lock_guard<std::mutex> lock(_mutex);
    _listener = listener;
}

AddResult DeliveryTracker::beginOutgoing(Message& message, bool mqttUplink) {
    message.isOutgoing = true;
    message.hasDualStatus = true;
    message.radioStatus = RADIO_PENDING;
    message.mqttStatus = mqttUplink ? MQTT_PENDING : MQTT_NOT_APPLICABLE;
    message.status = deriveStatus(message.radioStatus, message.mqttStatus);

    AddResult result = _store.addMessage(message);
    if (result == ADD_INSERTED && message.hasPacketId) {
        std::lock_guard<std::mutex> lock(_mutex);
        InFlight entry;
        entry.messageId = message.id;
        entry.seq = _nextSeq++;
        _inFlight[message.packetId] = entry;
        while (_inFlight.size() > MAX_IN_FLIGHT_PACKETS) {
            evictOldest();
        }
    }
    MESH_LOGD(TAG, "%s pending (packet %08X, mqtt %s)", message.id.c_str(),
              message.packetId, mqttStatusName(message.mqttStatus));
    return result;
}

void DeliveryTracker::onTransportResult(uint32_t packetId, bool ok) {
    if (ok) {
        if (_store.updateMessageStatus(packetId, RADIO_SENT) > 0) {
            notify(packetId);
        }
        return;
    }

    MESH_LOGW(TAG, "packet %08X not handed to the transport", packetId);
    int radio = _store.updateMessageStatus(packetId, RADIO_FAILED);
    // Only moves a pending MQTT track; not_applicable stays as it is
    int mqtt = _store.updateMqttStatus(packetId, MQTT_FAILED);
    settle(packetId);
    if (radio > 0 || mqtt > 0) {
        notify(packetId);
    }
}

bool DeliveryTracker::onAck(uint32_t packetId, bool success) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_inFlight.find(packetId) == _inFlight.end()) {
            // Might be an ACK for a message sent in an earlier run
            Message stored;
            if (!_store.getMessageByPacketId(packetId, &stored) || !stored.isOutgoing) {
                return false;
            }
        }
    }

    MESH_LOGI(TAG, "packet %08X %s", packetId, success ? "acknowledged" : "rejected");
    int changed = _store.updateMessageStatus(packetId, success ? RADIO_DELIVERED : RADIO_FAILED);
    settle(packetId);
    if (changed > 0) {
        notify(packetId);
    }
    return true;
}

void DeliveryTracker::onMqttRelay(uint32_t packetId, bool ok) {
    if (_store.updateMqttStatus(packetId, ok ? MQTT_SENT : MQTT_FAILED) > 0) {
        MESH_LOGD(TAG, "packet %08X mqtt %s", packetId, ok ? "sent" : "failed");
        notify(packetId);
    }
}

bool DeliveryTracker::isTracking(uint32_t packetId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _inFlight.find(packetId) != _inFlight.end();
}

size_t DeliveryTracker::inFlight() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _inFlight.size();
}

// Caller holds _mutex
void DeliveryTracker::evictOldest() {
    std::map<uint32_t, InFlight>::iterator oldest = _inFlight.begin();
    for (std::map<uint32_t, InFlight>::iterator it = _inFlight.begin(); it != _inFlight.end(); ++it) {
        if (it->second.seq - _nextSeq < oldest->second.seq - _nextSeq) {
            oldest = it;
        }
    }
    MESH_LOGD(TAG, "no response yet for %s (packet %08X), left to the store",
              oldest->second.messageId.c_str(), oldest->first);
    _inFlight.erase(oldest);
}

void DeliveryTracker::settle(uint32_t packetId) {
    std::lock_guard<std::mutex> lock(_mutex);
    _inFlight.erase(packetId);
}

void DeliveryTracker::notify(uint32_t packetId) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        listener = _listener;
    }
    if (!listener) {
        return;
    }
    Message stored;
    if (_store.getMessageByPacketId(packetId, &stored)) {
        listener(stored);
    }
}

const char* DeliveryTracker::deriveStatus(RadioStatus radio, MqttStatus mqtt) {
    switch (radio) {
        case RADIO_FAILED:    return "failed";
        case RADIO_DELIVERED: return "delivered";
        case RADIO_SENT:      return mqtt == MQTT_SENT ? "delivered" : "sent";
        case RADIO_PENDING:   return "pending";
    }
    return "pending";
}

std::string DeliveryTracker::displayStatus(const Message& message) {
    if (message.hasDualStatus) {
        return deriveStatus(message.radioStatus, message.mqttStatus);
    }
    if (!message.status.empty()) {
        return message.status;
    }
    return message.isOutgoing ? "sent" : "";
}
