/**
 * mqtt_bridge.h - Broker side of the MQTT client proxy
 * 
 * When the device's MQTT module runs with proxy_to_client_enabled, the
 * device has no network of its own: it hands every uplink publish to the
 * client, and the client feeds broker messages back. The broker client
 * itself lives outside meshlink; this is its boundary.
 */

#ifndef MQTT_BRIDGE_H
#define MQTT_BRIDGE_H

#include <cstddef>
#include <cstdint>
#include <string>

class MqttBridge {
public:
    virtual ~MqttBridge() {}

    /**
     * Publish one message to the broker.
     * 
     * @param topic Full topic, e.g. msh/EU_868/2/e/LongFast/!a1b2c3d4
     * @param data Payload (a ServiceEnvelope for uplinked packets)
     * @param len Payload length
     * @param retained MQTT retain flag
     * @return true if the broker accepted the publish
     */
    virtual bool publish(const std::string& topic, const uint8_t* data, size_t len, bool retained) = 0;
};

#endif // MQTT_BRIDGE_H
