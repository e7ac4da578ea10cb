/**
 * mesh_admin.h - AdminMessage payload builders and channel-set codec
 * 
 * Builds the serialized AdminMessage carried inside an ADMIN_APP packet
 * (see MeshCodec::encodeAdminMessage), and the ChannelSet embedded in
 * shareable channel links.
 */

#ifndef MESH_ADMIN_H
#define MESH_ADMIN_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "mesh_config.h"
#include "mesh_types.h"
#include "mesh_errors.h"

struct AdminPayload {
    uint8_t bytes[ADMIN_PAYLOAD_MAX_BYTES];
    size_t len;

    AdminPayload() : len(0) {}
};

class MeshAdmin {
public:
    /**
     * set_owner with the given names. shortName must already be normalized.
     */
    static bool buildSetOwner(const std::string& longName, const std::string& shortName,
                              AdminPayload* out, MeshError* err);

    /**
     * set_channel from a full channel descriptor. Relay flags and position
     * precision are written as given; precision 0 omits module settings.
     */
    static bool buildSetChannel(const Channel& channel, AdminPayload* out, MeshError* err);

    /**
     * set_module_config for the MQTT section. An empty root becomes "msh".
     */
    static bool buildSetMqttConfig(const MqttSettings& settings, AdminPayload* out, MeshError* err);

    /**
     * Serialize a single-channel ChannelSet (name and key only)
     */
    static bool encodeChannelSet(const Channel& channel, std::vector<uint8_t>& out, MeshError* err);

    /**
     * Parse a ChannelSet and return its first entry.
     * 
     * @param bytes Serialized ChannelSet
     * @param len Length of data
     * @param first Output: name (defaults to "Default"), psk, relay flags
     * @param err Output: ERR_DECODE, section ChannelSet
     * @return false if malformed or empty
     */
    static bool decodeChannelSet(const uint8_t* bytes, size_t len, Channel* first, MeshError* err);
};

#endif // MESH_ADMIN_H
