/**
 * mesh_enums.h - Display names for device enum codes
 * 
 * All translations are total. Firmware may report codes this client does not
 * know yet; those render as UNKNOWN(<code>) (HW_MODEL(<code>) for hardware).
 */

#ifndef MESH_ENUMS_H
#define MESH_ENUMS_H

#include <cstdint>
#include <string>

class MeshEnums {
public:
    static std::string deviceRole(uint32_t code);
    static std::string rebroadcastMode(uint32_t code);
    static std::string region(uint32_t code);
    static std::string modemPreset(uint32_t code);
    static std::string gpsFormat(uint32_t code);

    /** 0 is METRIC, every other value IMPERIAL */
    static std::string units(uint32_t code);

    static std::string oledType(uint32_t code);
    static std::string bluetoothMode(uint32_t code);
    static std::string hwModel(uint32_t code);

    /**
     * Port number name, e.g. TEXT_MESSAGE_APP. Unknown ports are UNKNOWN(n).
     */
    static std::string portNum(uint32_t code);

    /**
     * Routing error name, e.g. NO_ROUTE
     */
    static std::string routingError(uint32_t code);
};

#endif // MESH_ENUMS_H
