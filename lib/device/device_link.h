/**
 * device_link.h - Boundary to the BLE transport
 * 
 * The transport owns connection, MTU and characteristic handling. meshlink
 * only writes base64 envelopes through it, asks whether the device is still
 * connected, and pauses the transport's periodic FromRadio polling around
 * writes that may restart the device.
 */

#ifndef DEVICE_LINK_H
#define DEVICE_LINK_H

#include <string>

class DeviceLink {
public:
    virtual ~DeviceLink() {}

    /**
     * Write one envelope. Blocks until the transport acknowledged the write.
     * 
     * @param base64Payload Standard base64 ToRadio envelope
     * @return false on write failure or if disconnected
     */
    virtual bool writeToDevice(const std::string& base64Payload) = 0;

    virtual bool isDeviceConnected() = 0;

    virtual void stopPolling() = 0;
    virtual void startPolling() = 0;
};

#endif // DEVICE_LINK_H
