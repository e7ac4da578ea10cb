/**
 * frame_writer.cpp - Serialized outbound writes
 * 
 */

#include "frame_writer.h"

#include "mesh_log.h"

#define TAG "Link"

FrameWriter::FrameWriter(DeviceLink& link)
    : _link(link), _framesWritten(0) {
}

bool FrameWriter::write(const EncodedFrame& frame, const char* what, MeshError* err) {
    std::string payload = frame.toBase64();

    bool ok;
    {
        std::lock_guard<std::mutex> lock(_writeMutex);
        ok = _link.writeToDevice(payload);
    }

    if (!ok) {
        MESH_LOGW(TAG, "write failed: %s (%u bytes)", what, (unsigned)frame.len);
        if (err != nullptr) {
            *err = MeshError(ERR_TRANSPORT, what, "write to device failed");
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(_statsMutex);
    _framesWritten++;
    MESH_LOGD(TAG, "wrote %s (%u bytes, packet %08X)", what, (unsigned)frame.len, frame.packetId);
    return true;
}

uint32_t FrameWriter::framesWritten() const {
    std::lock_guard<std::mutex> lock(_statsMutex);
    return _framesWritten;
}
