/**
 * frame_writer.h - Serialized outbound writes
 * 
 * All components share one FrameWriter so at most one write is in flight to
 * the transport. Callers block on the mutex while another write completes.
 */

#ifndef FRAME_WRITER_H
#define FRAME_WRITER_H

#include <cstdint>
#include <mutex>

#include "device_link.h"
#include "mesh_codec.h"
#include "mesh_errors.h"

class FrameWriter {
public:
    explicit FrameWriter(DeviceLink& link);

    /**
     * Base64-frame and write one envelope.
     * 
     * @param frame Encoded envelope
     * @param what Short label for logs and errors, e.g. "text"
     * @param err Output: ERR_TRANSPORT on failure (may be nullptr)
     * @return true if the transport accepted the write
     */
    bool write(const EncodedFrame& frame, const char* what, MeshError* err);

    DeviceLink& link() { return _link; }

    uint32_t framesWritten() const;

private:
    DeviceLink& _link;
    std::mutex _writeMutex;
    mutable std::mutex _statsMutex;
    uint32_t _framesWritten;
};

#endif // FRAME_WRITER_H
