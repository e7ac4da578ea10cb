/**
 * mesh_clock.h - Time sources
 * 
 * Components take a MeshClock so timed sequences (settle delays, write
 * gaps, dedup windows) can be driven deterministically in tests.
 */

#ifndef MESH_CLOCK_H
#define MESH_CLOCK_H

#include <chrono>
#include <cstdint>

class MeshClock {
public:
    virtual ~MeshClock() {}

    /**
     * Monotonic milliseconds, for scheduling
     */
    virtual unsigned long getMillis() = 0;

    /**
     * Wall clock, UNIX epoch milliseconds
     */
    virtual int64_t getEpochMillis() = 0;

    uint32_t getEpochSeconds() { return (uint32_t)(getEpochMillis() / 1000); }
};

class SystemClock : public MeshClock {
public:
    unsigned long getMillis() override {
        using namespace std::chrono;
        return (unsigned long)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    }

    int64_t getEpochMillis() override {
        using namespace std::chrono;
        return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }
};

// Wrap-safe "has this deadline passed"
inline bool millisHasPassed(unsigned long now, unsigned long deadline) {
    return (long)(now - deadline) >= 0;
}

#endif // MESH_CLOCK_H
