/**
 * random_source.h - Random byte source
 * 
 * Packet ids and channel keys are drawn from here. The production source is
 * OpenSSL's CSPRNG since the bytes become encryption keys.
 */

#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <cstddef>
#include <cstdint>

class RandomSource {
public:
    virtual ~RandomSource() {}

    /**
     * Fill dest with random bytes
     * @return false if the source could not produce them
     */
    virtual bool random(uint8_t* dest, size_t sz) = 0;

    /**
     * Random 32-bit value, or 0 if the source failed
     */
    uint32_t nextUInt32();
};

class OpenSslRandom : public RandomSource {
public:
    bool random(uint8_t* dest, size_t sz) override;
};

#endif // RANDOM_SOURCE_H
