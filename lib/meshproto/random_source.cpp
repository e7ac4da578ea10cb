/**
 * random_source.cpp - Random byte source implementation
 * 
 */

#include "random_source.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include "mesh_log.h"

uint32_t RandomSource::nextUInt32() {
    uint8_t b[4];
    if (!random(b, sizeof(b))) {
        return 0;
    }
    return ((uint32_t)b[0] << 24) | ((uint32_t)b[1] << 16) | ((uint32_t)b[2] << 8) | b[3];
}

bool OpenSslRandom::random(uint8_t* dest, size_t sz) {
    if (sz == 0) {
        return true;
    }
    if (RAND_bytes(dest, (int)sz) != 1) {
        MESH_LOGE("Random", "RAND_bytes failed: %lu", ERR_get_error());
        return false;
    }
    return true;
}
