/**
 * base64.cpp - Base64 Encoding/Decoding Implementation
 * 
 */

#include "base64.h"

#include <cstring>

const char Base64::ALPHABET[64] = {
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M',
    'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z',
    'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
    'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'
};

const char Base64::URL_ALPHABET[64] = {
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M',
    'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z',
    'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
    'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '-', '_'
};

// Decode lookup table (-1 = invalid character). Both '+' '/' and '-' '_'
// decode; the standard decoder rejects the URL-safe pair separately.
const int8_t Base64::DECODE_TABLE[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0x00-0x0F
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0x10-0x1F
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, 62, -1, 62, -1, 63,  // 0x20-0x2F  + - /
    52, 53, 54, 55, 56, 57, 58, 59, 60, 61, -1, -1, -1, -1, -1, -1,  // 0x30-0x3F  0-9
    -1, 0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  10, 11, 12, 13, 14,  // 0x40-0x4F  A-O
    15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, -1, -1, -1, -1, 63,  // 0x50-0x5F  P-Z _
    -1, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,  // 0x60-0x6F  a-o
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, -1, -1, -1, -1, -1,  // 0x70-0x7F  p-z
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0x80-0x8F
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0x90-0x9F
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0xA0-0xAF
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0xB0-0xBF
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0xC0-0xCF
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0xD0-0xDF
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,  // 0xE0-0xEF
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1   // 0xF0-0xFF
};

size_t Base64::encodeWith(const char* alphabet, bool pad,
                          const uint8_t* input, size_t inputLen,
                          char* output, size_t outputMaxLen) {
    if (output == nullptr || outputMaxLen == 0 || (input == nullptr && inputLen > 0)) {
        return 0;
    }

    size_t outPos = 0;
    size_t i = 0;

    while (i + 3 <= inputLen) {
        if (outPos + 4 > outputMaxLen - 1) {  // -1 for null terminator
            return 0;  // Buffer too small
        }
        uint32_t triple = ((uint32_t)input[i] << 16) | ((uint32_t)input[i + 1] << 8) | input[i + 2];
        output[outPos++] = alphabet[(triple >> 18) & 0x3F];
        output[outPos++] = alphabet[(triple >> 12) & 0x3F];
        output[outPos++] = alphabet[(triple >> 6) & 0x3F];
        output[outPos++] = alphabet[triple & 0x3F];
        i += 3;
    }

    // 1 or 2 trailing bytes
    size_t rest = inputLen - i;
    if (rest > 0) {
        size_t needed = pad ? 4 : rest + 1;
        if (outPos + needed > outputMaxLen - 1) {
            return 0;
        }
        uint32_t triple = (uint32_t)input[i] << 16;
        if (rest == 2) {
            triple |= (uint32_t)input[i + 1] << 8;
        }
        output[outPos++] = alphabet[(triple >> 18) & 0x3F];
        output[outPos++] = alphabet[(triple >> 12) & 0x3F];
        if (rest == 2) {
            output[outPos++] = alphabet[(triple >> 6) & 0x3F];
        } else if (pad) {
            output[outPos++] = '=';
        }
        if (pad) {
            output[outPos++] = '=';
        }
    }

    output[outPos] = '\0';
    return outPos;
}

size_t Base64::encode(const uint8_t* input, size_t inputLen,
                      char* output, size_t outputMaxLen) {
    return encodeWith(ALPHABET, true, input, inputLen, output, outputMaxLen);
}

std::string Base64::encodeToString(const uint8_t* input, size_t inputLen) {
    std::vector<char> buf(encodedSize(inputLen) + 1);
    size_t len = encodeWith(ALPHABET, true, input, inputLen, buf.data(), buf.size());
    return std::string(buf.data(), len);
}

std::string Base64::encodeUrl(const uint8_t* input, size_t inputLen) {
    std::vector<char> buf(encodedSize(inputLen) + 1);
    size_t len = encodeWith(URL_ALPHABET, false, input, inputLen, buf.data(), buf.size());
    return std::string(buf.data(), len);
}

bool Base64::decode(const char* input, uint8_t* output, size_t outputMaxLen,
                    size_t* outputLen) {
    if (input == nullptr || output == nullptr || outputLen == nullptr) {
        return false;
    }
    *outputLen = 0;

    size_t outPos = 0;
    uint32_t queue = 0;
    int numBits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (size_t i = 0; input[i] != '\0'; i++) {
        char c = input[i];
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0 || c == '-' || c == '_') {
            return false;  // Data after padding or URL-safe character in a wire frame
        }
        int8_t d = DECODE_TABLE[(uint8_t)c];
        if (d == -1) {
            return false;
        }

        queue = (queue << 6) | (uint32_t)d;
        numBits += 6;
        symbols++;

        if (numBits >= 8) {
            numBits -= 8;
            if (outPos >= outputMaxLen) {
                return false;  // Buffer too small
            }
            output[outPos++] = (uint8_t)((queue >> numBits) & 0xFF);
        }
    }

    // A single dangling symbol cannot encode a byte
    if (symbols % 4 == 1 || padding > 2) {
        return false;
    }
    if (padding > 0 && (symbols + padding) % 4 != 0) {
        return false;
    }

    *outputLen = outPos;
    return true;
}

bool Base64::decodeUrl(const std::string& input, std::vector<uint8_t>& output) {
    output.clear();

    // Normalize to the standard alphabet and restore padding
    std::string normalized;
    normalized.reserve(input.size() + 3);
    for (size_t i = 0; i < input.size(); i++) {
        char c = input[i];
        if (c == '-') {
            normalized += '+';
        } else if (c == '_') {
            normalized += '/';
        } else if (c == '=') {
            break;
        } else {
            normalized += c;
        }
    }
    while (normalized.size() % 4 != 0) {
        normalized += '=';
    }

    output.resize(decodedSize(normalized.size()));
    size_t len = 0;
    if (!decode(normalized.c_str(), output.data(), output.size(), &len)) {
        output.clear();
        return false;
    }
    output.resize(len);
    return true;
}
