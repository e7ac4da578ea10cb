/**
 * base64.h - Base64 Encoding/Decoding for meshlink
 * 
 * Two alphabets are used by the client:
 * - Standard (RFC 4648 section 4, '+' '/' with '=' padding) frames every
 *   binary envelope carried over the BLE characteristic as text.
 * - URL-safe (RFC 4648 section 5, '-' '_' without padding) encodes the
 *   channel set embedded in shareable channel links.
 * 
 * Decoding is strict: any character outside the alphabet fails the decode
 * instead of being skipped, so a corrupted frame is never half-parsed.
 */

#ifndef BASE64_H
#define BASE64_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

class Base64 {
public:
    /**
     * Encode binary data with the standard alphabet and padding
     * 
     * @param input Binary data to encode
     * @param inputLen Length of input data
     * @param output Output buffer for the encoded string (will be null-terminated)
     * @param outputMaxLen Maximum size of output buffer
     * @return Length of encoded string (not including null terminator), or 0 on error
     */
    static size_t encode(const uint8_t* input, size_t inputLen,
                         char* output, size_t outputMaxLen);

    /**
     * Decode a standard base64 string. Padding is optional.
     * 
     * @param input Base64 string (null-terminated)
     * @param output Output buffer for decoded binary data
     * @param outputMaxLen Maximum size of output buffer
     * @param outputLen Output: number of decoded bytes
     * @return true if the whole input was valid and fit in the buffer
     */
    static bool decode(const char* input, uint8_t* output, size_t outputMaxLen,
                       size_t* outputLen);

    /**
     * Encode with the URL-safe alphabet, padding stripped
     */
    static std::string encodeUrl(const uint8_t* input, size_t inputLen);

    /**
     * Decode URL-safe base64. Accepts both alphabets and missing padding,
     * since links are often re-typed or re-encoded by other tools.
     * 
     * @param input Encoded text
     * @param output Output: decoded bytes (cleared first)
     * @return true if input was valid
     */
    static bool decodeUrl(const std::string& input, std::vector<uint8_t>& output);

    /** Convenience wrapper over encode() */
    static std::string encodeToString(const uint8_t* input, size_t inputLen);

    /**
     * Calculate encoded size for given input length (including padding,
     * excluding null terminator)
     */
    static size_t encodedSize(size_t inputLen) {
        return ((inputLen + 2) / 3) * 4;
    }

    /**
     * Calculate maximum decoded size for given encoded length
     */
    static size_t decodedSize(size_t encodedLen) {
        return ((encodedLen + 3) / 4) * 3;
    }

private:
    static const char ALPHABET[64];
    static const char URL_ALPHABET[64];
    static const int8_t DECODE_TABLE[256];

    static size_t encodeWith(const char* alphabet, bool pad,
                             const uint8_t* input, size_t inputLen,
                             char* output, size_t outputMaxLen);
};

#endif // BASE64_H
