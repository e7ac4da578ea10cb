/**
 * test_base64.cpp - Unit tests for Base64 framing and channel-link encoding
 *
 * Compile and run with:
 *   g++ -std=c++11 -I lib/base64 test/test_base64.cpp lib/base64/base64.cpp -o test_base64 && ./test_base64
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>

#include "base64.h"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST_ASSERT(condition, message) do { \
    if (!(condition)) { \
        printf("  FAIL: %s\n", message); \
        tests_failed++; \
    } else { \
        printf("  PASS: %s\n", message); \
        tests_passed++; \
    } \
} while(0)

void hexDump(const uint8_t* data, size_t len, const char* label) {
    printf("  %s (%zu bytes): ", label, len);
    for (size_t i = 0; i < len && i < 32; i++) {
        printf("%02X ", data[i]);
    }
    if (len > 32) printf("...");
    printf("\n");
}

void testKnownVectors() {
    printf("\n=== Test: RFC 4648 Vectors ===\n");

    const char* inputs[] = { "f", "fo", "foo", "foob", "fooba", "foobar" };
    const char* expected[] = { "Zg==", "Zm8=", "Zm9v", "Zm9vYg==", "Zm9vYmE=", "Zm9vYmFy" };

    for (int i = 0; i < 6; i++) {
        std::string out = Base64::encodeToString((const uint8_t*)inputs[i], strlen(inputs[i]));
        char label[64];
        snprintf(label, sizeof(label), "encode(\"%s\") == %s", inputs[i], expected[i]);
        TEST_ASSERT(out == expected[i], label);
    }

    uint8_t decoded[16];
    size_t len = 0;
    TEST_ASSERT(Base64::decode("Zm9vYmE=", decoded, sizeof(decoded), &len), "Padded input decodes");
    TEST_ASSERT(len == 5 && memcmp(decoded, "fooba", 5) == 0, "Decoded bytes match");
}

void testBinaryFrame() {
    printf("\n=== Test: Binary Envelope ===\n");

    // Typical ToRadio prefix: field 1 (packet), length, nested fields, zero bytes
    uint8_t frame[] = { 0x0A, 0x1F, 0x0D, 0x78, 0x56, 0x34, 0x12, 0x15, 0xFF, 0xFF,
                        0xFF, 0xFF, 0x00, 0x00, 0xFE, 0x80 };
    char encoded[64];
    size_t encodedLen = Base64::encode(frame, sizeof(frame), encoded, sizeof(encoded));
    TEST_ASSERT(encodedLen == Base64::encodedSize(sizeof(frame)), "Encoded length is 4*ceil(n/3)");
    TEST_ASSERT(strlen(encoded) == encodedLen, "Output is null terminated");
    printf("  Encoded: %s\n", encoded);

    uint8_t decoded[32];
    size_t decodedLen = 0;
    TEST_ASSERT(Base64::decode(encoded, decoded, sizeof(decoded), &decodedLen), "Frame decodes");
    TEST_ASSERT(decodedLen == sizeof(frame), "Decoded length matches");
    TEST_ASSERT(memcmp(frame, decoded, sizeof(frame)) == 0, "Zero and high bytes survive");
    hexDump(decoded, decodedLen, "Decoded");
}

void testStrictDecode() {
    printf("\n=== Test: Strict Decoding ===\n");

    uint8_t out[32];
    size_t len = 0;
    TEST_ASSERT(!Base64::decode("Zm9v!mFy", out, sizeof(out), &len), "Invalid character rejected");
    TEST_ASSERT(!Base64::decode("Zm9v YmFy", out, sizeof(out), &len), "Whitespace rejected");
    TEST_ASSERT(!Base64::decode("Zm9-", out, sizeof(out), &len), "URL-safe character rejected in a frame");
    TEST_ASSERT(!Base64::decode("Zg==Zg==", out, sizeof(out), &len), "Data after padding rejected");
    TEST_ASSERT(!Base64::decode("Z", out, sizeof(out), &len), "Single dangling symbol rejected");
    TEST_ASSERT(!Base64::decode("Zm9vYmFy", out, 4, &len), "Output buffer overflow rejected");
    TEST_ASSERT(Base64::decode("Zm8", out, sizeof(out), &len) && len == 2, "Missing padding accepted");
    TEST_ASSERT(Base64::decode("", out, sizeof(out), &len) && len == 0, "Empty input decodes to nothing");
}

void testUrlSafe() {
    printf("\n=== Test: URL-Safe Alphabet ===\n");

    uint8_t data[] = { 0xFB, 0xFF, 0xBF, 0x01 };
    std::string url = Base64::encodeUrl(data, sizeof(data));
    printf("  URL-safe: %s\n", url.c_str());
    TEST_ASSERT(url.find('+') == std::string::npos && url.find('/') == std::string::npos,
                "No '+' or '/' in URL-safe output");
    TEST_ASSERT(url.find('=') == std::string::npos, "Padding stripped");
    TEST_ASSERT(url == "-_-_AQ", "Expected URL-safe text");

    std::vector<uint8_t> back;
    TEST_ASSERT(Base64::decodeUrl(url, back), "URL-safe text decodes");
    TEST_ASSERT(back.size() == sizeof(data) && memcmp(&back[0], data, sizeof(data)) == 0,
                "URL-safe bytes match");

    // Links re-encoded by other tools may use the standard alphabet with padding
    TEST_ASSERT(Base64::decodeUrl("+/+/AQ==", back), "Standard alphabet accepted in links");
    TEST_ASSERT(back.size() == sizeof(data) && memcmp(&back[0], data, sizeof(data)) == 0,
                "Standard alphabet bytes match");

    TEST_ASSERT(!Base64::decodeUrl("ab$d", back), "Invalid link text rejected");
    TEST_ASSERT(back.empty(), "Output cleared on failure");
}

void testEdgeCases() {
    printf("\n=== Test: Edge Cases ===\n");

    char small[4];
    uint8_t data[] = { 1, 2, 3 };
    TEST_ASSERT(Base64::encode(data, sizeof(data), small, sizeof(small)) == 0,
                "Encode fails when the terminator does not fit");
    TEST_ASSERT(Base64::encode(nullptr, 3, small, sizeof(small)) == 0, "Null input rejected");

    uint8_t out[4];
    size_t len = 0;
    TEST_ASSERT(!Base64::decode(nullptr, out, sizeof(out), &len), "Null decode input rejected");

    TEST_ASSERT(Base64::encodedSize(0) == 0, "encodedSize(0) == 0");
    TEST_ASSERT(Base64::encodedSize(1) == 4, "encodedSize(1) == 4");
    TEST_ASSERT(Base64::decodedSize(8) == 6, "decodedSize(8) == 6");
}

int main() {
    printf("======================================\n");
    printf("  Base64 Encoding Test Suite\n");
    printf("======================================\n");

    testKnownVectors();
    testBinaryFrame();
    testStrictDecode();
    testUrlSafe();
    testEdgeCases();

    printf("\n======================================\n");
    printf("  Results: %d passed, %d failed\n", tests_passed, tests_failed);
    printf("======================================\n");

    return tests_failed > 0 ? 1 : 0;
}
