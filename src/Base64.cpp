#include "Base64.hpp"
#include <cstdint>
#include <stdexcept>

namespace faceAI {

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 64 marks a byte outside the alphabet
const unsigned char kDecodeTable[256] = {
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 62, 64, 64, 64, 63,
    52, 53, 54, 55, 56, 57, 58, 59, 60, 61, 64, 64, 64, 64, 64, 64,
    64,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,
    15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 64, 64, 64, 64, 64,
    64, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64
};

bool isSpace(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

std::vector<unsigned char> base64Decode(const std::string& input) {
    // Remove data URL prefix if present
    size_t start = 0;
    if (input.compare(0, 5, "data:") == 0) {
        size_t comma = input.find(',');
        if (comma == std::string::npos) {
            throw std::invalid_argument("Data URL without payload");
        }
        start = comma + 1;
    }

    std::vector<unsigned char> decoded;
    decoded.reserve(((input.size() - start) / 4) * 3);

    uint32_t triple = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (size_t i = start; i < input.size(); i++) {
        char c = input[i];
        if (isSpace(c)) {
            continue;
        }
        symbols++;
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding) {
            throw std::invalid_argument("Base64 data after padding");
        }

        unsigned char value = kDecodeTable[static_cast<unsigned char>(c)];
        if (value == 64) {
            throw std::invalid_argument("Invalid base64 character");
        }

        triple = (triple << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<unsigned char>((triple >> bits) & 0xFF));
        }
    }

    // Whole 4-character groups only; "=" may fill at most the last two
    if (symbols % 4 != 0 || padding > 2) {
        throw std::invalid_argument("Truncated base64 data");
    }

    return decoded;
}

std::string base64Encode(const std::vector<unsigned char>& data) {
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[triple & 0x3F]);
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = data[i] << 16;
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded += "==";
    } else if (remaining == 2) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8);
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        encoded.push_back('=');
    }

    return encoded;
}

} // namespace faceAI
