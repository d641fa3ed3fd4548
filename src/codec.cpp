#include "b64url/codec.hpp"
#include "b64url/b64url_constants.hpp"
#include "b64url/errors.hpp"
#include <array>
#include <iomanip>
#include <sstream>

namespace b64url {

namespace {
    constexpr std::uint8_t INVALID = 0xFF;

    // Lookup table for decoding (maps ASCII value to 6-bit value, 0xFF = invalid)
    constexpr std::array<std::uint8_t, 256> createDecodeLookup() {
        std::array<std::uint8_t, 256> lookup{};
        for (auto& val : lookup) val = INVALID;

        for (std::uint8_t i = 0; i < 64; ++i) {
            lookup[static_cast<std::uint8_t>(ALPHABET[i])] = i;
        }
        return lookup;
    }

    constexpr auto decode_lookup = createDecodeLookup();

    [[noreturn]] void throwInvalidCharacter(std::string_view input, std::size_t offset) {
        auto ch = static_cast<unsigned char>(input[offset]);
        std::ostringstream oss;
        oss << "Invalid Base64 URL character ";
        if (ch >= 0x21 && ch < 0x7F) {
            oss << "'" << input[offset] << "'";
        } else {
            oss << "0x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<unsigned int>(ch) << std::dec;
        }
        oss << " at offset " << offset;
        throw Error(ErrorKind::InvalidEncoding, oss.str());
    }

    // 6-bit value of input[offset], throwing on characters outside the alphabet
    std::uint32_t sextet(std::string_view input, std::size_t offset) {
        std::uint8_t value = decode_lookup[static_cast<std::uint8_t>(input[offset])];
        if (value == INVALID) {
            throwInvalidCharacter(input, offset);
        }
        return value;
    }
}

std::size_t decodedLength(std::size_t length) {
    if (length % 4 == 1) {
        throw Error(ErrorKind::InvalidEncoding,
                    "Invalid Base64 URL input length " + std::to_string(length));
    }
    return (length / 4) * 3 + ((length % 4) == 0 ? 0 : (length % 4) - 1);
}

std::string encode(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return "";
    }

    std::string result;
    result.reserve(encodedLength(data.size()));

    size_t i = 0;
    // Process complete 3-byte groups
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                 static_cast<std::uint32_t>(data[i + 2]);

        result.push_back(ALPHABET[(triple >> 18) & 0x3F]);
        result.push_back(ALPHABET[(triple >> 12) & 0x3F]);
        result.push_back(ALPHABET[(triple >> 6) & 0x3F]);
        result.push_back(ALPHABET[triple & 0x3F]);

        i += 3;
    }

    // Remaining 1 or 2 bytes become 2 or 3 chars, no padding
    if (i < data.size()) {
        std::uint32_t remaining = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) {
            remaining |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }

        result.push_back(ALPHABET[(remaining >> 18) & 0x3F]);
        result.push_back(ALPHABET[(remaining >> 12) & 0x3F]);
        if (i + 1 < data.size()) {
            result.push_back(ALPHABET[(remaining >> 6) & 0x3F]);
        }
    }

    return result;
}

std::vector<std::uint8_t> decode(std::string_view input) {
    std::vector<std::uint8_t> result;
    result.reserve(decodedLength(input.size()));

    size_t i = 0;
    // Process complete 4-char groups
    while (i + 3 < input.size()) {
        std::uint32_t quad = (sextet(input, i) << 18) |
                             (sextet(input, i + 1) << 12) |
                             (sextet(input, i + 2) << 6) |
                              sextet(input, i + 3);

        result.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        result.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        result.push_back(static_cast<std::uint8_t>(quad & 0xFF));

        i += 4;
    }

    // Final partial group: 2 chars -> 1 byte, 3 chars -> 2 bytes
    size_t remaining = input.size() - i;
    if (remaining > 0) {
        std::uint32_t a = sextet(input, i);
        std::uint32_t b = sextet(input, i + 1);
        std::uint32_t partial = (a << 18) | (b << 12);

        if (remaining == 2) {
            // Low 4 bits of the last char would belong to a byte that is not there
            if ((b & 0x0F) != 0) {
                throw Error(ErrorKind::InvalidEncoding,
                            "Invalid Base64 URL trailing bits at offset " + std::to_string(i + 1));
            }
            result.push_back(static_cast<std::uint8_t>((partial >> 16) & 0xFF));
        } else {
            std::uint32_t c = sextet(input, i + 2);
            if ((c & 0x03) != 0) {
                throw Error(ErrorKind::InvalidEncoding,
                            "Invalid Base64 URL trailing bits at offset " + std::to_string(i + 2));
            }
            partial |= c << 6;
            result.push_back(static_cast<std::uint8_t>((partial >> 16) & 0xFF));
            result.push_back(static_cast<std::uint8_t>((partial >> 8) & 0xFF));
        }
    }

    return result;
}

} // namespace b64url
