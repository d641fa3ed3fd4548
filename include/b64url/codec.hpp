#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstddef>
#include <cstdint>

namespace b64url {

/// Encode bytes to Base64 URL format (RFC 4648, no padding)
/// @param data Input bytes to encode
/// @return Base64 URL encoded string (no padding)
[[nodiscard]] std::string encode(std::span<const std::uint8_t> data);

/// Decode unpadded Base64 URL text to bytes
/// @param input Base64 URL encoded text, already stripped of trailing whitespace
/// @return Decoded bytes
/// @throws b64url::Error (InvalidEncoding) on a character outside the alphabet,
///         a length of 1 modulo 4, or non-zero trailing bits in the last group
[[nodiscard]] std::vector<std::uint8_t> decode(std::string_view input);

/// Number of characters encode() produces for `size` bytes
[[nodiscard]] constexpr std::size_t encodedLength(std::size_t size) noexcept {
    return (size / 3) * 4 + ((size % 3) == 0 ? 0 : (size % 3) + 1);
}

/// Number of bytes decode() produces for `length` valid characters
/// @throws b64url::Error (InvalidEncoding) if length % 4 == 1
[[nodiscard]] std::size_t decodedLength(std::size_t length);

} // namespace b64url
