#pragma once
#include <cstddef>

namespace b64url {

// Program name as printed by --version and usage text
inline constexpr const char* PROGRAM_NAME = "b64url";

// Program version
inline constexpr const char* VERSION = "0.1.0";

// Base64 URL alphabet (RFC 4648 section 5): differs from standard in chars 62 and 63
inline constexpr const char* ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// Sentinel source argument meaning standard input
inline constexpr const char* STDIN_SENTINEL = "-";

} // namespace b64url
