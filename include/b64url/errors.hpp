#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace b64url {

/// Closed set of failures an invocation can end with
enum class ErrorKind {
    SourceUnavailable,  // the requested file cannot be opened
    InvalidEncoding,    // decode input is not unpadded base64url
    IoFailure           // a read or write on a resolved stream failed
};

/// Stable name of an error kind (e.g. "InvalidEncoding")
[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

/**
 * Exception thrown by the codec and the dispatcher.
 * what() returns the message without the kind prefix.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace b64url
