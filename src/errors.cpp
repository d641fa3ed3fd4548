#include "b64url/errors.hpp"

namespace b64url {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::InvalidEncoding:   return "InvalidEncoding";
        case ErrorKind::IoFailure:         return "IoFailure";
    }
    return "Unknown";
}

} // namespace b64url
