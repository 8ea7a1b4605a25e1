#pragma once

#include <stdexcept>
#include <string>

namespace verdict::codec {

/// A payload could not be turned back into an Error, ErrorCode or Result:
/// missing or empty discriminator, unknown type, wrong kind of type, or a
/// field that did not decode. Never silently replaced by a default.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/// An Error or ErrorCode whose dynamic type was never registered.
class EncodeError : public std::runtime_error {
public:
    explicit EncodeError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace verdict::codec
