#pragma once

#include "codec/codec_error.hpp"
#include "codec/type_registry.hpp"
#include "core/error.hpp"
#include "core/error_code.hpp"

#include <json/json.h>

namespace verdict::codec {

/// Converts Errors and ErrorCodes to and from their tagged wire form:
///
///   Error:     {"$type": <tag>, "code": <ErrorCode>, "description": ..., <extra fields>}
///   ErrorCode: {"$type": <tag>, "$name": <name>}
///
/// The exact runtime variant survives the round trip, and decoded codes are
/// the registered singletons themselves.
class ErrorCodec {
public:
    explicit ErrorCodec(const TypeRegistry& registry = TypeRegistry::global())
        : registry_(&registry) {}

    /// Throws EncodeError if the error's dynamic type is not registered.
    Json::Value encode(const Error& error) const;
    Json::Value encode(const ErrorCode& code) const;

    /// Throws DecodeError. If the payload carries a "code" field it must
    /// resolve to the same code as the rebuilt error.
    ErrorPtr decode_error(const Json::Value& payload) const;

    /// Returns the canonical singleton; "$name" is informational only.
    const ErrorCode& decode_code(const Json::Value& payload) const;

    const TypeRegistry& registry() const { return *registry_; }

private:
    const TypeRegistry* registry_;
};

} // namespace verdict::codec
