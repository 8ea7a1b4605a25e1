#include "codec/error_codec.hpp"
#include "core/result.hpp"

#include <spdlog/spdlog.h>
#include <string>
#include <typeindex>

namespace verdict::codec {

namespace {

/// The "$type" discriminator, or a DecodeError naming what was expected.
std::string read_type_tag(const Json::Value& payload, const char* kind) {
    if (!payload.isObject()) {
        throw DecodeError(std::string(kind) + " must be serialized as an object");
    }
    const Json::Value& tag = payload["$type"];
    if (tag.isNull()) {
        throw DecodeError(std::string(kind) + " serialization requires $type property");
    }
    if (!tag.isString() || tag.asString().empty()) {
        throw DecodeError(std::string(kind) + " $type cannot be null or empty");
    }
    return tag.asString();
}

} // namespace

Json::Value ErrorCodec::encode(const Error& error) const {
    auto entry = registry_->find_error(typeid(error));
    if (!entry) {
        throw EncodeError(std::string("Error type '") + typeid(error).name() +
                          "' is not registered");
    }

    Json::Value out(Json::objectValue);
    out["$type"] = entry->tag;
    out["code"] = encode(error.code());
    out["description"] = error.description();

    if (entry->encode) {
        FieldWriter fields(out, *this);
        entry->encode(error, fields);
    }
    return out;
}

Json::Value ErrorCodec::encode(const ErrorCode& code) const {
    auto tag = registry_->code_tag(code);
    if (!tag) {
        throw EncodeError("ErrorCode '" + code.to_string() + "' is not registered");
    }

    Json::Value out(Json::objectValue);
    out["$type"] = *tag;
    out["$name"] = code.to_string();
    return out;
}

ErrorPtr ErrorCodec::decode_error(const Json::Value& payload) const {
    std::string tag = read_type_tag(payload, "Error");

    auto entry = registry_->find_error(tag);
    if (!entry) {
        spdlog::debug("Rejected Error payload with $type '{}'", tag);
        if (registry_->find_code(tag)) {
            throw DecodeError("'" + tag + "' is not an Error type");
        }
        throw DecodeError("Unknown or invalid Error type: '" + tag + "'");
    }

    FieldReader fields(payload, *this);
    ErrorPtr error;
    try {
        error = entry->decode(fields);
    } catch (const std::exception& ex) {
        spdlog::debug("Decoder for '{}' failed: {}", tag, ex.what());
        throw DecodeError("Could not construct Error type '" + tag +
                          "': " + ex.what());
    }

    if (!error || std::type_index(typeid(*error)) != entry->type) {
        throw DecodeError("Decoder for '" + tag +
                          "' did not produce an instance of that type");
    }

    if (error->code() == NoneCode::instance()) {
        throw DecodeError("Error type '" + tag + "' cannot carry the None code");
    }

    if (const Json::Value* code = fields.find("code")) {
        const ErrorCode& decoded = decode_code(*code);
        if (!(decoded == error->code())) {
            throw DecodeError("Error type '" + tag + "' carries code '" +
                              decoded.to_string() + "' but expects '" +
                              error->code().to_string() + "'");
        }
    }
    return error;
}

const ErrorCode& ErrorCodec::decode_code(const Json::Value& payload) const {
    std::string tag = read_type_tag(payload, "ErrorCode");

    const ErrorCode* code = registry_->find_code(tag);
    if (!code) {
        spdlog::debug("Rejected ErrorCode payload with $type '{}'", tag);
        if (registry_->find_error(tag)) {
            throw DecodeError("'" + tag + "' is not an ErrorCode type");
        }
        throw DecodeError("Unknown or invalid ErrorCode type: '" + tag + "'");
    }
    return *code;
}

Json::Value JsonTraits<ErrorPtr>::encode(const ErrorPtr& value,
                                         const ErrorCodec& codec) {
    if (!value) return Json::Value(Json::nullValue);
    return codec.encode(*value);
}

ErrorPtr JsonTraits<ErrorPtr>::decode(const Json::Value& v,
                                      const ErrorCodec& codec) {
    if (v.isNull()) return nullptr;
    return codec.decode_error(v);
}

} // namespace verdict::codec
