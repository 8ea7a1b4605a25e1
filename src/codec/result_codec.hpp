#pragma once

#include "codec/codec_error.hpp"
#include "codec/error_codec.hpp"
#include "codec/fields.hpp"
#include "codec/json_text.hpp"
#include "codec/json_traits.hpp"
#include "core/result.hpp"

#include <json/json.h>

#include <string>
#include <string_view>
#include <type_traits>

namespace verdict::codec {

// Wire form of an outcome:
//   success: {"isSuccess": true, "value": <T>}     ("value" absent for Result<void>)
//   failure: {"isSuccess": false, "error": <Error>}
// The None sentinel is never written; a success decodes back to it.

template <typename T>
Json::Value encode_result(const Result<T>& result,
                          const ErrorCodec& codec = ErrorCodec()) {
    Json::Value out(Json::objectValue);
    out["isSuccess"] = result.is_success();
    if (result.is_failure()) {
        out["error"] = codec.encode(*result.error());
    } else if constexpr (!std::is_void_v<T>) {
        out["value"] = JsonTraits<T>::encode(result.value(), codec);
    }
    return out;
}

template <typename T>
Result<T> decode_result(const Json::Value& payload,
                        const ErrorCodec& codec = ErrorCodec()) {
    if (!payload.isObject()) {
        throw DecodeError("Result must be serialized as an object");
    }

    FieldReader fields(payload, codec);
    const Json::Value* flag = fields.find("isSuccess");
    if (!flag || !flag->isBool()) {
        throw DecodeError("Result requires a boolean isSuccess property");
    }
    const Json::Value* error = fields.find("error");

    if (flag->asBool()) {
        if (error && !error->isNull()) {
            throw DecodeError("Successful Result cannot have an error");
        }
        if constexpr (std::is_void_v<T>) {
            return Result<void>::success();
        } else {
            return Result<T>::success(fields.get<T>("value"));
        }
    }

    if (!error || error->isNull()) {
        throw DecodeError("Failed Result must have an error");
    }
    return Result<T>::failure(codec.decode_error(*error));
}

template <typename T>
std::string serialize(const Result<T>& result, int indent = 0,
                      const ErrorCodec& codec = ErrorCodec()) {
    return to_text(encode_result(result, codec), indent);
}

template <typename T>
Result<T> deserialize(std::string_view text,
                      const ErrorCodec& codec = ErrorCodec()) {
    return decode_result<T>(parse(text), codec);
}

} // namespace verdict::codec
