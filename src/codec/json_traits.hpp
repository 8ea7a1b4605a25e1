#pragma once

#include "codec/codec_error.hpp"
#include "core/types.hpp"

#include <json/json.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace verdict::codec {

class ErrorCodec;

/// Conversion between a C++ type and its wire representation.
///
/// Specialize for your own types; decode() throws DecodeError on a value of
/// the wrong shape. The codec is passed through so nested errors decode
/// against the same registry.
template <typename T, typename = void>
struct JsonTraits;

template <>
struct JsonTraits<bool> {
    static Json::Value encode(bool value, const ErrorCodec&) { return value; }
    static bool decode(const Json::Value& v, const ErrorCodec&) {
        if (!v.isBool()) throw DecodeError("expected a boolean");
        return v.asBool();
    }
};

template <typename T>
struct JsonTraits<T, std::enable_if_t<std::is_integral_v<T> &&
                                      !std::is_same_v<T, bool>>> {
    static Json::Value encode(T value, const ErrorCodec&) {
        if constexpr (std::is_signed_v<T>) {
            return Json::Value(static_cast<Json::Int64>(value));
        } else {
            return Json::Value(static_cast<Json::UInt64>(value));
        }
    }

    static T decode(const Json::Value& v, const ErrorCodec&) {
        if constexpr (std::is_signed_v<T>) {
            if (!v.isInt64()) throw DecodeError("expected an integer");
            Json::Int64 n = v.asInt64();
            if (n < static_cast<Json::Int64>(std::numeric_limits<T>::min()) ||
                n > static_cast<Json::Int64>(std::numeric_limits<T>::max())) {
                throw DecodeError("integer out of range");
            }
            return static_cast<T>(n);
        } else {
            if (!v.isUInt64()) throw DecodeError("expected an unsigned integer");
            Json::UInt64 n = v.asUInt64();
            if (n > static_cast<Json::UInt64>(std::numeric_limits<T>::max())) {
                throw DecodeError("integer out of range");
            }
            return static_cast<T>(n);
        }
    }
};

template <typename T>
struct JsonTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static Json::Value encode(T value, const ErrorCodec&) {
        return Json::Value(static_cast<double>(value));
    }
    static T decode(const Json::Value& v, const ErrorCodec&) {
        if (!v.isNumeric()) throw DecodeError("expected a number");
        double n = v.asDouble();
        if constexpr (sizeof(T) < sizeof(double)) {
            if (std::isfinite(n) &&
                (n < static_cast<double>(std::numeric_limits<T>::lowest()) ||
                 n > static_cast<double>(std::numeric_limits<T>::max()))) {
                throw DecodeError("number out of range");
            }
        }
        return static_cast<T>(n);
    }
};

template <>
struct JsonTraits<std::string> {
    static Json::Value encode(const std::string& value, const ErrorCodec&) {
        return Json::Value(value);
    }
    static std::string decode(const Json::Value& v, const ErrorCodec&) {
        if (!v.isString()) throw DecodeError("expected a string");
        return v.asString();
    }
};

template <>
struct JsonTraits<Json::Value> {
    static Json::Value encode(const Json::Value& value, const ErrorCodec&) {
        return value;
    }
    static Json::Value decode(const Json::Value& v, const ErrorCodec&) {
        return v;
    }
};

template <typename T>
struct JsonTraits<std::optional<T>> {
    static Json::Value encode(const std::optional<T>& value,
                              const ErrorCodec& codec) {
        if (!value) return Json::Value(Json::nullValue);
        return JsonTraits<T>::encode(*value, codec);
    }
    static std::optional<T> decode(const Json::Value& v,
                                   const ErrorCodec& codec) {
        if (v.isNull()) return std::nullopt;
        return JsonTraits<T>::decode(v, codec);
    }
};

template <typename T>
struct JsonTraits<std::vector<T>> {
    static Json::Value encode(const std::vector<T>& values,
                              const ErrorCodec& codec) {
        Json::Value out(Json::arrayValue);
        for (const auto& value : values) {
            out.append(JsonTraits<T>::encode(value, codec));
        }
        return out;
    }
    static std::vector<T> decode(const Json::Value& v, const ErrorCodec& codec) {
        if (!v.isArray()) throw DecodeError("expected an array");
        std::vector<T> out;
        out.reserve(v.size());
        for (const auto& item : v) {
            out.push_back(JsonTraits<T>::decode(item, codec));
        }
        return out;
    }
};

/// Errors nested inside other payloads (a cause, a list of related
/// failures). A null ErrorPtr is written as JSON null. Defined in
/// error_codec.cpp.
template <>
struct JsonTraits<ErrorPtr> {
    static Json::Value encode(const ErrorPtr& value, const ErrorCodec& codec);
    static ErrorPtr decode(const Json::Value& v, const ErrorCodec& codec);
};

} // namespace verdict::codec
