#pragma once

#include "codec/codec_error.hpp"
#include "codec/json_traits.hpp"
#include "core/error_code.hpp"

#include <json/json.h>

#include <string>
#include <string_view>

namespace verdict::codec {

class ErrorCodec;

/// Read access to the fields of an encoded Error, handed to decoders.
///
/// Field names match case-insensitively (an exact match wins). Values are
/// decoded through JsonTraits, so nested Errors go through the same codec.
class FieldReader {
public:
    FieldReader(const Json::Value& object, const ErrorCodec& codec)
        : object_(object), codec_(codec) {}

    /// The raw field, or nullptr if absent.
    const Json::Value* find(std::string_view name) const;

    bool has(std::string_view name) const { return find(name) != nullptr; }

    /// Throws DecodeError if the field is missing or has the wrong shape.
    template <typename T>
    T get(std::string_view name) const {
        const Json::Value* value = find(name);
        if (!value) {
            throw DecodeError("missing field '" + std::string(name) + "'");
        }
        return decode_field<T>(name, *value);
    }

    /// Like get(), but an absent field yields fallback.
    template <typename T>
    T get_or(std::string_view name, T fallback) const {
        const Json::Value* value = find(name);
        if (!value) return fallback;
        return decode_field<T>(name, *value);
    }

    std::string description() const { return get<std::string>("description"); }

    /// Resolve an encoded ErrorCode field to its registered singleton.
    const ErrorCode& code(std::string_view name = "code") const;

    const ErrorCodec& codec() const { return codec_; }

private:
    template <typename T>
    T decode_field(std::string_view name, const Json::Value& value) const {
        try {
            return JsonTraits<T>::decode(value, codec_);
        } catch (const DecodeError& ex) {
            throw DecodeError("field '" + std::string(name) + "': " + ex.what());
        }
    }

    const Json::Value& object_;
    const ErrorCodec& codec_;
};

/// Write access used by encoders of variants with extra fields.
class FieldWriter {
public:
    FieldWriter(Json::Value& object, const ErrorCodec& codec)
        : object_(object), codec_(codec) {}

    /// "$type", "code" and "description" belong to the codec; writing any of
    /// them (in any case) throws std::invalid_argument.
    template <typename T>
    void set(std::string_view name, const T& value) {
        check_name(name);
        object_[std::string(name)] = JsonTraits<T>::encode(value, codec_);
    }

    const ErrorCodec& codec() const { return codec_; }

private:
    static void check_name(std::string_view name);

    Json::Value& object_;
    const ErrorCodec& codec_;
};

} // namespace verdict::codec
