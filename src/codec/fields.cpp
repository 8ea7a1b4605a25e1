#include "codec/fields.hpp"
#include "codec/error_codec.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace verdict::codec {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

const Json::Value* FieldReader::find(std::string_view name) const {
    if (!object_.isObject()) return nullptr;

    if (const Json::Value* exact =
            object_.find(name.data(), name.data() + name.size())) {
        return exact;
    }
    for (auto it = object_.begin(); it != object_.end(); ++it) {
        if (iequals(it.name(), name)) return &*it;
    }
    return nullptr;
}

const ErrorCode& FieldReader::code(std::string_view name) const {
    const Json::Value* value = find(name);
    if (!value) {
        throw DecodeError("missing field '" + std::string(name) + "'");
    }
    return codec_.decode_code(*value);
}

void FieldWriter::check_name(std::string_view name) {
    for (std::string_view reserved : {"$type", "code", "description"}) {
        if (iequals(name, reserved)) {
            throw std::invalid_argument("Field '" + std::string(name) +
                                        "' is reserved for the Error codec");
        }
    }
}

} // namespace verdict::codec
