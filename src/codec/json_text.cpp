#include "codec/json_text.hpp"
#include "codec/codec_error.hpp"

#include <memory>

namespace verdict::codec {

std::string to_text(const Json::Value& value, int indent) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = std::string(indent > 0 ? indent : 0, ' ');
    builder["commentStyle"] = "None";
    return Json::writeString(builder, value);
}

Json::Value parse(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw DecodeError("Malformed JSON: " + errors);
    }
    return root;
}

} // namespace verdict::codec
