#pragma once

#include <json/json.h>

#include <string>
#include <string_view>

namespace verdict::codec {

/// Serialize to text. indent == 0 gives compact output
/// ({"isSuccess":true,"value":42}); otherwise members go on their own lines.
std::string to_text(const Json::Value& value, int indent = 0);

/// Parse text; malformed input throws DecodeError.
Json::Value parse(std::string_view text);

} // namespace verdict::codec
