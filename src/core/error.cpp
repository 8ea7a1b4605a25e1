#include "core/error.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace verdict {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

Error::Error(const ErrorCode& code, std::string description)
    : code_(&code), description_(std::move(description)) {
    if (is_blank(description_)) {
        throw std::invalid_argument(
            "Error description must not be empty or whitespace (code " +
            code.to_string() + ")");
    }
}

} // namespace verdict
