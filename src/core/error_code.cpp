#include "core/error_code.hpp"

#include <typeindex>
#include <typeinfo>

namespace verdict {

bool ErrorCode::operator==(const ErrorCode& other) const {
    if (this == &other) return true;
    return typeid(*this) == typeid(other) && name() == other.name();
}

std::size_t ErrorCode::hash() const {
    std::size_t h = std::type_index(typeid(*this)).hash_code();
    // boost::hash_combine mixing
    h ^= std::hash<std::string_view>{}(name()) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

} // namespace verdict
