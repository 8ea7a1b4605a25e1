#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace verdict {

/// Identity token for an error category.
///
/// Every concrete code is a process-wide singleton (see SingletonErrorCode).
/// Equality is structural: two codes are equal when they have the same dynamic
/// type and the same name. The codec resolves decoded codes back to the
/// registered singleton, so pointer comparisons also hold across the wire.
class ErrorCode {
public:
    virtual ~ErrorCode() = default;

    ErrorCode(const ErrorCode&) = delete;
    ErrorCode& operator=(const ErrorCode&) = delete;

    /// Stable, human-readable identifier of the category.
    virtual std::string_view name() const = 0;

    std::string to_string() const { return std::string(name()); }
    operator std::string() const { return to_string(); }

    bool operator==(const ErrorCode& other) const;

    std::size_t hash() const;

protected:
    ErrorCode() = default;
};

/// Lazily constructed singleton holder for a concrete code.
/// Derived keeps its default constructor private and befriends this class.
template <typename Derived>
class SingletonErrorCode : public ErrorCode {
public:
    static const Derived& instance() {
        static const Derived code{};
        return code;
    }

protected:
    SingletonErrorCode() = default;
};

} // namespace verdict

namespace std {
template <>
struct hash<verdict::ErrorCode> {
    size_t operator()(const verdict::ErrorCode& code) const {
        return code.hash();
    }
};
} // namespace std
