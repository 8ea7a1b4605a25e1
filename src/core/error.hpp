#pragma once

#include "core/error_code.hpp"
#include "core/types.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace verdict {

/// A failure: an ErrorCode paired with a human-readable description.
///
/// The hierarchy is open. Consumers derive their own variants (optionally
/// with extra fields) and register them with codec::TypeRegistry to make
/// them serializable; nothing here needs to change when they do.
class Error {
public:
    /// Throws std::invalid_argument if description is empty or whitespace.
    Error(const ErrorCode& code, std::string description);
    virtual ~Error() = default;

    Error(const Error&) = default;
    Error& operator=(const Error&) = delete;

    const ErrorCode& code() const { return *code_; }
    const std::string& description() const { return description_; }

    /// True if the dynamic type of this error is V or derives from V.
    template <typename V>
    bool is_error_type() const {
        return dynamic_cast<const V*>(this) != nullptr;
    }

    /// Typed view of this error, or nullptr if it is not a V.
    template <typename V>
    const V* as() const {
        return dynamic_cast<const V*>(this);
    }

    static ErrorPtr api_error(std::string description);
    static ErrorPtr business_rule_violation(std::string description);
    static ErrorPtr configuration(std::string description);
    static ErrorPtr conflict(std::string description);
    static ErrorPtr not_found(std::string description);
    static ErrorPtr unauthorized(std::string description);
    static ErrorPtr validation(std::string description);

    /// Wraps an exception nobody handled. Only the exception's type name and
    /// message are kept: "runtime_error: disk full".
    static ErrorPtr from_exception(const std::exception& ex);

private:
    const ErrorCode* code_;
    std::string description_;
};

/// Build any Error variant behind an ErrorPtr.
template <typename E, typename... Args>
ErrorPtr make_error(Args&&... args) {
    return std::make_shared<const E>(std::forward<Args>(args)...);
}

} // namespace verdict
