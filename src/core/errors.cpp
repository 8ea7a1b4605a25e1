#include "core/errors.hpp"

#include <typeinfo>

#if defined(__GNUG__)
#include <cstdlib>
#include <cxxabi.h>
#endif

namespace verdict {

namespace {

/// Unqualified, demangled name of the exception's dynamic type.
std::string exception_type_name(const std::exception& ex) {
    std::string name = typeid(ex).name();
#if defined(__GNUG__)
    int status = 0;
    char* demangled =
        abi::__cxa_demangle(name.c_str(), nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        name = demangled;
    }
    std::free(demangled);
#endif
    auto pos = name.rfind("::");
    if (pos != std::string::npos) {
        name = name.substr(pos + 2);
    }
    // MSVC prefixes "class " / "struct "
    pos = name.rfind(' ');
    if (pos != std::string::npos) {
        name = name.substr(pos + 1);
    }
    return name;
}

} // namespace

ErrorPtr Error::api_error(std::string description) {
    return make_error<ApiError>(std::move(description));
}

ErrorPtr Error::business_rule_violation(std::string description) {
    return make_error<BusinessRuleViolationError>(std::move(description));
}

ErrorPtr Error::configuration(std::string description) {
    return make_error<ConfigurationError>(std::move(description));
}

ErrorPtr Error::conflict(std::string description) {
    return make_error<ConflictError>(std::move(description));
}

ErrorPtr Error::not_found(std::string description) {
    return make_error<NotFoundError>(std::move(description));
}

ErrorPtr Error::unauthorized(std::string description) {
    return make_error<UnauthorizedError>(std::move(description));
}

ErrorPtr Error::validation(std::string description) {
    return make_error<ValidationError>(std::move(description));
}

ErrorPtr Error::from_exception(const std::exception& ex) {
    return make_error<UnhandledExceptionError>(exception_type_name(ex) +
                                               ": " + ex.what());
}

} // namespace verdict
