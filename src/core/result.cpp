#include "core/result.hpp"

namespace verdict {

const ErrorPtr& no_error() {
    static const ErrorPtr none =
        std::make_shared<const Error>(NoneCode::instance(), "None");
    return none;
}

namespace detail {

void check_outcome(bool ok, const ErrorPtr& error) {
    if (!error) {
        throw std::invalid_argument("Result error must not be null");
    }
    if (ok && error != no_error()) {
        throw std::invalid_argument("Success result cannot have an error");
    }
    if (!ok && (error == no_error() || error->code() == NoneCode::instance())) {
        throw std::invalid_argument("Failure result must have an error");
    }
}

} // namespace detail

} // namespace verdict
