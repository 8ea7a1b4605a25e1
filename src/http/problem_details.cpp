#include "http/problem_details.hpp"
#include "core/errors.hpp"

namespace verdict::http {

Json::Value ProblemDetails::to_json() const {
    Json::Value out(Json::objectValue);
    out["status"] = status;
    out["title"] = title;
    out["detail"] = detail;
    out["type"] = type;
    return out;
}

int status_for(const Error& error) {
    if (error.is_error_type<NotFoundError>()) return 404;
    if (error.is_error_type<ValidationError>()) return 400;
    if (error.is_error_type<ConflictError>()) return 409;
    if (error.is_error_type<UnauthorizedError>()) return 401;
    return 400;
}

ProblemDetails to_problem_details(const Error& error) {
    ProblemDetails problem;
    problem.status = status_for(error);
    problem.title = error.code().to_string();
    problem.detail = error.description();
    problem.type = "https://httpstatuses.com/" + std::to_string(problem.status);
    return problem;
}

ApiResponse problem_response(const Error& error) {
    ProblemDetails problem = to_problem_details(error);
    ApiResponse response;
    response.status = problem.status;
    response.headers["Content-Type"] = "application/problem+json";
    response.body = problem.to_json();
    return response;
}

} // namespace verdict::http
