#pragma once

#include "codec/error_codec.hpp"
#include "codec/json_traits.hpp"
#include "core/error.hpp"
#include "core/result.hpp"

#include <json/json.h>

#include <map>
#include <string>
#include <type_traits>

namespace verdict::http {

/// RFC 7807 problem body describing a failed Result.
struct ProblemDetails {
    int status = 400;
    std::string title;  ///< Error code name
    std::string detail; ///< Error description
    std::string type;   ///< https://httpstatuses.com/<status>

    Json::Value to_json() const;
};

/// Response produced at an HTTP boundary. Framework-neutral: the host
/// copies status, headers and body into whatever server it runs.
struct ApiResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    Json::Value body;
};

/// NotFound 404, Validation 400, Conflict 409, Unauthorized 401,
/// anything else 400.
int status_for(const Error& error);

ProblemDetails to_problem_details(const Error& error);

/// Failure response for an error.
ApiResponse problem_response(const Error& error);

/// 200 with the encoded value (no body for Result<void>), or problem details.
template <typename T>
ApiResponse to_api_response(const Result<T>& result,
                            const codec::ErrorCodec& codec = codec::ErrorCodec()) {
    if (result.is_failure()) return problem_response(*result.error());

    ApiResponse response;
    response.status = 200;
    if constexpr (!std::is_void_v<T>) {
        response.body = codec::JsonTraits<T>::encode(result.value(), codec);
    }
    return response;
}

/// 201 with a Location header, or problem details.
template <typename T>
ApiResponse to_created_response(const Result<T>& result,
                                const std::string& location,
                                const codec::ErrorCodec& codec = codec::ErrorCodec()) {
    ApiResponse response = to_api_response(result, codec);
    if (result.is_success()) {
        response.status = 201;
        response.headers["Location"] = location;
    }
    return response;
}

} // namespace verdict::http
