#include "replica/status_code.hpp"

#include <ostream>

namespace replica {

auto from_http(std::uint16_t code) noexcept -> std::optional<StatusCode> {
    switch (code) {
        case 200: return StatusCode::Ok;
        case 201: return StatusCode::Created;
        case 204: return StatusCode::NoContent;
        case 304: return StatusCode::NotModified;
        case 400: return StatusCode::ValidationFailed;
        case 401: return StatusCode::Unauthorized;
        case 403: return StatusCode::Forbidden;
        case 404: return StatusCode::NotFound;
        case 405: return StatusCode::MethodNotAllowed;
        case 409: return StatusCode::Conflict;
        case 413: return StatusCode::PayloadTooBig;
        case 415: return StatusCode::UnsupportedMediaType;
        case 429: return StatusCode::RateLimited;
        case 500: return StatusCode::ServerError;
        case 501: return StatusCode::NotImplemented;
        case 901: return StatusCode::FetchFailed;
        case 902: return StatusCode::FetchTimeout;
        case 903: return StatusCode::DecodeFailed;
        case 904: return StatusCode::Cancelled;
        default: return std::nullopt;
    }
}

auto to_string(StatusCode code) noexcept -> std::string_view {
    switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::Created: return "created";
        case StatusCode::NoContent: return "no_content";
        case StatusCode::NotModified: return "not_modified";
        case StatusCode::ValidationFailed: return "validation_failed";
        case StatusCode::Unauthorized: return "unauthorized";
        case StatusCode::Forbidden: return "forbidden";
        case StatusCode::NotFound: return "not_found";
        case StatusCode::MethodNotAllowed: return "method_not_allowed";
        case StatusCode::Conflict: return "conflict";
        case StatusCode::PayloadTooBig: return "payload_too_big";
        case StatusCode::UnsupportedMediaType: return "unsupported_media_type";
        case StatusCode::RateLimited: return "rate_limited";
        case StatusCode::ServerError: return "server_error";
        case StatusCode::NotImplemented: return "not_implemented";
        case StatusCode::FetchFailed: return "fetch_failed";
        case StatusCode::FetchTimeout: return "fetch_timeout";
        case StatusCode::DecodeFailed: return "decode_failed";
        case StatusCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, StatusCode code) -> std::ostream& {
    return os << to_string(code);
}

} // namespace replica
