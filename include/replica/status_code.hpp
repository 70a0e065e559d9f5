#pragma once

/** \file status_code.hpp
 *  \brief Outcome of a completed transfer attempt
 *
 *  "No attempt yet" is not an enumerator: it is the empty state of
 *  std::optional<StatusCode>, so it cannot be produced by a transfer.
 */

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace replica {

enum class StatusCode : std::uint16_t {
    Ok = 200,
    Created = 201,
    NoContent = 204,
    NotModified = 304,

    ValidationFailed = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    Conflict = 409,
    PayloadTooBig = 413,
    UnsupportedMediaType = 415,
    RateLimited = 429,

    ServerError = 500,
    NotImplemented = 501,

    // Produced on the client side, never sent by a server.
    FetchFailed = 901,
    FetchTimeout = 902,
    DecodeFailed = 903,
    Cancelled = 904,
};

[[nodiscard]] constexpr auto is_success(StatusCode code) noexcept -> bool {
    switch (code) {
        case StatusCode::Ok:
        case StatusCode::Created:
        case StatusCode::NoContent:
        case StatusCode::NotModified:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr auto is_failure(StatusCode code) noexcept -> bool { return !is_success(code); }

/** \brief True for outcomes decided locally (network error, timeout, decode, cancel). */
[[nodiscard]] constexpr auto is_local(StatusCode code) noexcept -> bool {
    return code == StatusCode::FetchFailed || code == StatusCode::FetchTimeout ||
           code == StatusCode::DecodeFailed || code == StatusCode::Cancelled;
}

[[nodiscard]] constexpr auto http_code(StatusCode code) noexcept -> std::uint16_t {
    return static_cast<std::uint16_t>(code);
}

/** \brief Map a numeric code; unknown codes yield nullopt. */
[[nodiscard]] auto from_http(std::uint16_t code) noexcept -> std::optional<StatusCode>;

[[nodiscard]] constexpr auto from_bool(bool success) noexcept -> StatusCode {
    return success ? StatusCode::Ok : StatusCode::ValidationFailed;
}

/** \brief Stable snake_case name, e.g. "not_found". */
[[nodiscard]] auto to_string(StatusCode code) noexcept -> std::string_view;

auto operator<<(std::ostream& os, StatusCode code) -> std::ostream&;

} // namespace replica
