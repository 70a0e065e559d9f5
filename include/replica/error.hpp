#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Transfer failures are not errors: they are recorded as TransferState and Messages.
 * - core::error is reserved for caller-contract violations (bad arguments, bad config,
 *   inconsistent comparators) and is returned immediately, never recovered silently.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace replica::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  precondition_failed = 4001,
  invalid_argument = 9002,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "messages.set" */
};

[[nodiscard]] constexpr auto error_code_name(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::internal: return "internal";
  }
  return "internal";
}

/** \brief Render an error as `code:component: message` for log lines. */
[[nodiscard]] inline auto describe(const error& e) -> std::string {
  std::string out{error_code_name(e.code)};
  if (!e.component.empty()) {
    out.push_back(':');
    out += e.component;
  }
  if (!e.message.empty()) {
    out += ": ";
    out += e.message;
  }
  return out;
}

} // namespace replica::core
