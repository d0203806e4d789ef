#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace rangevec::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  data_integrity = 3001,
  precondition_failed = 4001,
  overlap = 4002,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
  invalid_size = 9006,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "codec.load" */
};

/** \brief Stable lowercase name of a code ("overlap", "out_of_range", ...). */
auto to_string(error_code ec) -> std::string_view;

} // namespace rangevec::core
