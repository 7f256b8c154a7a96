#pragma once

#include <expected>
#include <system_error>

namespace tessera::controller {

/**
 * Failures that revert the operations of a transaction. The transaction is
 * still recorded and its nonce consumed.
 */
enum class reversion_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  failure,
  invalid_program,
  invalid_event_name,
  invalid_account,
  insufficient_funds,
  unknown_operation,
  read_only_context,
  stack_overflow,
  bad_file_descriptor,
  read_out_of_bounds,
  program_exists,
  balance_overflow
};

/**
 * Failures that reject a transaction outright. Nothing is recorded.
 */
enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  authorization_failure,
  invalid_nonce,
  malformed_transaction,
  timestamp_out_of_bounds
};

const std::error_category& reversion_category() noexcept;
const std::error_category& controller_category() noexcept;

std::error_code make_error_code( reversion_errc e );
std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::controller

template<>
struct std::is_error_code_enum< tessera::controller::reversion_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< tessera::controller::controller_errc >: public std::true_type
{};
