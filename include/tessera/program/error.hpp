#pragma once

#include <expected>
#include <system_error>

namespace tessera::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  unauthorized,
  invalid_instruction,
  insufficient_balance,
  insufficient_allowance,
  insufficient_reserve,
  invalid_argument,
  zero_amount,
  zero_address,
  max_supply_reached,
  paused,
  not_paused,
  too_early,
  no_pending_transfer,
  reentrant_call,
  unexpected_payload,
  unexpected_value,
  already_initialized,
  overflow
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::program

template<>
struct std::is_error_code_enum< tessera::program::program_errc >: public std::true_type
{};
