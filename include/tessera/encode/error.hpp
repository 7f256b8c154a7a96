#pragma once

#include <expected>
#include <system_error>

namespace tessera::encode {

/**
 * Failures decoding operator supplied text: hex strings and the accounts
 * written as hex in configuration.
 */
enum class encode_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_digit,
  odd_length,
  unexpected_size,
  unknown_account_type
};

const std::error_category& encode_category() noexcept;

std::error_code make_error_code( encode_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::encode

template<>
struct std::is_error_code_enum< tessera::encode::encode_errc >: public std::true_type
{};
