#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/cpp_int/serialize.hpp>

namespace tessera::protocol {

/**
 * Every quantity in the system, token or currency, is an unsigned 256-bit
 * integer counted in the smallest unit. One whole unit is `scale` smallest
 * units. There is no floating point anywhere.
 */
using amount = boost::multiprecision::uint256_t;

constexpr unsigned int decimals      = 18;
constexpr std::size_t amount_length = 32;

inline const amount scale{ 1'000'000'000'000'000'000ull };

using amount_bytes = std::array< std::byte, amount_length >;

// Little endian, zero padded to amount_length bytes.
amount_bytes to_bytes( const amount& value ) noexcept;
amount from_bytes( std::span< const std::byte > bytes );

/**
 * Parses a decimal quantity expressed in whole units ("1.5", "1000") into
 * smallest units. Fails on malformed input, on more fractional digits than
 * `dec`, and on values that do not fit in an amount.
 */
std::optional< amount > parse_units( std::string_view str, unsigned int dec = decimals );
std::string format_units( const amount& value, unsigned int dec = decimals );

} // namespace tessera::protocol
