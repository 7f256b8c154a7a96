#include <tessera/protocol/amount.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <vector>

#include <tessera/memory.hpp>

namespace tessera::protocol {

amount_bytes to_bytes( const amount& value ) noexcept
{
  std::vector< std::uint8_t > limbs;
  limbs.reserve( amount_length );
  boost::multiprecision::export_bits( value, std::back_inserter( limbs ), 8, false );

  amount_bytes bytes{};
  for( std::size_t i = 0; i < std::min( limbs.size(), amount_length ); ++i )
    bytes[ i ] = std::byte{ limbs[ i ] };

  return bytes;
}

amount from_bytes( std::span< const std::byte > bytes )
{
  if( bytes.size() != amount_length )
    throw std::runtime_error( "unexpected amount length" );

  const auto* begin = memory::pointer_cast< const std::uint8_t* >( bytes.data() );

  amount value;
  boost::multiprecision::import_bits( value, begin, begin + bytes.size(), 8, false );
  return value;
}

static amount power_of_ten( unsigned int exponent )
{
  amount value = 1;
  for( unsigned int i = 0; i < exponent; ++i )
    value *= 10;
  return value;
}

std::optional< amount > parse_units( std::string_view str, unsigned int dec )
{
  static constexpr auto max_digits = std::numeric_limits< amount >::digits10;

  if( str.empty() )
    return {};

  auto point             = str.find( '.' );
  std::string_view whole = str.substr( 0, point );
  std::string_view fraction;

  if( point != std::string_view::npos )
  {
    fraction = str.substr( point + 1 );
    if( fraction.empty() || fraction.size() > dec )
      return {};
  }

  if( whole.empty() )
    return {};

  auto is_digit = []( char c )
  {
    return c >= '0' && c <= '9';
  };

  if( !std::ranges::all_of( whole, is_digit ) || !std::ranges::all_of( fraction, is_digit ) )
    return {};

  std::string digits( whole );
  digits.append( fraction );
  digits.append( dec - fraction.size(), '0' );

  auto first = digits.find_first_not_of( '0' );
  if( first == std::string::npos )
    return amount( 0 );

  digits.erase( 0, first );

  if( digits.size() > static_cast< std::size_t >( max_digits ) + 1 )
    return {};

  // Accumulate in a wider type to detect values that do not fit.
  boost::multiprecision::uint512_t value = 0;
  for( char c: digits )
    value = value * 10 + ( c - '0' );

  if( value > boost::multiprecision::uint512_t( std::numeric_limits< amount >::max() ) )
    return {};

  return value.convert_to< amount >();
}

std::string format_units( const amount& value, unsigned int dec )
{
  auto divisor  = power_of_ten( dec );
  auto whole    = value / divisor;
  auto fraction = value % divisor;

  std::string result = whole.str();

  if( fraction != 0 )
  {
    auto digits = fraction.str();
    digits.insert( 0, dec - digits.size(), '0' );
    digits.erase( digits.find_last_not_of( '0' ) + 1 );
    result += '.';
    result += digits;
  }

  return result;
}

} // namespace tessera::protocol
