#include <tessera/encode/hex.hpp>

#include <cstdint>

namespace tessera::encode {

constexpr char hex_offset = 10;
constexpr std::string_view hex_digits = "0123456789abcdef";

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string str;
  str.reserve( 2 + s.size() * 2 );
  str += "0x";

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str += hex_digits[ value >> 4 ];
    str += hex_digits[ value & 0x0f ];
  }

  return str;
}

static result< std::uint8_t > hex_to_nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( encode_errc::invalid_digit );
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::odd_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = hex_to_nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = hex_to_nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << 4 | *low ) );
  }

  return bytes;
}

} // namespace tessera::encode
