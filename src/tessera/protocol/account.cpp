#include <tessera/protocol/account.hpp>

#include <tessera/encode/hex.hpp>

#include <algorithm>
#include <utility>

namespace tessera::protocol {

constexpr auto user_account_prefix    = std::byte{ std::to_underlying( account_type::user ) };
constexpr auto program_account_prefix = std::byte{ std::to_underlying( account_type::program ) };

static account_type account_prefix_to_type( std::byte prefix ) noexcept
{
  switch( std::to_integer< std::uint8_t >( prefix ) )
  {
    case std::to_underlying( account_type::user ):
      return account_type::user;
    case std::to_underlying( account_type::program ):
      return account_type::program;
    default:
      return account_type::invalid;
  }
}

static bool is_null( std::span< const std::byte, account_length > bytes ) noexcept
{
  return std::ranges::all_of( bytes,
                              []( std::byte b )
                              {
                                return b == std::byte{ 0x00 };
                              } );
}

static account make_account( std::byte prefix, std::string_view name ) noexcept
{
  account a{};
  a.at( 0 ) = prefix;

  std::size_t length = std::min( name.length(), a.size() - 1 );
  for( std::size_t i = 0; i < length; ++i )
    a.at( i + 1 ) = static_cast< std::byte >( name[ i ] );

  return a;
}

bool account::null() const noexcept
{
  return is_null( *this );
}

bool account::user() const noexcept
{
  return at( 0 ) == user_account_prefix;
}

bool account::program() const noexcept
{
  return at( 0 ) == program_account_prefix;
}

account_type account::type() const noexcept
{
  return account_prefix_to_type( at( 0 ) );
}

account_view::account_view( const account& acc ) noexcept:
    std::span< const std::byte, account_length >( acc )
{}

account_view::account_view( const std::byte* ptr, std::size_t length ) noexcept:
    std::span< const std::byte, account_length >( ptr, length )
{}

bool account_view::null() const noexcept
{
  return is_null( *this );
}

bool account_view::user() const noexcept
{
  return ( *this )[ 0 ] == user_account_prefix;
}

bool account_view::program() const noexcept
{
  return ( *this )[ 0 ] == program_account_prefix;
}

account_type account_view::type() const noexcept
{
  return account_prefix_to_type( ( *this )[ 0 ] );
}

account account_view::to_account() const noexcept
{
  account a;
  std::ranges::copy( *this, a.begin() );
  return a;
}

account user_account( std::string_view name ) noexcept
{
  return make_account( user_account_prefix, name );
}

account user_account( const account& acc ) noexcept
{
  account a = acc;
  a.at( 0 ) = user_account_prefix;
  return a;
}

account program_account( std::string_view name ) noexcept
{
  return make_account( program_account_prefix, name );
}

account program_account( const account& acc ) noexcept
{
  account a = acc;
  a.at( 0 ) = program_account_prefix;
  return a;
}

encode::result< account > account_from_hex( std::string_view hex ) noexcept
{
  auto bytes = encode::from_hex( hex );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != account_length )
    return std::unexpected( encode::encode_errc::unexpected_size );

  account a{};
  std::ranges::copy( *bytes, a.begin() );

  if( a.type() == account_type::invalid )
    return std::unexpected( encode::encode_errc::unknown_account_type );

  return a;
}

} // namespace tessera::protocol
