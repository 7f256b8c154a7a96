#pragma once

#include <cstring>
#include <memory>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace tessera::memory {

// Reinterprets a byte pointer as a pointer to trivially copyable data
template< typename T, typename U >
  requires( std::is_pointer_v< T > && std::is_trivially_copyable_v< std::remove_pointer_t< T > > )
T pointer_cast( U* p )
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

// Reads a fixed width value, such as a stored nonce or timestamp, out of an object
template< typename T >
  requires( !std::is_pointer_v< T > && std::is_trivially_copyable_v< T > )
T bit_cast( std::span< const std::byte > bytes )
{
  if( bytes.size() < sizeof( T ) )
    throw std::runtime_error( "object is smaller than the value stored in it" );

  T value;
  std::memcpy( &value, bytes.data(), sizeof( T ) );
  return value;
}

// Contiguous ranges: strings, vectors and arrays
template< std::ranges::contiguous_range T >
std::span< const std::byte > as_bytes( const T& range )
{
  return std::as_bytes( std::span( std::ranges::data( range ), std::ranges::size( range ) ) );
}

template< typename T >
  requires( !std::ranges::range< T > && std::is_trivially_copyable_v< T > )
std::span< const std::byte > as_bytes( const T& value )
{
  return std::as_bytes( std::span( std::addressof( value ), 1 ) );
}

template< typename T >
  requires( !std::ranges::range< T > && std::is_trivially_copyable_v< T > )
std::span< std::byte > as_writable_bytes( T& value )
{
  return std::as_writable_bytes( std::span( std::addressof( value ), 1 ) );
}

inline std::string_view as_string_view( std::span< const std::byte > bytes )
{
  return std::string_view( pointer_cast< const char* >( bytes.data() ), bytes.size() );
}

} // namespace tessera::memory
