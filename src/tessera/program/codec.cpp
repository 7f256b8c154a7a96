#include <tessera/memory.hpp>
#include <tessera/program/codec.hpp>

#include <boost/endian.hpp>

#include <algorithm>
#include <array>
#include <limits>

namespace tessera::program::codec {

namespace {

void append_bytes( std::vector< std::byte >& buffer, std::span< const std::byte > bytes )
{
  buffer.insert( buffer.end(), bytes.begin(), bytes.end() );
}

std::error_code read_bytes( system_interface* system, std::span< std::byte > out )
{
  if( system->remaining( file_descriptor::stdin ) < out.size() )
    return program_errc::unexpected_payload;

  return system->read( file_descriptor::stdin, out );
}

template< typename T >
std::error_code read_integer( system_interface* system, T& value )
{
  if( auto error = read_bytes( system, memory::as_writable_bytes( value ) ); error )
    return error;

  boost::endian::little_to_native_inplace( value );
  return program_errc::ok;
}

template< typename T >
std::error_code write_integer( system_interface* system, T value )
{
  boost::endian::native_to_little_inplace( value );
  return system->write( file_descriptor::stdout, memory::as_bytes( value ) );
}

} // namespace

void append( std::vector< std::byte >& buffer, std::uint8_t value )
{
  buffer.push_back( std::byte{ value } );
}

void append( std::vector< std::byte >& buffer, std::uint32_t value )
{
  boost::endian::native_to_little_inplace( value );
  append_bytes( buffer, memory::as_bytes( value ) );
}

void append( std::vector< std::byte >& buffer, std::uint64_t value )
{
  boost::endian::native_to_little_inplace( value );
  append_bytes( buffer, memory::as_bytes( value ) );
}

void append( std::vector< std::byte >& buffer, const protocol::account& value )
{
  append_bytes( buffer, value );
}

void append( std::vector< std::byte >& buffer, const protocol::amount& value )
{
  append_bytes( buffer, protocol::to_bytes( value ) );
}

void append( std::vector< std::byte >& buffer, std::string_view value )
{
  append( buffer, static_cast< std::uint32_t >( value.size() ) );
  append_bytes( buffer, memory::as_bytes( value ) );
}

reader::reader( std::span< const std::byte > buffer ) noexcept:
    _buffer( buffer )
{}

std::error_code reader::take( std::span< std::byte > out )
{
  if( remaining() < out.size() )
    return program_errc::unexpected_payload;

  std::ranges::copy( _buffer.subspan( _offset, out.size() ), out.begin() );
  _offset += out.size();
  return program_errc::ok;
}

std::error_code reader::read( std::uint8_t& value )
{
  return take( memory::as_writable_bytes( value ) );
}

std::error_code reader::read( std::uint32_t& value )
{
  if( auto error = take( memory::as_writable_bytes( value ) ); error )
    return error;

  boost::endian::little_to_native_inplace( value );
  return program_errc::ok;
}

std::error_code reader::read( std::uint64_t& value )
{
  if( auto error = take( memory::as_writable_bytes( value ) ); error )
    return error;

  boost::endian::little_to_native_inplace( value );
  return program_errc::ok;
}

std::error_code reader::read( protocol::account& value )
{
  return take( value );
}

std::error_code reader::read( protocol::amount& value )
{
  protocol::amount_bytes bytes{};
  if( auto error = take( bytes ); error )
    return error;

  value = protocol::from_bytes( bytes );
  return program_errc::ok;
}

std::error_code reader::read( std::string& value )
{
  std::uint32_t length = 0;
  if( auto error = read( length ); error )
    return error;

  if( remaining() < length )
    return program_errc::unexpected_payload;

  value.resize( length );
  return take( std::as_writable_bytes( std::span( value ) ) );
}

std::size_t reader::remaining() const noexcept
{
  return _buffer.size() - _offset;
}

std::error_code read( system_interface* system, std::uint8_t& value )
{
  return read_bytes( system, memory::as_writable_bytes( value ) );
}

std::error_code read( system_interface* system, std::uint32_t& value )
{
  return read_integer( system, value );
}

std::error_code read( system_interface* system, std::uint64_t& value )
{
  return read_integer( system, value );
}

std::error_code read( system_interface* system, protocol::account& value )
{
  return read_bytes( system, value );
}

std::error_code read( system_interface* system, protocol::amount& value )
{
  protocol::amount_bytes bytes{};
  if( auto error = read_bytes( system, bytes ); error )
    return error;

  value = protocol::from_bytes( bytes );
  return program_errc::ok;
}

std::error_code read( system_interface* system, std::string& value )
{
  std::uint32_t length = 0;
  if( auto error = read_integer( system, length ); error )
    return error;

  if( system->remaining( file_descriptor::stdin ) < length )
    return program_errc::unexpected_payload;

  value.resize( length );
  return read_bytes( system, std::as_writable_bytes( std::span( value ) ) );
}

std::error_code expect_end( system_interface* system )
{
  if( system->remaining( file_descriptor::stdin ) )
    return program_errc::unexpected_payload;

  return program_errc::ok;
}

std::error_code write( system_interface* system, std::uint8_t value )
{
  return system->write( file_descriptor::stdout, memory::as_bytes( value ) );
}

std::error_code write( system_interface* system, std::uint32_t value )
{
  return write_integer( system, value );
}

std::error_code write( system_interface* system, std::uint64_t value )
{
  return write_integer( system, value );
}

std::error_code write( system_interface* system, const protocol::account& value )
{
  return system->write( file_descriptor::stdout, value );
}

std::error_code write( system_interface* system, const protocol::amount& value )
{
  return system->write( file_descriptor::stdout, protocol::to_bytes( value ) );
}

std::error_code write( system_interface* system, std::string_view value )
{
  std::vector< std::byte > buffer;
  append( buffer, value );
  return system->write( file_descriptor::stdout, buffer );
}

} // namespace tessera::program::codec
