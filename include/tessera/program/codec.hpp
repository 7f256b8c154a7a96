#pragma once

#include <tessera/program/error.hpp>
#include <tessera/program/system_interface.hpp>
#include <tessera/protocol.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * Wire format shared by program inputs, outputs and stored objects. Integers
 * and amounts are little endian and fixed width, accounts are their 32 raw
 * bytes and strings are prefixed with a 32 bit length.
 */
namespace tessera::program::codec {

void append( std::vector< std::byte >& buffer, std::uint8_t value );
void append( std::vector< std::byte >& buffer, std::uint32_t value );
void append( std::vector< std::byte >& buffer, std::uint64_t value );
void append( std::vector< std::byte >& buffer, const protocol::account& value );
void append( std::vector< std::byte >& buffer, const protocol::amount& value );
void append( std::vector< std::byte >& buffer, std::string_view value );

template< typename... Args >
std::vector< std::byte > encode( const Args&... args )
{
  std::vector< std::byte > buffer;
  ( append( buffer, args ), ... );
  return buffer;
}

class reader final
{
public:
  explicit reader( std::span< const std::byte > buffer ) noexcept;

  std::error_code read( std::uint8_t& value );
  std::error_code read( std::uint32_t& value );
  std::error_code read( std::uint64_t& value );
  std::error_code read( protocol::account& value );
  std::error_code read( protocol::amount& value );
  std::error_code read( std::string& value );

  std::size_t remaining() const noexcept;

private:
  std::error_code take( std::span< std::byte > out );

  std::span< const std::byte > _buffer;
  std::size_t _offset = 0;
};

// Reads from the program's stdin, failing with unexpected_payload on short input.
std::error_code read( system_interface* system, std::uint8_t& value );
std::error_code read( system_interface* system, std::uint32_t& value );
std::error_code read( system_interface* system, std::uint64_t& value );
std::error_code read( system_interface* system, protocol::account& value );
std::error_code read( system_interface* system, protocol::amount& value );
std::error_code read( system_interface* system, std::string& value );

template< typename... Args >
std::error_code read_all( system_interface* system, Args&... args )
{
  std::error_code error;
  ( ( error = error ? error : read( system, args ) ), ... );
  return error;
}

/**
 * Fails with unexpected_payload when stdin holds bytes past a complete instruction.
 */
std::error_code expect_end( system_interface* system );

std::error_code write( system_interface* system, std::uint8_t value );
std::error_code write( system_interface* system, std::uint32_t value );
std::error_code write( system_interface* system, std::uint64_t value );
std::error_code write( system_interface* system, const protocol::account& value );
std::error_code write( system_interface* system, const protocol::amount& value );
std::error_code write( system_interface* system, std::string_view value );

} // namespace tessera::program::codec
