#pragma once

#include <tessera/program/error.hpp>
#include <tessera/protocol.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * The interface a native program uses to interact with the host. Every call
 * acts on behalf of the program at the top of the call stack.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                       = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;

  /**
   * Reads exactly buffer.size() bytes. Fails without consuming anything if
   * fewer bytes remain.
   */
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer ) = 0;
  virtual std::size_t remaining( file_descriptor fd )                                = 0;

  /**
   * Returns an empty span when the object does not exist. The span is
   * invalidated by the next state write.
   */
  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code event( std::string_view name,
                                 std::span< const std::byte > data,
                                 const std::vector< protocol::account >& impacted ) = 0;

  virtual result< bool > check_authority( protocol::account_view account ) = 0;

  virtual protocol::account get_caller() = 0;
  virtual protocol::account get_self()   = 0;

  /**
   * Milliseconds since epoch of the transaction being applied.
   */
  virtual std::uint64_t get_time() = 0;

  /**
   * Native currency attached to the current call.
   */
  virtual protocol::amount get_value() = 0;

  virtual protocol::amount get_currency_balance( protocol::account_view account ) = 0;

  /**
   * Pays native currency from the current program. Paying a program account
   * invokes that program with an empty input.
   */
  virtual std::error_code transfer_currency( protocol::account_view to, const protocol::amount& value ) = 0;

  virtual result< protocol::program_output > call_program( protocol::account_view account,
                                                           std::span< const std::byte > stdin,
                                                           std::span< const std::string > arguments = {},
                                                           const protocol::amount& value            = 0 ) = 0;
};

} // namespace tessera::program
