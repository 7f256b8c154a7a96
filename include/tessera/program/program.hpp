#pragma once

#include <span>
#include <string>
#include <system_error>

#include <tessera/program/system_interface.hpp>

namespace tessera::program {

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  /**
   * Runs once when the program is deployed, reading its construction input
   * from stdin.
   */
  virtual std::error_code construct( system_interface* system, std::span< const std::string > arguments ) = 0;

  // Every later call: one instruction on stdin, answered on stdout
  virtual std::error_code run( system_interface* system, std::span< const std::string > arguments ) = 0;
};

} // namespace tessera::program
