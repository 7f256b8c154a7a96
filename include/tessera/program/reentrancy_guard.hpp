#pragma once

#include <tessera/program/error.hpp>
#include <tessera/program/system_interface.hpp>

#include <cstdint>

namespace tessera::program {

/**
 * A lock held in program state for the duration of a call. Nested calls into
 * the same program see the lock through their parent state and fail with
 * reentrant_call. The lock is released when the guard is destroyed.
 */
class reentrancy_guard final
{
public:
  reentrancy_guard( const reentrancy_guard& ) = delete;
  reentrancy_guard( reentrancy_guard&& other ) noexcept;
  ~reentrancy_guard();

  reentrancy_guard& operator=( const reentrancy_guard& ) = delete;
  reentrancy_guard& operator=( reentrancy_guard&& )      = delete;

  static result< reentrancy_guard > acquire( system_interface* system, std::uint32_t id );

  static bool held( system_interface* system, std::uint32_t id );

private:
  reentrancy_guard( system_interface* system, std::uint32_t id ) noexcept;

  system_interface* _system;
  std::uint32_t _id;
};

} // namespace tessera::program
