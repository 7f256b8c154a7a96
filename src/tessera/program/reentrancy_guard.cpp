#include <tessera/log.hpp>
#include <tessera/program/reentrancy_guard.hpp>

#include <utility>

namespace tessera::program {

constexpr std::byte locked{ 0x01 };

reentrancy_guard::reentrancy_guard( system_interface* system, std::uint32_t id ) noexcept:
    _system( system ),
    _id( id )
{}

reentrancy_guard::reentrancy_guard( reentrancy_guard&& other ) noexcept:
    _system( std::exchange( other._system, nullptr ) ),
    _id( other._id )
{}

reentrancy_guard::~reentrancy_guard()
{
  if( !_system )
    return;

  if( auto error = _system->remove_object( _id, {} ); error )
    LOG_ERROR( tessera::log::instance(), "Failed to release reentrancy guard: {}", error.message() );
}

bool reentrancy_guard::held( system_interface* system, std::uint32_t id )
{
  return !system->get_object( id, {} ).empty();
}

result< reentrancy_guard > reentrancy_guard::acquire( system_interface* system, std::uint32_t id )
{
  if( held( system, id ) )
    return std::unexpected( program_errc::reentrant_call );

  if( auto error = system->put_object( id, {}, std::span( &locked, 1 ) ); error )
    return std::unexpected( error );

  return reentrancy_guard( system, id );
}

} // namespace tessera::program
