#include <tessera/program/codec.hpp>
#include <tessera/program/events.hpp>
#include <tessera/program/permission_store.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace tessera::program {

namespace {

std::vector< std::byte > role_key( role r, protocol::account_view principal )
{
  std::vector< std::byte > key;
  codec::append( key, std::to_underlying( r ) );
  key.insert( key.end(), principal.begin(), principal.end() );
  return key;
}

constexpr std::byte granted_flag{ 0x01 };

} // namespace

permission_store::permission_store( system_interface* system ) noexcept:
    _system( system )
{}

std::error_code permission_store::initialize( const protocol::account& admin, std::uint64_t admin_delay )
{
  if( !_system->get_object( admin_id, {} ).empty() )
    return program_errc::already_initialized;

  if( admin.null() )
    return program_errc::zero_address;

  if( auto error = _system->put_object( admin_id, {}, admin ); error )
    return error;

  return _system->put_object( admin_delay_id, {}, codec::encode( admin_delay ) );
}

bool permission_store::has_permission( protocol::account_view principal, role r ) const
{
  if( r == role::admin )
    return std::ranges::equal( principal, admin() );

  return !_system->get_object( role_id, role_key( r, principal ) ).empty();
}

protocol::account permission_store::admin() const
{
  protocol::account account{};
  codec::reader reader( _system->get_object( admin_id, {} ) );

  if( reader.read( account ) )
    return protocol::account{};

  return account;
}

std::optional< pending_admin > permission_store::pending() const
{
  auto object = _system->get_object( pending_admin_id, {} );
  if( object.empty() )
    return {};

  pending_admin p;
  codec::reader reader( object );

  if( reader.read( p.candidate ) || reader.read( p.not_before ) )
    throw std::runtime_error( "malformed pending admin record" );

  return p;
}

std::uint64_t permission_store::admin_delay() const
{
  std::uint64_t delay = 0;
  codec::reader reader( _system->get_object( admin_delay_id, {} ) );

  if( reader.read( delay ) )
    return 0;

  return delay;
}

std::error_code permission_store::set_role( const protocol::account& sender,
                                            role r,
                                            const protocol::account& principal,
                                            bool granted )
{
  if( r == role::admin )
    return program_errc::invalid_argument;

  if( principal.null() )
    return program_errc::zero_address;

  if( has_permission( principal, r ) == granted )
    return program_errc::ok;

  auto key = role_key( r, principal );

  if( granted )
  {
    if( auto error = _system->put_object( role_id, key, std::span( &granted_flag, 1 ) ); error )
      return error;
  }
  else
  {
    if( auto error = _system->remove_object( role_id, key ); error )
      return error;
  }

  return emit( _system,
               granted ? event_name::role_granted : event_name::role_revoked,
               role_event{ .role = r, .account = principal, .sender = sender },
               { principal } );
}

std::error_code
permission_store::grant( const protocol::account& sender, role r, const protocol::account& principal )
{
  if( !has_permission( sender, role::admin ) )
    return program_errc::unauthorized;

  return set_role( sender, r, principal, true );
}

std::error_code
permission_store::revoke( const protocol::account& sender, role r, const protocol::account& principal )
{
  if( !has_permission( sender, role::admin ) )
    return program_errc::unauthorized;

  return set_role( sender, r, principal, false );
}

std::error_code
permission_store::renounce( const protocol::account& sender, role r, const protocol::account& principal )
{
  if( sender != principal )
    return program_errc::unauthorized;

  return set_role( sender, r, principal, false );
}

std::error_code permission_store::propose_admin( const protocol::account& sender,
                                                 const protocol::account& candidate,
                                                 std::uint64_t not_before )
{
  auto current = admin();

  if( sender != current )
    return program_errc::unauthorized;

  if( candidate.null() )
    return program_errc::zero_address;

  auto now   = _system->get_time();
  auto delay = admin_delay();

  if( std::numeric_limits< std::uint64_t >::max() - delay < now )
    return program_errc::overflow;

  pending_admin p{ .candidate = candidate, .not_before = std::max( not_before, now + delay ) };

  if( auto error = _system->put_object( pending_admin_id, {}, codec::encode( p.candidate, p.not_before ) ); error )
    return error;

  return emit( _system,
               event_name::admin_transfer_proposed,
               admin_transfer_event{ .admin = current, .candidate = p.candidate, .not_before = p.not_before },
               { current, p.candidate } );
}

std::error_code permission_store::accept_admin( const protocol::account& sender )
{
  auto p = pending();

  if( !p || sender != p->candidate )
    return program_errc::unauthorized;

  if( _system->get_time() < p->not_before )
    return program_errc::too_early;

  auto previous = admin();

  if( auto error = _system->put_object( admin_id, {}, p->candidate ); error )
    return error;

  if( auto error = _system->remove_object( pending_admin_id, {} ); error )
    return error;

  return emit( _system,
               event_name::admin_transfer_accepted,
               admin_transfer_event{ .admin = previous, .candidate = p->candidate, .not_before = p->not_before },
               { previous, p->candidate } );
}

std::error_code permission_store::cancel_admin( const protocol::account& sender )
{
  auto current = admin();

  if( sender != current )
    return program_errc::unauthorized;

  auto p = pending();
  if( !p )
    return program_errc::no_pending_transfer;

  if( auto error = _system->remove_object( pending_admin_id, {} ); error )
    return error;

  return emit( _system,
               event_name::admin_transfer_canceled,
               admin_transfer_event{ .admin = current, .candidate = p->candidate, .not_before = p->not_before },
               { current, p->candidate } );
}

} // namespace tessera::program
