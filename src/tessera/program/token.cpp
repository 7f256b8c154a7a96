#include <tessera/program/codec.hpp>
#include <tessera/program/events.hpp>
#include <tessera/program/permission_store.hpp>
#include <tessera/program/token.hpp>

#include <optional>
#include <utility>

namespace tessera::program {

static constexpr std::uint32_t supply_id     = 0;
static constexpr std::uint32_t balance_id    = 1;
static constexpr std::uint32_t allowance_id  = 2;
static constexpr std::uint32_t max_supply_id = 3;
static constexpr std::uint32_t name_id       = 4;
static constexpr std::uint32_t symbol_id     = 5;
static constexpr std::uint32_t paused_id     = 6;

static constexpr std::byte set_flag{ 0x01 };

static protocol::amount to_amount( std::span< const std::byte > object )
{
  if( object.empty() )
    return 0;

  return protocol::from_bytes( object );
}

static std::vector< std::byte > allowance_key( const protocol::account& owner, const protocol::account& spender )
{
  return codec::encode( owner, spender );
}

static std::optional< role > to_role( std::uint8_t value )
{
  if( value > std::to_underlying( role::pauser ) )
    return {};

  return static_cast< role >( value );
}

protocol::amount token::total_supply( system_interface* system )
{
  return to_amount( system->get_object( supply_id, {} ) );
}

protocol::amount token::max_supply( system_interface* system )
{
  return to_amount( system->get_object( max_supply_id, {} ) );
}

protocol::amount token::balance_of( system_interface* system, const protocol::account& account )
{
  return to_amount( system->get_object( balance_id, account ) );
}

protocol::amount
token::allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender )
{
  return to_amount( system->get_object( allowance_id, allowance_key( owner, spender ) ) );
}

bool token::paused( system_interface* system )
{
  return !system->get_object( paused_id, {} ).empty();
}

std::error_code token::require_authority( system_interface* system, const protocol::account& account )
{
  if( account == system->get_caller() )
    return program_errc::ok;

  auto authorized = system->check_authority( account );
  if( !authorized )
    return authorized.error();

  return authorized.value() ? program_errc::ok : program_errc::unauthorized;
}

std::error_code token::require_unpaused( system_interface* system )
{
  return paused( system ) ? program_errc::paused : program_errc::ok;
}

// Every increase of total supply goes through here
std::error_code token::mint( system_interface* system, const protocol::account& to, const protocol::amount& value )
{
  if( to.null() )
    return program_errc::zero_address;

  if( value == 0 )
    return program_errc::zero_amount;

  auto supply = total_supply( system );
  auto cap    = max_supply( system );

  // Compared against the headroom so a huge value cannot wrap past the cap
  if( supply > cap || value > cap - supply )
    return program_errc::max_supply_reached;

  auto to_balance = balance_of( system, to );

  supply     += value;
  to_balance += value;

  if( auto error = system->put_object( supply_id, {}, protocol::to_bytes( supply ) ); error )
    return error;

  if( auto error = system->put_object( balance_id, to, protocol::to_bytes( to_balance ) ); error )
    return error;

  return emit( system, event_name::mint, mint_event{ .to = to, .value = value }, { to } );
}

std::error_code token::move( system_interface* system,
                             const protocol::account& from,
                             const protocol::account& to,
                             const protocol::amount& value )
{
  if( to.null() )
    return program_errc::zero_address;

  auto from_balance = balance_of( system, from );

  if( from_balance < value )
    return program_errc::insufficient_balance;

  from_balance -= value;

  if( auto error = system->put_object( balance_id, from, protocol::to_bytes( from_balance ) ); error )
    return error;

  auto to_balance = balance_of( system, to );
  to_balance += value;

  if( auto error = system->put_object( balance_id, to, protocol::to_bytes( to_balance ) ); error )
    return error;

  return emit( system, event_name::transfer, transfer_event{ .from = from, .to = to, .value = value }, { from, to } );
}

std::error_code token::construct( system_interface* system, std::span< const std::string > arguments )
{
  std::string name;
  std::string symbol;
  protocol::amount supply_cap = 0;
  protocol::account minter;
  protocol::amount initial_balance = 0;
  protocol::account admin;
  std::uint64_t admin_delay = 0;

  if( auto error = codec::read_all( system, name, symbol, supply_cap, minter, initial_balance, admin, admin_delay );
      error )
    return error;

  if( auto error = codec::expect_end( system ); error )
    return error;

  if( !system->get_object( max_supply_id, {} ).empty() )
    return program_errc::already_initialized;

  if( supply_cap == 0 )
    return program_errc::zero_amount;

  if( minter.null() || admin.null() )
    return program_errc::zero_address;

  if( auto error = system->put_object( name_id, {}, memory::as_bytes( name ) ); error )
    return error;

  if( auto error = system->put_object( symbol_id, {}, memory::as_bytes( symbol ) ); error )
    return error;

  if( auto error = system->put_object( max_supply_id, {}, protocol::to_bytes( supply_cap ) ); error )
    return error;

  permission_store permissions( system );

  if( auto error = permissions.initialize( admin, admin_delay ); error )
    return error;

  if( auto error = permissions.grant( admin, role::minter, minter ); error )
    return error;

  if( auto error = permissions.grant( admin, role::pauser, minter ); error )
    return error;

  if( initial_balance > 0 )
    return mint( system, minter, initial_balance );

  return program_errc::ok;
}

std::error_code token::run( system_interface* system, std::span< const std::string > arguments )
{
  if( system->get_value() != 0 )
    return program_errc::unexpected_value;

  std::uint32_t instr = 0;

  if( system->remaining( file_descriptor::stdin ) < sizeof( instr ) )
    return program_errc::invalid_instruction;

  if( auto error = codec::read( system, instr ); error )
    return error;

  if( instr > std::to_underlying( instruction::cancel_admin ) )
    return program_errc::invalid_instruction;

  return dispatch( system, static_cast< instruction >( instr ) );
}

std::error_code token::dispatch( system_interface* system, instruction instr )
{
  permission_store permissions( system );
  auto caller = system->get_caller();

  switch( instr )
  {
    case instruction::authorize:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, std::uint8_t{ 0 } );
      }
    case instruction::name:
    case instruction::symbol:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        auto object = system->get_object( instr == instruction::name ? name_id : symbol_id, {} );
        return codec::write( system, memory::as_string_view( object ) );
      }
    case instruction::decimals:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, std::uint32_t{ protocol::decimals } );
      }
    case instruction::total_supply:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, total_supply( system ) );
      }
    case instruction::max_supply:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, max_supply( system ) );
      }
    case instruction::balance_of:
      {
        protocol::account account;

        if( auto error = codec::read_all( system, account ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, balance_of( system, account ) );
      }
    case instruction::allowance:
      {
        protocol::account owner;
        protocol::account spender;

        if( auto error = codec::read_all( system, owner, spender ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, allowance( system, owner, spender ) );
      }
    case instruction::paused:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, std::uint8_t{ paused( system ) } );
      }
    case instruction::has_role:
      {
        std::uint8_t r = 0;
        protocol::account account;

        if( auto error = codec::read_all( system, r, account ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        auto target = to_role( r );
        if( !target )
          return program_errc::invalid_argument;

        return codec::write( system, std::uint8_t{ permissions.has_permission( account, *target ) } );
      }
    case instruction::admin:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, permissions.admin() );
      }
    case instruction::pending_admin:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        auto pending = permissions.pending().value_or( pending_admin{} );

        if( auto error = codec::write( system, std::uint8_t{ !pending.candidate.null() } ); error )
          return error;

        if( auto error = codec::write( system, pending.candidate ); error )
          return error;

        return codec::write( system, pending.not_before );
      }
    case instruction::admin_delay:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, permissions.admin_delay() );
      }
    case instruction::mint:
      {
        protocol::account to;
        protocol::amount value = 0;

        if( auto error = codec::read_all( system, to, value ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        if( !permissions.has_permission( caller, role::minter ) )
          return program_errc::unauthorized;

        if( auto error = require_unpaused( system ); error )
          return error;

        return mint( system, to, value );
      }
    case instruction::transfer:
      {
        protocol::account from;
        protocol::account to;
        protocol::amount value = 0;

        if( auto error = codec::read_all( system, from, to, value ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        if( auto error = require_authority( system, from ); error )
          return error;

        if( auto error = require_unpaused( system ); error )
          return error;

        return move( system, from, to, value );
      }
    case instruction::transfer_from:
      {
        protocol::account spender;
        protocol::account from;
        protocol::account to;
        protocol::amount value = 0;

        if( auto error = codec::read_all( system, spender, from, to, value ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        if( auto error = require_authority( system, spender ); error )
          return error;

        if( auto error = require_unpaused( system ); error )
          return error;

        auto remaining = allowance( system, from, spender );

        if( remaining < value )
          return program_errc::insufficient_allowance;

        remaining -= value;

        if( auto error =
              system->put_object( allowance_id, allowance_key( from, spender ), protocol::to_bytes( remaining ) );
            error )
          return error;

        return move( system, from, to, value );
      }
    case instruction::approve:
      {
        protocol::account owner;
        protocol::account spender;
        protocol::amount value = 0;

        if( auto error = codec::read_all( system, owner, spender, value ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        if( auto error = require_authority( system, owner ); error )
          return error;

        if( spender.null() )
          return program_errc::zero_address;

        if( auto error =
              system->put_object( allowance_id, allowance_key( owner, spender ), protocol::to_bytes( value ) );
            error )
          return error;

        return emit( system,
                     event_name::approval,
                     approval_event{ .owner = owner, .spender = spender, .value = value },
                     { owner, spender } );
      }
    case instruction::pause:
    case instruction::unpause:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        if( !permissions.has_permission( caller, role::pauser ) )
          return program_errc::unauthorized;

        bool pausing = instr == instruction::pause;

        if( paused( system ) == pausing )
          return pausing ? program_errc::paused : program_errc::not_paused;

        std::error_code error;

        if( pausing )
          error = system->put_object( paused_id, {}, std::span( &set_flag, 1 ) );
        else
          error = system->remove_object( paused_id, {} );

        if( error )
          return error;

        return emit( system,
                     pausing ? event_name::paused : event_name::unpaused,
                     pause_event{ .account = caller },
                     { caller } );
      }
    case instruction::grant_role:
    case instruction::revoke_role:
    case instruction::renounce_role:
      {
        std::uint8_t r = 0;
        protocol::account account;

        if( auto error = codec::read_all( system, r, account ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        auto target = to_role( r );
        if( !target )
          return program_errc::invalid_argument;

        if( instr == instruction::grant_role )
          return permissions.grant( caller, *target, account );
        else if( instr == instruction::revoke_role )
          return permissions.revoke( caller, *target, account );

        return permissions.renounce( caller, *target, account );
      }
    case instruction::propose_admin:
      {
        protocol::account candidate;
        std::uint64_t not_before = 0;

        if( auto error = codec::read_all( system, candidate, not_before ); error )
          return error;

        if( auto error = codec::expect_end( system ); error )
          return error;

        return permissions.propose_admin( caller, candidate, not_before );
      }
    case instruction::accept_admin:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return permissions.accept_admin( caller );
      }
    case instruction::cancel_admin:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return permissions.cancel_admin( caller );
      }
  }

  return program_errc::invalid_instruction;
}

} // namespace tessera::program
