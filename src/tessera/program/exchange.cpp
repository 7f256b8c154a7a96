#include <tessera/program/codec.hpp>
#include <tessera/program/events.hpp>
#include <tessera/program/exchange.hpp>
#include <tessera/program/reentrancy_guard.hpp>
#include <tessera/program/token.hpp>

#include <algorithm>
#include <limits>
#include <utility>

namespace tessera::program {

static constexpr std::uint32_t token_id         = 0;
static constexpr std::uint32_t buy_price_id     = 1;
static constexpr std::uint32_t sell_price_id    = 2;
static constexpr std::uint32_t owner_id         = 3;
static constexpr std::uint32_t pending_owner_id = 4;
static constexpr std::uint32_t guard_id         = 5;

static protocol::account to_account( std::span< const std::byte > object )
{
  protocol::account account{};
  codec::reader reader( object );

  if( reader.read( account ) )
    return protocol::account{};

  return account;
}

static protocol::amount to_amount( std::span< const std::byte > object )
{
  if( object.empty() )
    return 0;

  return protocol::from_bytes( object );
}

template< typename... Args >
static std::error_code
call_token( system_interface* system, const protocol::account& program_id, token::instruction instr, const Args&... args )
{
  auto input = codec::encode( std::to_underlying( instr ), args... );
  auto output = system->call_program( program_id, input );

  if( !output )
    return output.error();

  return program_errc::ok;
}

protocol::account exchange::token_account( system_interface* system )
{
  return to_account( system->get_object( token_id, {} ) );
}

protocol::amount exchange::buy_price( system_interface* system )
{
  return to_amount( system->get_object( buy_price_id, {} ) );
}

protocol::amount exchange::sell_price( system_interface* system )
{
  return to_amount( system->get_object( sell_price_id, {} ) );
}

protocol::account exchange::owner( system_interface* system )
{
  return to_account( system->get_object( owner_id, {} ) );
}

protocol::account exchange::pending_owner( system_interface* system )
{
  return to_account( system->get_object( pending_owner_id, {} ) );
}

result< protocol::amount > exchange::token_reserve( system_interface* system )
{
  auto input  = codec::encode( std::to_underlying( token::instruction::balance_of ), system->get_self() );
  auto output = system->call_program( token_account( system ), input );

  if( !output )
    return std::unexpected( output.error() );

  protocol::amount reserve = 0;
  codec::reader reader( output->stdout );

  if( auto error = reader.read( reserve ); error )
    return std::unexpected( error );

  return reserve;
}

std::error_code exchange::construct( system_interface* system, std::span< const std::string > arguments )
{
  protocol::account token_program;
  protocol::amount buy_at  = 0;
  protocol::amount sell_at = 0;

  if( auto error = codec::read_all( system, token_program, buy_at, sell_at ); error )
    return error;

  if( auto error = codec::expect_end( system ); error )
    return error;

  if( !system->get_object( token_id, {} ).empty() )
    return program_errc::already_initialized;

  if( token_program.null() )
    return program_errc::zero_address;

  if( !token_program.program() )
    return program_errc::invalid_argument;

  if( buy_at == 0 || sell_at == 0 )
    return program_errc::zero_amount;

  auto deployer = system->get_caller();

  if( auto error = system->put_object( token_id, {}, token_program ); error )
    return error;

  if( auto error = system->put_object( buy_price_id, {}, protocol::to_bytes( buy_at ) ); error )
    return error;

  if( auto error = system->put_object( sell_price_id, {}, protocol::to_bytes( sell_at ) ); error )
    return error;

  return system->put_object( owner_id, {}, deployer );
}

std::error_code exchange::buy( system_interface* system, const protocol::account& buyer, const protocol::amount& paid )
{
  if( paid == 0 )
    return program_errc::zero_amount;

  // Whole tokens only, the remainder of the payment stays with the exchange
  protocol::amount whole_tokens = paid / buy_price( system );

  if( whole_tokens > std::numeric_limits< protocol::amount >::max() / protocol::scale )
    return program_errc::overflow;

  protocol::amount tokens = whole_tokens * protocol::scale;

  if( tokens == 0 )
    return program_errc::zero_amount;

  auto reserve = token_reserve( system );
  if( !reserve )
    return reserve.error();

  protocol::amount from_reserve = std::min( *reserve, tokens );
  protocol::amount minted       = tokens - from_reserve;
  auto token_program            = token_account( system );

  if( from_reserve > 0 )
    if( auto error = call_token( system, token_program, token::instruction::transfer, system->get_self(), buyer, from_reserve );
        error )
      return error;

  if( minted > 0 )
    if( auto error = call_token( system, token_program, token::instruction::mint, buyer, minted ); error )
      return error;

  return emit( system,
               event_name::purchase,
               purchase_event{ .buyer        = buyer,
                               .paid         = paid,
                               .tokens       = tokens,
                               .from_reserve = from_reserve,
                               .minted       = minted },
               { buyer } );
}

std::error_code
exchange::sell( system_interface* system, const protocol::account& seller, const protocol::amount& tokens )
{
  if( tokens == 0 )
    return program_errc::zero_amount;

  auto price = sell_price( system );

  if( price != 0 && tokens > std::numeric_limits< protocol::amount >::max() / price )
    return program_errc::overflow;

  protocol::amount owed = tokens * price / protocol::scale;

  if( owed == 0 )
    return program_errc::zero_amount;

  auto self = system->get_self();

  if( system->get_currency_balance( self ) < owed )
    return program_errc::insufficient_reserve;

  if( auto error =
        call_token( system, token_account( system ), token::instruction::transfer_from, self, seller, self, tokens );
      error )
    return error;

  // Control passes to the seller here when the seller is a program
  if( auto error = system->transfer_currency( seller, owed ); error )
    return error;

  return emit( system, event_name::sale, sale_event{ .seller = seller, .tokens = tokens, .paid = owed }, { seller } );
}

std::error_code exchange::withdraw_currency( system_interface* system )
{
  auto current = owner( system );

  if( system->get_caller() != current )
    return program_errc::unauthorized;

  auto balance = system->get_currency_balance( system->get_self() );

  if( balance == 0 )
    return program_errc::insufficient_reserve;

  if( auto error = system->transfer_currency( current, balance ); error )
    return error;

  return emit( system,
               event_name::currency_withdrawal,
               withdrawal_event{ .to = current, .value = balance },
               { current } );
}

std::error_code exchange::withdraw_tokens( system_interface* system, const protocol::amount& tokens )
{
  auto current = owner( system );

  if( system->get_caller() != current )
    return program_errc::unauthorized;

  if( tokens == 0 )
    return program_errc::zero_amount;

  auto reserve = token_reserve( system );
  if( !reserve )
    return reserve.error();

  if( *reserve < tokens )
    return program_errc::insufficient_reserve;

  if( auto error =
        call_token( system, token_account( system ), token::instruction::transfer, system->get_self(), current, tokens );
      error )
    return error;

  return emit( system, event_name::token_withdrawal, withdrawal_event{ .to = current, .value = tokens }, { current } );
}

std::error_code exchange::transfer_ownership( system_interface* system, const protocol::account& candidate )
{
  auto current = owner( system );

  if( system->get_caller() != current )
    return program_errc::unauthorized;

  if( candidate.null() )
    return program_errc::zero_address;

  if( auto error = system->put_object( pending_owner_id, {}, candidate ); error )
    return error;

  return emit( system,
               event_name::ownership_transfer_proposed,
               ownership_event{ .owner = current, .candidate = candidate },
               { current, candidate } );
}

std::error_code exchange::accept_ownership( system_interface* system )
{
  auto candidate = pending_owner( system );
  auto caller    = system->get_caller();

  if( candidate.null() || caller != candidate )
    return program_errc::unauthorized;

  auto previous = owner( system );

  if( auto error = system->put_object( owner_id, {}, candidate ); error )
    return error;

  if( auto error = system->remove_object( pending_owner_id, {} ); error )
    return error;

  return emit( system,
               event_name::ownership_transferred,
               ownership_event{ .owner = previous, .candidate = candidate },
               { previous, candidate } );
}

std::error_code exchange::cancel_ownership_transfer( system_interface* system )
{
  auto current = owner( system );

  if( system->get_caller() != current )
    return program_errc::unauthorized;

  auto candidate = pending_owner( system );

  if( candidate.null() )
    return program_errc::no_pending_transfer;

  if( auto error = system->remove_object( pending_owner_id, {} ); error )
    return error;

  return emit( system,
               event_name::ownership_transfer_canceled,
               ownership_event{ .owner = current, .candidate = candidate },
               { current, candidate } );
}

std::error_code exchange::run( system_interface* system, std::span< const std::string > arguments )
{
  auto value = system->get_value();

  // A bare currency transfer is a purchase
  if( system->remaining( file_descriptor::stdin ) == 0 )
  {
    auto guard = reentrancy_guard::acquire( system, guard_id );
    if( !guard )
      return guard.error();

    return buy( system, system->get_caller(), value );
  }

  std::uint32_t instr = 0;

  if( auto error = codec::read( system, instr ); error )
    return error;

  if( instr > std::to_underlying( instruction::token_reserve ) )
    return program_errc::invalid_instruction;

  if( value != 0 && instr != std::to_underlying( instruction::buy ) )
    return program_errc::unexpected_value;

  return dispatch( system, static_cast< instruction >( instr ) );
}

std::error_code exchange::dispatch( system_interface* system, instruction instr )
{
  switch( instr )
  {
    case instruction::authorize:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, std::uint8_t{ 0 } );
      }
    case instruction::token:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, token_account( system ) );
      }
    case instruction::buy_price:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, buy_price( system ) );
      }
    case instruction::sell_price:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, sell_price( system ) );
      }
    case instruction::owner:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, owner( system ) );
      }
    case instruction::pending_owner:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, pending_owner( system ) );
      }
    case instruction::currency_reserve:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        return codec::write( system, system->get_currency_balance( system->get_self() ) );
      }
    case instruction::token_reserve:
      {
        if( auto error = codec::expect_end( system ); error )
          return error;

        auto reserve = token_reserve( system );
        if( !reserve )
          return reserve.error();

        return codec::write( system, *reserve );
      }
    default:
      break;
  }

  protocol::amount tokens = 0;
  protocol::account candidate;

  switch( instr )
  {
    case instruction::sell:
    case instruction::withdraw_tokens:
      if( auto error = codec::read( system, tokens ); error )
        return error;
      break;
    case instruction::transfer_ownership:
      if( auto error = codec::read( system, candidate ); error )
        return error;
      break;
    default:
      break;
  }

  if( auto error = codec::expect_end( system ); error )
    return error;

  // Every state changing instruction holds the guard until it returns
  auto guard = reentrancy_guard::acquire( system, guard_id );
  if( !guard )
    return guard.error();

  switch( instr )
  {
    case instruction::buy:
      return buy( system, system->get_caller(), system->get_value() );
    case instruction::sell:
      return sell( system, system->get_caller(), tokens );
    case instruction::withdraw_currency:
      return withdraw_currency( system );
    case instruction::withdraw_tokens:
      return withdraw_tokens( system, tokens );
    case instruction::transfer_ownership:
      return transfer_ownership( system, candidate );
    case instruction::accept_ownership:
      return accept_ownership( system );
    case instruction::cancel_ownership_transfer:
      return cancel_ownership_transfer( system );
    default:
      break;
  }

  return program_errc::invalid_instruction;
}

} // namespace tessera::program
