// NOLINTBEGIN

#include <test/fixture.hpp>
#include <test/programs.hpp>

#include <tessera/controller.hpp>
#include <tessera/log.hpp>
#include <tessera/program.hpp>
#include <tessera/protocol.hpp>

#include <stdexcept>

namespace test {

static constexpr auto genesis_time = std::chrono::milliseconds( 1'700'000'000'000 );

fixture::fixture( const std::string& name, const std::string& log_level ):
    _now( genesis_time )
{
  tessera::log::initialize();
  tessera::log::set_level( log_level );

  LOG_INFO( tessera::log::instance(), "Starting fixture: {}", name );

  auto registry = tessera::controller::default_programs();
  registry.emplace( "attacker", std::make_shared< attacker >() );

  _controller = std::make_unique< tessera::controller::controller >( std::move( registry ) );

  reopen( tessera::protocol::scale * 1'000 );
}

void fixture::reopen( const tessera::protocol::amount& allocation )
{
  _controller->close();
  _genesis_data.clear();

  for( const auto& account: { _admin, _minter, _owner, _alice, _bob } )
    _genesis_data.emplace_back( tessera::controller::state::currency_allocation( account, allocation ) );

  _controller->open( _genesis_data );
}

fixture::~fixture()
{
  _controller->close();
}

tessera::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin,
                                                      std::vector< std::string >&& arguments ) const noexcept
{
  tessera::protocol::program_input input;
  input.stdin     = std::move( stdin );
  input.arguments = std::move( arguments );
  return input;
}

tessera::protocol::operation fixture::make_deploy_operation( const tessera::protocol::account& id,
                                                             const std::string& kind,
                                                             std::vector< std::byte >&& stdin ) const
{
  tessera::protocol::deploy_program op;
  op.id    = id;
  op.kind  = kind;
  op.input = make_input( std::move( stdin ) );
  return op;
}

tessera::protocol::operation fixture::make_call_operation( const tessera::protocol::account& id,
                                                           std::vector< std::byte >&& stdin,
                                                           const tessera::protocol::amount& value ) const
{
  tessera::protocol::call_program op;
  op.id    = id;
  op.input = make_input( std::move( stdin ) );
  op.value = value;
  return op;
}

tessera::protocol::operation fixture::make_transfer_currency_operation( const tessera::protocol::account& to,
                                                                        const tessera::protocol::amount& value ) const
{
  tessera::protocol::transfer_currency op;
  op.to    = to;
  op.value = value;
  return op;
}

tessera::controller::result< tessera::protocol::transaction_receipt >
fixture::process( const tessera::protocol::transaction& transaction )
{
  _now += std::chrono::milliseconds( 1 );
  return _controller->process( transaction, _now );
}

void fixture::deploy( const deployment& d )
{
  auto receipt = push( tessera::protocol::user_account( _token ),
                       make_deploy_operation( _token,
                                              "token",
                                              make_stdin( std::string_view( d.name ),
                                                          std::string_view( d.symbol ),
                                                          d.max_supply,
                                                          _minter,
                                                          d.initial_mint,
                                                          _admin,
                                                          d.admin_delay ) ) );

  if( !verify( receipt, verification::processed | verification::without_reversion ) )
    throw std::runtime_error( "token deployment failed" );

  receipt = push( _owner, make_deploy_operation( _exchange, "exchange", make_stdin( _token, d.buy_price, d.sell_price ) ) );

  if( !verify( receipt, verification::processed | verification::without_reversion ) )
    throw std::runtime_error( "exchange deployment failed" );

  receipt = call( _admin, _token, tessera::program::token::instruction::grant_role, tessera::program::role::minter, _exchange );

  if( !verify( receipt, verification::processed | verification::without_reversion ) )
    throw std::runtime_error( "granting the exchange the minter role failed" );
}

tessera::protocol::amount
fixture::read_amount( const tessera::controller::result< tessera::protocol::program_output >& output ) const
{
  if( !output )
    throw std::runtime_error( "query failed: " + output.error().message() );

  tessera::protocol::amount value = 0;
  if( tessera::program::codec::reader( output->stdout ).read( value ) )
    throw std::runtime_error( "query returned a malformed amount" );

  return value;
}

tessera::protocol::account
fixture::read_account( const tessera::controller::result< tessera::protocol::program_output >& output ) const
{
  if( !output )
    throw std::runtime_error( "query failed: " + output.error().message() );

  tessera::protocol::account account;
  if( tessera::program::codec::reader( output->stdout ).read( account ) )
    throw std::runtime_error( "query returned a malformed account" );

  return account;
}

tessera::protocol::amount fixture::balance_of( const tessera::protocol::account& account ) const
{
  return read_amount( query( _token, tessera::program::token::instruction::balance_of, account ) );
}

tessera::protocol::amount fixture::allowance( const tessera::protocol::account& owner,
                                              const tessera::protocol::account& spender ) const
{
  return read_amount( query( _token, tessera::program::token::instruction::allowance, owner, spender ) );
}

tessera::protocol::amount fixture::total_supply() const
{
  return read_amount( query( _token, tessera::program::token::instruction::total_supply ) );
}

bool fixture::has_role( tessera::program::role r, const tessera::protocol::account& account ) const
{
  auto output = query( _token, tessera::program::token::instruction::has_role, r, account );
  if( !output || output->stdout.size() != 1 )
    throw std::runtime_error( "has_role query failed" );

  return output->stdout.front() != std::byte{ 0x00 };
}

tessera::protocol::amount fixture::currency_balance( const tessera::protocol::account& account ) const
{
  return _controller->currency_balance( account );
}

bool fixture::verify( const tessera::controller::result< tessera::protocol::transaction_receipt >& receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( tessera::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    if( receipt->reverted )
    {
      LOG_ERROR( tessera::log::instance(),
                 "Transaction {} from {} was reverted: {}",
                 receipt->nonce,
                 tessera::log::hex{ receipt->payer.data(), receipt->payer.size() },
                 receipt->error.message() );
      return false;
    }
  }

  return true;
}

bool fixture::verify_reverted( const tessera::controller::result< tessera::protocol::transaction_receipt >& receipt,
                               std::error_code error ) const
{
  if( !receipt.has_value() )
  {
    LOG_ERROR( tessera::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( !receipt->reverted )
  {
    LOG_ERROR( tessera::log::instance(), "Transaction {} was expected to revert", receipt->nonce );
    return false;
  }

  if( receipt->error != error )
  {
    LOG_ERROR( tessera::log::instance(),
               "Transaction {} reverted with '{}' instead of '{}'",
               receipt->nonce,
               receipt->error.message(),
               error.message() );
    return false;
  }

  return receipt->events.empty();
}

} // namespace test

// NOLINTEND
