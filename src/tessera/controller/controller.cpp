#include <tessera/controller/controller.hpp>
#include <tessera/controller/execution_context.hpp>
#include <tessera/controller/state.hpp>

#include <tessera/log.hpp>
#include <tessera/program/exchange.hpp>
#include <tessera/program/token.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

namespace tessera::controller {

program_registry default_programs()
{
  program_registry registry;
  registry.emplace( "token", std::make_shared< program::token >() );
  registry.emplace( "exchange", std::make_shared< program::exchange >() );
  return registry;
}

controller::controller( program_registry registry ):
    _registry( std::move( registry ) )
{}

controller::~controller()
{
  close();
}

void controller::open( const state::genesis_data& data )
{
  _db.open(
    [ & ]( state_db::state_node& root )
    {
      for( const auto& entry: data )
      {
        if( root.get( entry.space, entry.key ) )
          throw std::runtime_error( "encountered unexpected object in initial state" );

        root.put( entry.space, entry.key, entry.value );
      }
      LOG_INFO( tessera::log::instance(), "Wrote {} genesis objects into new database", data.size() );
    } );

  auto head = _db.head();
  LOG_INFO( tessera::log::instance(), "Opened database at revision {}", head->revision() );
}

void controller::close()
{
  _db.close();
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction,
                                                             std::chrono::system_clock::time_point now )
{
  if( !transaction.validate() )
    return std::unexpected( controller_errc::malformed_transaction );

  auto time =
    static_cast< std::uint64_t >( std::chrono::duration_cast< std::chrono::milliseconds >( now.time_since_epoch() ).count() );

  auto head = _db.head();

  if( !head )
    throw std::runtime_error( "database is not open" );

  LOG_DEBUG( tessera::log::instance(),
             "Pushing transaction - Payer: {}, Nonce: {}",
             tessera::log::hex{ transaction.payer.data(), transaction.payer.size() },
             transaction.nonce );

  execution_context context( _registry, intent::transaction_application );
  context.set_state_node( head );

  if( time < context.head().time )
    return std::unexpected( controller_errc::timestamp_out_of_bounds );

  auto node = head->make_child();
  context.set_state_node( node );

  return context.apply( transaction, time )
    .and_then(
      [ & ]( auto&& receipt ) -> result< protocol::transaction_receipt >
      {
        _db.commit( node );

        if( receipt.reverted )
          LOG_INFO( tessera::log::instance(),
                    "Transaction reverted - Payer: {}, Nonce: {}, Error: {}",
                    tessera::log::hex{ transaction.payer.data(), transaction.payer.size() },
                    transaction.nonce,
                    receipt.error.message() );
        else
          LOG_DEBUG( tessera::log::instance(),
                     "Transaction applied - Payer: {}, Nonce: {} [{} event(s)]",
                     tessera::log::hex{ transaction.payer.data(), transaction.payer.size() },
                     transaction.nonce,
                     receipt.events.size() );

        return receipt;
      } );
}

state::head controller::head() const
{
  execution_context context( _registry );
  context.set_state_node( _db.head() );
  return context.head();
}

result< protocol::program_output > controller::read_program( const protocol::account& account,
                                                             const protocol::program_input& input ) const
{
  execution_context context( _registry );
  context.set_state_node( _db.head()->make_child() );
  return context.call_program( account, input.stdin, input.arguments );
}

std::uint64_t controller::account_nonce( const protocol::account& account ) const
{
  execution_context context( _registry );
  context.set_state_node( _db.head() );
  return context.account_nonce( account );
}

protocol::amount controller::currency_balance( const protocol::account& account ) const
{
  execution_context context( _registry );
  context.set_state_node( _db.head() );
  return context.get_currency_balance( account );
}

} // namespace tessera::controller
