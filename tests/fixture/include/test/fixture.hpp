#pragma once

#include <tessera/controller.hpp>
#include <tessera/memory.hpp>
#include <tessera/program.hpp>
#include <tessera/protocol.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace test {

/**
 * Construction parameters of a token and an exchange. Defaults mirror the
 * production deployment: a one million token cap, 10,000 tokens minted to
 * the minter, tokens bought at 0.001 and sold at 0.0005 currency units.
 */
struct deployment
{
  std::string name                       = "Tessera Credit";
  std::string symbol                     = "TSC";
  tessera::protocol::amount max_supply   = tessera::protocol::scale * 1'000'000;
  tessera::protocol::amount initial_mint = tessera::protocol::scale * 10'000;
  std::uint64_t admin_delay              = 0;
  tessera::protocol::amount buy_price    = tessera::protocol::scale / 1'000;
  tessera::protocol::amount sell_price   = tessera::protocol::scale / 2'000;
};

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  template< typename T >
  void append_stdin( std::vector< std::byte >& input, const T& t ) const
  {
    if constexpr( std::is_enum_v< T > )
      tessera::program::codec::append( input, std::to_underlying( t ) );
    else
      tessera::program::codec::append( input, t );
  }

  template< typename... Args >
  std::vector< std::byte > make_stdin( const Args&... args ) const
  {
    std::vector< std::byte > input;
    ( append_stdin( input, args ), ... );
    return input;
  }

  tessera::protocol::program_input make_input( std::vector< std::byte >&& stdin,
                                               std::vector< std::string >&& arguments = {} ) const noexcept;

  tessera::protocol::operation make_deploy_operation( const tessera::protocol::account& id,
                                                      const std::string& kind,
                                                      std::vector< std::byte >&& stdin ) const;
  tessera::protocol::operation make_call_operation( const tessera::protocol::account& id,
                                                    std::vector< std::byte >&& stdin,
                                                    const tessera::protocol::amount& value = 0 ) const;
  tessera::protocol::operation make_transfer_currency_operation( const tessera::protocol::account& to,
                                                                 const tessera::protocol::amount& value ) const;

  template< typename... Args >
  tessera::protocol::transaction make_transaction( const tessera::protocol::account& payer, Args&&... args ) const
  {
    tessera::protocol::transaction t;
    ( ( t.operations.emplace_back( std::forward< Args >( args ) ) ), ... );
    t.payer = payer;
    t.nonce = _controller->account_nonce( payer ) + 1;
    return t;
  }

  /**
   * Processes a transaction one millisecond after the previous one.
   */
  tessera::controller::result< tessera::protocol::transaction_receipt >
  process( const tessera::protocol::transaction& transaction );

  template< typename... Args >
  tessera::controller::result< tessera::protocol::transaction_receipt > push( const tessera::protocol::account& payer,
                                                                              Args&&... args )
  {
    return process( make_transaction( payer, std::forward< Args >( args )... ) );
  }

  template< typename Instruction, typename... Args >
  tessera::controller::result< tessera::protocol::transaction_receipt >
  call( const tessera::protocol::account& payer,
        const tessera::protocol::account& program,
        Instruction instr,
        const Args&... args )
  {
    return push( payer, make_call_operation( program, make_stdin( instr, args... ) ) );
  }

  template< typename Instruction, typename... Args >
  tessera::controller::result< tessera::protocol::program_output >
  query( const tessera::protocol::account& program, Instruction instr, const Args&... args ) const
  {
    return _controller->read_program( program, make_input( make_stdin( instr, args... ) ) );
  }

  tessera::protocol::amount balance_of( const tessera::protocol::account& account ) const;
  tessera::protocol::amount allowance( const tessera::protocol::account& owner,
                                       const tessera::protocol::account& spender ) const;
  tessera::protocol::amount total_supply() const;
  bool has_role( tessera::program::role r, const tessera::protocol::account& account ) const;
  tessera::protocol::amount currency_balance( const tessera::protocol::account& account ) const;

  tessera::protocol::amount read_amount( const tessera::controller::result< tessera::protocol::program_output >& output ) const;
  tessera::protocol::account
  read_account( const tessera::controller::result< tessera::protocol::program_output >& output ) const;

  /**
   * Starts over from a fresh genesis crediting every user account with
   * `allocation` units of currency. Nothing is deployed afterwards.
   */
  void reopen( const tessera::protocol::amount& allocation );

  /**
   * Deploys the token and the exchange, and grants the exchange the minter
   * role.
   */
  void deploy( const deployment& d = {} );

  template< typename Event >
  std::vector< Event > events( const tessera::protocol::transaction_receipt& receipt, std::string_view name ) const
  {
    std::vector< Event > result;

    for( const auto& e: receipt.events )
      if( e.name == name )
        result.emplace_back( tessera::program::deserialize_event< Event >( e.data ) );

    return result;
  }

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    without_reversion = 1 << 1
  };

  bool verify( const tessera::controller::result< tessera::protocol::transaction_receipt >& receipt,
               std::uint64_t flags ) const;

  /**
   * Succeeds if the transaction was recorded and reverted with `error`.
   */
  bool verify_reverted( const tessera::controller::result< tessera::protocol::transaction_receipt >& receipt,
                        std::error_code error ) const;

  std::unique_ptr< tessera::controller::controller > _controller;
  tessera::controller::state::genesis_data _genesis_data;
  std::chrono::system_clock::time_point _now;

  tessera::protocol::account _admin    = tessera::protocol::user_account( "admin" );
  tessera::protocol::account _minter   = tessera::protocol::user_account( "minter" );
  tessera::protocol::account _owner    = tessera::protocol::user_account( "exchange" );
  tessera::protocol::account _alice    = tessera::protocol::user_account( "alice" );
  tessera::protocol::account _bob      = tessera::protocol::user_account( "bob" );
  tessera::protocol::account _token    = tessera::protocol::program_account( "token" );
  tessera::protocol::account _exchange = tessera::protocol::program_account( "exchange" );
};

} // namespace test
