#pragma once

#include <tessera/controller/error.hpp>
#include <tessera/controller/state.hpp>
#include <tessera/program/program.hpp>
#include <tessera/protocol.hpp>
#include <tessera/state_db.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace tessera::controller {

/**
 * Native program kinds a deploy operation may bind an account to.
 */
using program_registry = std::map< std::string, std::shared_ptr< program::program >, std::less<> >;

/**
 * The "token" and "exchange" programs.
 */
program_registry default_programs();

class controller
{
public:
  controller( program_registry registry = default_programs() );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  void open( const state::genesis_data& data );
  void close();

  /**
   * Applies a transaction atomically. A transaction whose operations fail is
   * still recorded, its receipt is marked reverted and carries the error.
   * Transactions that cannot be recorded at all return an error.
   */
  result< protocol::transaction_receipt >
  process( const protocol::transaction& transaction,
           std::chrono::system_clock::time_point now = std::chrono::system_clock::now() );

  state::head head() const;

  /**
   * Runs a program against head without persisting anything. Writes fail
   * with read_only_context.
   */
  result< protocol::program_output > read_program( const protocol::account& account,
                                                   const protocol::program_input& input = {} ) const;

  std::uint64_t account_nonce( const protocol::account& account ) const;
  protocol::amount currency_balance( const protocol::account& account ) const;

private:
  state_db::database _db;
  program_registry _registry;
};

} // namespace tessera::controller
