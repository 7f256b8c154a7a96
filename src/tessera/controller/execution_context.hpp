#pragma once

#include <tessera/controller/call_stack.hpp>
#include <tessera/controller/chronicler.hpp>
#include <tessera/controller/controller.hpp>
#include <tessera/controller/error.hpp>
#include <tessera/controller/state.hpp>
#include <tessera/program/program.hpp>
#include <tessera/program/system_interface.hpp>
#include <tessera/protocol.hpp>
#include <tessera/state_db.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tessera::controller {

enum class intent : std::uint8_t
{
  read_only,
  transaction_application
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const program_registry& registry, intent i = intent::read_only );

  ~execution_context() override = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );
  void clear_state_node();

  result< protocol::transaction_receipt > apply( const protocol::transaction&, std::uint64_t time );

  std::span< const std::string > arguments() override;
  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) override;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) override;
  std::size_t remaining( program::file_descriptor fd ) override;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) override;
  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) override;
  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) override;

  std::error_code event( std::string_view name,
                         std::span< const std::byte > data,
                         const std::vector< protocol::account >& impacted ) override;

  result< bool > check_authority( protocol::account_view account ) override;

  protocol::account get_caller() override;
  protocol::account get_self() override;
  std::uint64_t get_time() override;
  protocol::amount get_value() override;

  protocol::amount get_currency_balance( protocol::account_view account ) override;
  std::error_code transfer_currency( protocol::account_view to, const protocol::amount& value ) override;

  result< protocol::program_output > call_program( protocol::account_view account,
                                                   std::span< const std::byte > stdin,
                                                   std::span< const std::string > arguments = {},
                                                   const protocol::amount& value            = 0 ) override;

  std::uint64_t account_nonce( protocol::account_view account ) const;
  state::head head() const;

private:
  enum class entry : std::uint8_t
  {
    construct,
    run
  };

  std::error_code apply( const protocol::deploy_program& );
  std::error_code apply( const protocol::call_program& );
  std::error_code apply( const protocol::transfer_currency& );

  result< protocol::program_output > invoke( entry e,
                                             protocol::account_view account,
                                             program::program& target,
                                             std::span< const std::byte > stdin,
                                             std::span< const std::string > arguments,
                                             const protocol::amount& value );

  program::program* find_program( protocol::account_view account ) const;

  std::error_code
  move_currency( protocol::account_view from, protocol::account_view to, const protocol::amount& value );
  void set_currency_balance( protocol::account_view account, const protocol::amount& value );
  void set_account_nonce( protocol::account_view account, std::uint64_t nonce );

  protocol::account principal();

  state_db::object_space create_object_space( std::uint32_t id );

  const program_registry& _registry;
  state_db::state_node_ptr _state_node;
  call_stack _stack;
  chronicler _chronicler;
  intent _intent;

  const protocol::transaction* _transaction = nullptr;
  std::uint64_t _time                       = 0;
};

} // namespace tessera::controller
