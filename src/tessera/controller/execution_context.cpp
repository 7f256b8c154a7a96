#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>

#include <boost/endian.hpp>
#include <boost/locale/utf.hpp>

#include <tessera/controller/execution_context.hpp>
#include <tessera/controller/state.hpp>
#include <tessera/log.hpp>
#include <tessera/memory.hpp>
#include <tessera/program/codec.hpp>

namespace tessera::controller {

constexpr auto event_name_limit = 128;

template< typename T >
bool validate_utf( std::basic_string_view< T > str )
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< T >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

execution_context::execution_context( const program_registry& registry, intent i ):
    _registry( registry ),
    _intent( i )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::clear_state_node()
{
  _state_node.reset();
}

result< protocol::transaction_receipt > execution_context::apply( const protocol::transaction& transaction,
                                                                  std::uint64_t time )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _transaction = &transaction;
  _time        = time;
  _chronicler.rollback( 0 );

  if( account_nonce( transaction.payer ) + 1 != transaction.nonce )
    return std::unexpected( controller_errc::invalid_nonce );

  set_account_nonce( transaction.payer, transaction.nonce );

  boost::endian::native_to_little_inplace( time );
  _state_node->put( state::space::metadata(), state::key::head_time(), memory::as_bytes( time ) );

  auto transaction_node = _state_node;

  auto error = [ & ]() -> std::error_code
  {
    auto operation_node = transaction_node->make_child();
    _state_node         = operation_node;

    for( const auto& o: transaction.operations )
    {
      auto error = std::visit(
        [ & ]( const auto& op ) -> std::error_code
        {
          return apply( op );
        },
        o );

      if( error )
        return error;
    }

    operation_node->squash();
    return reversion_errc::ok;
  }();

  _state_node = transaction_node;

  protocol::transaction_receipt receipt{ .payer = transaction.payer, .nonce = transaction.nonce, .time = _time };

  if( error )
  {
    if( error.category() == controller_category() )
      return std::unexpected( error );

    receipt.reverted = true;
    receipt.error    = error;
    _chronicler.rollback( 0 );
  }
  else
  {
    receipt.events = _chronicler.release();
  }

  return receipt;
}

std::error_code execution_context::apply( const protocol::deploy_program& op )
{
  // A program account is claimed by the user account with the same identifier
  if( auto authorized = check_authority( protocol::user_account( op.id ) ); authorized )
  {
    if( !authorized.value() )
      return controller_errc::authorization_failure;
  }
  else
  {
    return authorized.error();
  }

  if( _state_node->get( state::space::program_data(), op.id ) )
    return reversion_errc::program_exists;

  auto registry_iterator = _registry.find( op.kind );
  if( registry_iterator == _registry.end() )
    return reversion_errc::invalid_program;

  _state_node->put( state::space::program_data(), op.id, memory::as_bytes( op.kind ) );

  auto output = invoke( entry::construct, op.id, *registry_iterator->second, op.input.stdin, op.input.arguments, 0 );
  if( !output )
    return output.error();

  LOG_DEBUG( tessera::log::instance(),
             "Deployed program - Kind: {}, ID: {}",
             op.kind,
             tessera::log::hex{ op.id.data(), op.id.size() } );

  return reversion_errc::ok;
}

std::error_code execution_context::apply( const protocol::call_program& op )
{
  auto output = call_program( op.id, op.input.stdin, op.input.arguments, op.value );

  if( !output )
    return output.error();

  return reversion_errc::ok;
}

std::error_code execution_context::apply( const protocol::transfer_currency& op )
{
  return transfer_currency( op.to, op.value );
}

program::program* execution_context::find_program( protocol::account_view account ) const
{
  auto kind = _state_node->get( state::space::program_data(), account );
  if( !kind )
    return nullptr;

  auto registry_iterator = _registry.find( memory::as_string_view( *kind ) );
  if( registry_iterator == _registry.end() )
    return nullptr;

  return registry_iterator->second.get();
}

result< protocol::program_output > execution_context::invoke( entry e,
                                                              protocol::account_view account,
                                                              program::program& target,
                                                              std::span< const std::byte > stdin,
                                                              std::span< const std::string > arguments,
                                                              const protocol::amount& value )
{
  auto caller      = principal();
  auto parent_node = _state_node;
  auto frame_node  = parent_node->make_child();
  _state_node      = frame_node;

  auto checkpoint = _chronicler.size();

  auto rollback = [ & ]( std::error_code error ) -> result< protocol::program_output >
  {
    _state_node = parent_node;
    _chronicler.rollback( checkpoint );
    return std::unexpected( error );
  };

  if( value > 0 )
  {
    if( _intent == intent::read_only )
      return rollback( reversion_errc::read_only_context );

    if( auto error = move_currency( caller, account, value ); error )
      return rollback( error );
  }

  if( auto error = _stack.push( { .program_id = account.to_account(),
                                        .caller     = caller,
                                        .value      = value,
                                        .arguments  = arguments,
                                        .stdin      = stdin } );
      error )
    return rollback( error );

  auto error = e == entry::construct ? target.construct( this, arguments ) : target.run( this, arguments );
  auto frame = _stack.pop();

  if( error )
    return rollback( error );

  _state_node = parent_node;
  frame_node->squash();

  return protocol::program_output{ .stdout = std::move( frame.stdout ), .stderr = std::move( frame.stderr ) };
}

std::uint64_t execution_context::account_nonce( protocol::account_view account ) const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto nonce_bytes = _state_node->get( state::space::transaction_nonce(), account ); nonce_bytes )
  {
    auto nonce = memory::bit_cast< std::uint64_t >( *nonce_bytes );
    boost::endian::little_to_native_inplace( nonce );
    return nonce;
  }

  return 0;
}

void execution_context::set_account_nonce( protocol::account_view account, std::uint64_t nonce )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  boost::endian::native_to_little_inplace( nonce );
  _state_node->put( state::space::transaction_nonce(), account, memory::as_bytes( nonce ) );
}

state::head execution_context::head() const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  state::head head{ .revision = _state_node->revision() };

  if( auto time_bytes = _state_node->get( state::space::metadata(), state::key::head_time() ); time_bytes )
  {
    head.time = memory::bit_cast< std::uint64_t >( *time_bytes );
    boost::endian::little_to_native_inplace( head.time );
  }

  return head;
}

protocol::account execution_context::principal()
{
  if( !_stack.empty() )
    return _stack.current().program_id;

  if( _transaction )
    return _transaction->payer;

  return protocol::null_account;
}

std::span< const std::string > execution_context::arguments()
{
  return _stack.current().arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    auto& output = _stack.current().stdout;
    output.insert( output.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    auto& error = _stack.current().stderr;
    error.insert( error.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return reversion_errc::bad_file_descriptor;

  return _stack.current().read_stdin( buffer );
}

std::size_t execution_context::remaining( program::file_descriptor fd )
{
  if( fd != program::file_descriptor::stdin )
    return 0;

  return _stack.current().remaining_stdin();
}

state_db::object_space execution_context::create_object_space( std::uint32_t id )
{
  state_db::object_space space{ .system = false, .id = id };
  const auto& frame = _stack.current();
  std::ranges::copy( frame.program_id, space.address.begin() );

  return space;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->remove( create_object_space( id ), key );
  return reversion_errc::ok;
}

std::error_code execution_context::event( std::string_view name,
                                          std::span< const std::byte > data,
                                          const std::vector< protocol::account >& impacted )
{
  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  if( name.empty() || name.size() > event_name_limit )
    return reversion_errc::invalid_event_name;

  if( !validate_utf( name ) )
    return reversion_errc::invalid_event_name;

  for( const auto& account: impacted )
    if( account.type() == protocol::account_type::invalid )
      return reversion_errc::invalid_account;

  _chronicler.push_event( protocol::event{ .source   = _stack.current().program_id,
                                           .name     = std::string( name ),
                                           .data     = std::vector< std::byte >( data.begin(), data.end() ),
                                           .impacted = impacted } );

  return reversion_errc::ok;
}

result< bool > execution_context::check_authority( protocol::account_view account )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return std::unexpected( reversion_errc::read_only_context );

  if( account.null() )
    return false;

  if( account.program() )
  {
    static constexpr std::uint32_t authorize_instruction = 0;
    auto input = program::codec::encode( authorize_instruction );

    return call_program( account, input )
      .and_then(
        []( auto&& output ) -> result< bool >
        {
          if( output.stdout.size() != sizeof( std::uint8_t ) )
            return std::unexpected( reversion_errc::failure );

          return output.stdout.front() != std::byte{ 0x00 };
        } );
  }

  if( _transaction == nullptr )
    throw std::runtime_error( "transaction required for check authority" );

  // Only the payer signs, and only calls it makes directly carry its authority
  return _stack.depth() <= 1 && std::ranges::equal( account, _transaction->payer );
}

protocol::account execution_context::get_caller()
{
  if( _stack.empty() )
    return principal();

  return _stack.current().caller;
}

protocol::account execution_context::get_self()
{
  return principal();
}

std::uint64_t execution_context::get_time()
{
  return _time;
}

protocol::amount execution_context::get_value()
{
  if( _stack.empty() )
    return 0;

  return _stack.current().value;
}

protocol::amount execution_context::get_currency_balance( protocol::account_view account )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto balance = _state_node->get( state::space::currency_balance(), account ); balance )
    return protocol::from_bytes( *balance );

  return 0;
}

void execution_context::set_currency_balance( protocol::account_view account, const protocol::amount& value )
{
  _state_node->put( state::space::currency_balance(), account, protocol::to_bytes( value ) );
}

std::error_code
execution_context::move_currency( protocol::account_view from, protocol::account_view to, const protocol::amount& value )
{
  auto from_balance = get_currency_balance( from );

  if( from_balance < value )
    return reversion_errc::insufficient_funds;

  auto to_balance = get_currency_balance( to );

  if( !std::ranges::equal( from, to ) && value > std::numeric_limits< protocol::amount >::max() - to_balance )
    return reversion_errc::balance_overflow;

  set_currency_balance( from, from_balance - value );
  set_currency_balance( to, get_currency_balance( to ) + value );

  return reversion_errc::ok;
}

std::error_code execution_context::transfer_currency( protocol::account_view to, const protocol::amount& value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  if( to.type() == protocol::account_type::invalid )
    return reversion_errc::invalid_account;

  // Paying a program runs it with an empty input
  if( to.program() )
  {
    auto output = call_program( to, {}, {}, value );

    if( !output )
      return output.error();

    return reversion_errc::ok;
  }

  auto from = principal();
  return move_currency( from, to, value );
}

result< protocol::program_output > execution_context::call_program( protocol::account_view account,
                                                                    std::span< const std::byte > stdin,
                                                                    std::span< const std::string > arguments,
                                                                    const protocol::amount& value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( !account.program() )
    return std::unexpected( reversion_errc::invalid_program );

  auto target = find_program( account );
  if( !target )
    return std::unexpected( reversion_errc::invalid_program );

  return invoke( entry::run, account, *target, stdin, arguments, value );
}

} // namespace tessera::controller
