#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <print>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <tessera/controller.hpp>
#include <tessera/log.hpp>
#include <tessera/program.hpp>
#include <tessera/protocol.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto service = "tessera"s;

constexpr auto help_option       = "help,h"s;
constexpr auto version_option    = "version,v"s;
constexpr auto basedir_option    = "basedir,d"s;
constexpr auto basedir_default   = "."s;
constexpr auto config_option     = "config,c"s;
constexpr auto config_default    = "config.yml"s;
constexpr auto log_level_option  = "log-level,l"s;
constexpr auto log_level_default = "info"s;

constexpr auto token_id          = "token"s;
constexpr auto exchange_id       = "exchange"s;
constexpr auto token_name        = "Tessera Credit"s;
constexpr auto token_symbol      = "TSC"s;
constexpr auto max_supply        = "1000000"s;
constexpr auto initial_mint      = "10000"s;
constexpr auto buy_price         = "0.001"s;
constexpr auto sell_price        = "0.0005"s;
constexpr std::uint64_t no_delay = 0;

} // namespace constants

namespace {

using namespace tessera;

// Strips the short form from an option name, "log-level,l" -> "log-level"
std::string option_key( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

/**
 * Command line first, then the service section of the config file, then the
 * global section, then the default.
 */
template< typename T >
T get_option( const std::string& option,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& service_config,
              const YAML::Node& global_config )
{
  auto key = option_key( option );

  if( args.count( key ) )
    return args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

/**
 * Accounts are referenced by user name or, for any account type, by their 32
 * bytes in hex ("0x02...").
 */
protocol::account to_account( const std::string& reference )
{
  if( !reference.starts_with( "0x" ) )
    return protocol::user_account( reference );

  auto account = protocol::account_from_hex( reference );
  if( !account )
    throw std::runtime_error( "invalid account '" + reference + "': " + account.error().message() );

  return *account;
}

protocol::amount to_units( const std::string& value )
{
  auto units = protocol::parse_units( value );
  if( !units )
    throw std::runtime_error( "invalid amount '" + value + "'" );

  return *units;
}

template< typename T >
T get_value( const YAML::Node& node, const std::string& key, const T& default_value )
{
  if( node && node[ key ] )
    return node[ key ].as< T >();

  return default_value;
}

protocol::amount get_units( const YAML::Node& node, const std::string& key, const std::string& default_value )
{
  return to_units( get_value< std::string >( node, key, default_value ) );
}

template< typename... Args >
std::vector< std::byte > make_stdin( const Args&... args )
{
  return program::codec::encode( args... );
}

template< typename Instruction, typename... Args >
std::vector< std::byte > make_call( Instruction instr, const Args&... args )
{
  return program::codec::encode( std::to_underlying( instr ), args... );
}

class node
{
public:
  node( const YAML::Node& config ):
      _config( config )
  {}

  void open()
  {
    controller::state::genesis_data genesis;

    if( auto accounts = _config[ "accounts" ]; accounts )
    {
      for( const auto& entry: accounts )
      {
        auto name  = entry.first.as< std::string >();
        auto value = to_units( entry.second.as< std::string >() );

        LOG_INFO( log::instance(), "Genesis allocation - {}: {}", name, log::units{ value } );
        genesis.emplace_back( controller::state::currency_allocation( to_account( name ), value ) );
      }
    }

    _controller.open( genesis );
  }

  void deploy()
  {
    auto token_config    = _config[ "token" ];
    auto exchange_config = _config[ "exchange" ];

    _token_id    = get_value< std::string >( token_config, "id", constants::token_id );
    _exchange_id = get_value< std::string >( exchange_config, "id", constants::exchange_id );
    _token       = protocol::program_account( _token_id );
    _exchange    = protocol::program_account( _exchange_id );

    auto minter = to_account( get_value< std::string >( token_config, "minter", "minter" ) );
    auto admin  = to_account( get_value< std::string >( token_config, "admin", "admin" ) );

    protocol::deploy_program token;
    token.id          = _token;
    token.kind        = "token";
    token.input.stdin = make_stdin( std::string_view( get_value< std::string >( token_config, "name", constants::token_name ) ),
                                    std::string_view( get_value< std::string >( token_config, "symbol", constants::token_symbol ) ),
                                    get_units( token_config, "max-supply", constants::max_supply ),
                                    minter,
                                    get_units( token_config, "initial-mint", constants::initial_mint ),
                                    admin,
                                    get_value< std::uint64_t >( token_config, "admin-delay", constants::no_delay ) );

    // A program account is claimed by the user account of the same name
    submit( protocol::user_account( _token ), token );

    protocol::deploy_program exchange;
    exchange.id          = _exchange;
    exchange.kind        = "exchange";
    exchange.input.stdin = make_stdin( _token,
                                       get_units( exchange_config, "buy-price", constants::buy_price ),
                                       get_units( exchange_config, "sell-price", constants::sell_price ) );

    submit( protocol::user_account( _exchange ), exchange );

    protocol::call_program grant;
    grant.id          = _token;
    grant.input.stdin = make_call( program::token::instruction::grant_role, std::to_underlying( program::role::minter ), _exchange );

    submit( admin, grant );
  }

  /**
   * Replays the configured transactions. A reverted transaction is logged and
   * replay continues.
   */
  void replay()
  {
    auto transactions = _config[ "transactions" ];
    if( !transactions )
      return;

    for( const auto& entry: transactions )
    {
      auto payer  = to_account( entry[ "payer" ].as< std::string >() );
      auto action = entry[ "action" ].as< std::string >();

      submit( payer, make_operation( payer, action, entry ) );
    }
  }

  void report()
  {
    std::map< std::string, protocol::account > accounts;

    if( auto allocations = _config[ "accounts" ]; allocations )
      for( const auto& entry: allocations )
      {
        auto name = entry.first.as< std::string >();
        accounts.emplace( name, to_account( name ) );
      }

    for( const auto& [ name, account ]: accounts )
      LOG_INFO( log::instance(),
                "{} - currency: {}, tokens: {}",
                name,
                log::units{ _controller.currency_balance( account ) },
                log::units{ query_amount( _token, make_call( program::token::instruction::balance_of, account ) ) } );

    LOG_INFO( log::instance(),
              "Exchange - currency reserve: {}, token reserve: {}",
              log::units{ _controller.currency_balance( _exchange ) },
              log::units{ query_amount( _token, make_call( program::token::instruction::balance_of, _exchange ) ) } );

    LOG_INFO( log::instance(),
              "Token supply: {} of {}",
              log::units{ query_amount( _token, make_call( program::token::instruction::total_supply ) ) },
              log::units{ query_amount( _token, make_call( program::token::instruction::max_supply ) ) } );

    auto head = _controller.head();
    LOG_INFO( log::instance(), "Head revision: {}, time: {}", head.revision, head.time );
  }

  void close()
  {
    _controller.close();
  }

private:
  protocol::operation make_operation( const protocol::account& payer, const std::string& action, const YAML::Node& entry )
  {
    // The deployed programs are referenced by their configured ids
    auto account = [ & ]( const std::string& key )
    {
      auto reference = entry[ key ].as< std::string >();
      if( reference == _token_id )
        return _token;
      if( reference == _exchange_id )
        return _exchange;
      return to_account( reference );
    };

    auto units = [ & ]( const std::string& key )
    {
      return to_units( entry[ key ].as< std::string >() );
    };

    auto call = [ & ]( const protocol::account& id, std::vector< std::byte >&& stdin, const protocol::amount& value = 0 )
    {
      protocol::call_program op;
      op.id          = id;
      op.input.stdin = std::move( stdin );
      op.value       = value;
      return protocol::operation( op );
    };

    using token_instruction    = program::token::instruction;
    using exchange_instruction = program::exchange::instruction;

    if( action == "transfer-currency" )
      return protocol::transfer_currency{ .to = account( "to" ), .value = units( "value" ) };
    if( action == "buy" )
      return call( _exchange, make_call( exchange_instruction::buy ), units( "value" ) );
    if( action == "sell" )
      return call( _exchange, make_call( exchange_instruction::sell, units( "tokens" ) ) );
    if( action == "withdraw-currency" )
      return call( _exchange, make_call( exchange_instruction::withdraw_currency ) );
    if( action == "withdraw-tokens" )
      return call( _exchange, make_call( exchange_instruction::withdraw_tokens, units( "tokens" ) ) );
    if( action == "approve-exchange" )
      return call( _token, make_call( token_instruction::approve, payer, _exchange, units( "value" ) ) );
    if( action == "approve" )
      return call( _token, make_call( token_instruction::approve, payer, account( "spender" ), units( "value" ) ) );
    if( action == "transfer" )
      return call( _token, make_call( token_instruction::transfer, payer, account( "to" ), units( "value" ) ) );
    if( action == "mint" )
      return call( _token, make_call( token_instruction::mint, account( "to" ), units( "value" ) ) );
    if( action == "pause" )
      return call( _token, make_call( token_instruction::pause ) );
    if( action == "unpause" )
      return call( _token, make_call( token_instruction::unpause ) );

    throw std::runtime_error( "unknown action '" + action + "'" );
  }

  void submit( const protocol::account& payer, protocol::operation&& op )
  {
    protocol::transaction transaction;
    transaction.payer = payer;
    transaction.nonce = _controller.account_nonce( payer ) + 1;
    transaction.operations.emplace_back( std::move( op ) );

    auto receipt = _controller.process( transaction );

    if( !receipt )
      throw std::runtime_error( "transaction rejected: " + receipt.error().message() );

    if( receipt->reverted )
      LOG_WARNING( log::instance(),
                   "Transaction {} from {} reverted: {}",
                   receipt->nonce,
                   log::hex{ payer.data(), payer.size() },
                   receipt->error.message() );
    else
      LOG_INFO( log::instance(),
                "Transaction {} from {} applied with {} event(s)",
                receipt->nonce,
                log::hex{ payer.data(), payer.size() },
                receipt->events.size() );
  }

  protocol::amount query_amount( const protocol::account& id, std::vector< std::byte >&& stdin )
  {
    protocol::program_input input;
    input.stdin = std::move( stdin );

    auto output = _controller.read_program( id, input );
    if( !output )
      throw std::runtime_error( "query failed: " + output.error().message() );

    protocol::amount value = 0;
    if( auto error = program::codec::reader( output->stdout ).read( value ); error )
      throw std::runtime_error( "malformed query output: " + error.message() );

    return value;
  }

  YAML::Node _config;
  controller::controller _controller;
  std::string _token_id;
  std::string _exchange_id;
  protocol::account _token{};
  protocol::account _exchange{};
};

} // namespace

auto main( int argc, char** argv ) -> int
{
  tessera::log::initialize();

  std::string log_level;
  YAML::Node config;
  YAML::Node global_config;
  YAML::Node service_config;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()     , "Print this help message and exit" )
      ( constants::version_option.data()  , "Print version string and exit" )
      ( constants::basedir_option.data()  , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Tessera base directory" )
      ( constants::config_option.data()   , boost::program_options::value< std::string >()->default_value( constants::config_default ), "The configuration file (absolute path or relative to basedir)" )
      ( constants::log_level_option.data(), boost::program_options::value< std::string >(), "The log filtering level" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::println( "v0.0.1" );
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    auto config_file = std::filesystem::path( args[ "config" ].as< std::string >() );
    if( config_file.is_relative() )
      config_file = basedir / config_file;

    if( std::filesystem::exists( config_file ) )
    {
      config         = YAML::LoadFile( config_file.string() );
      global_config  = config[ "global" ];
      service_config = config[ constants::service ];
    }

    log_level = get_option< std::string >( constants::log_level_option,
                                           constants::log_level_default,
                                           args,
                                           service_config,
                                           global_config );

    tessera::log::set_level( log_level );

    if( config.IsNull() )
      LOG_WARNING( tessera::log::instance(),
                   "Could not find config at {}, using default values",
                   config_file.string() );
    else
      LOG_INFO( tessera::log::instance(), "Using config: {}", config_file.string() );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( tessera::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  try
  {
    node n( service_config ? service_config : YAML::Node( YAML::NodeType::Map ) );
    n.open();
    n.deploy();
    n.replay();
    n.report();
    n.close();
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( tessera::log::instance(), "An unexpected error has occurred: {}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
