// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tessera/controller.hpp>
#include <tessera/program.hpp>
#include <tessera/protocol.hpp>
#include <test/fixture.hpp>

#include <limits>

using tessera::program::program_errc;
using tessera::program::role;
using tessera::protocol::amount;
using tessera::protocol::scale;
using instruction       = tessera::program::exchange::instruction;
using token_instruction = tessera::program::token::instruction;

class exchange: public ::testing::Test,
                public test::fixture
{
public:
  exchange():
      test::fixture( "exchange", "info" )
  {}

  exchange( const exchange& ) = delete;
  exchange( exchange&& )      = delete;

  ~exchange() override = default;

  exchange& operator=( const exchange& ) = delete;
  exchange& operator=( exchange&& )      = delete;

  void SetUp() override
  {
    deploy();
    _buy_price  = read_amount( query( _exchange, instruction::buy_price ) );
    _sell_price = read_amount( query( _exchange, instruction::sell_price ) );
  }

  tessera::controller::result< tessera::protocol::transaction_receipt > buy( const tessera::protocol::account& buyer,
                                                                             const amount& paid )
  {
    return push( buyer, make_call_operation( _exchange, make_stdin( instruction::buy ), paid ) );
  }

  tessera::controller::result< tessera::protocol::transaction_receipt > sell( const tessera::protocol::account& seller,
                                                                              const amount& tokens )
  {
    return call( seller, _exchange, instruction::sell, tokens );
  }

  tessera::controller::result< tessera::protocol::transaction_receipt > approve( const tessera::protocol::account& owner,
                                                                                 const amount& value )
  {
    return call( owner, _token, token_instruction::approve, owner, _exchange, value );
  }

  amount token_reserve()
  {
    return balance_of( _exchange );
  }

  amount currency_reserve()
  {
    return currency_balance( _exchange );
  }

  // Currency needed to buy whole tokens at the configured price
  amount price_of( const amount& tokens )
  {
    return tokens / scale * _buy_price;
  }

  amount sum_of_balances()
  {
    amount sum = 0;
    for( const auto& account: { _admin, _minter, _owner, _alice, _bob, _exchange } )
      sum += balance_of( account );
    return sum;
  }

  amount _buy_price  = 0;
  amount _sell_price = 0;
};

TEST_F( exchange, metadata )
{
  EXPECT_EQ( read_account( query( _exchange, instruction::token ) ), _token );
  EXPECT_EQ( _buy_price, scale / 1'000 );
  EXPECT_EQ( _sell_price, scale / 2'000 );
  EXPECT_EQ( read_account( query( _exchange, instruction::owner ) ), _owner );
  EXPECT_TRUE( read_account( query( _exchange, instruction::pending_owner ) ).null() );
  EXPECT_EQ( read_amount( query( _exchange, instruction::currency_reserve ) ), 0 );
  EXPECT_EQ( read_amount( query( _exchange, instruction::token_reserve ) ), 0 );
}

TEST_F( exchange, construction_is_validated )
{
  auto other = tessera::protocol::program_account( "other_exchange" );
  auto payer = tessera::protocol::user_account( other );

  auto deploy_with = [ & ]( const tessera::protocol::account& token_program, const amount& buy_at, const amount& sell_at )
  {
    return push( payer, make_deploy_operation( other, "exchange", make_stdin( token_program, buy_at, sell_at ) ) );
  };

  EXPECT_TRUE( verify_reverted( deploy_with( tessera::protocol::null_account, _buy_price, _sell_price ),
                                program_errc::zero_address ) );
  EXPECT_TRUE( verify_reverted( deploy_with( _alice, _buy_price, _sell_price ), program_errc::invalid_argument ) );
  EXPECT_TRUE( verify_reverted( deploy_with( _token, amount( 0 ), _sell_price ), program_errc::zero_amount ) );
  EXPECT_TRUE( verify_reverted( deploy_with( _token, _buy_price, amount( 0 ) ), program_errc::zero_amount ) );
  EXPECT_TRUE( verify_reverted( push( payer,
                                      make_deploy_operation( other,
                                                             "exchange",
                                                             make_stdin( _token, _buy_price, _sell_price, std::uint8_t( 0 ) ) ) ),
                                program_errc::unexpected_payload ) );

  ASSERT_TRUE( verify( deploy_with( _token, _buy_price, _sell_price ),
                       verification::processed | verification::without_reversion ) );
  EXPECT_EQ( read_account( query( other, instruction::owner ) ), payer );
}

TEST_F( exchange, buy_mints_when_reserve_is_empty )
{
  auto supply   = total_supply();
  auto currency = currency_balance( _bob );

  auto receipt = buy( _bob, price_of( scale * 1'000 ) );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  EXPECT_EQ( balance_of( _bob ), scale * 1'000 );
  EXPECT_EQ( total_supply(), supply + scale * 1'000 );
  EXPECT_EQ( currency_balance( _bob ), currency - scale );
  EXPECT_EQ( currency_reserve(), scale );

  auto purchases = events< tessera::program::purchase_event >( *receipt, tessera::program::event_name::purchase );
  ASSERT_EQ( purchases.size(), 1 );
  EXPECT_EQ( purchases[ 0 ].buyer, _bob );
  EXPECT_EQ( purchases[ 0 ].paid, scale );
  EXPECT_EQ( purchases[ 0 ].tokens, scale * 1'000 );
  EXPECT_EQ( purchases[ 0 ].from_reserve, 0 );
  EXPECT_EQ( purchases[ 0 ].minted, scale * 1'000 );

  auto mints = events< tessera::program::mint_event >( *receipt, tessera::program::event_name::mint );
  ASSERT_EQ( mints.size(), 1 );
  EXPECT_EQ( mints[ 0 ].to, _bob );

  EXPECT_TRUE( events< tessera::program::transfer_event >( *receipt, tessera::program::event_name::transfer ).empty() );
}

TEST_F( exchange, bare_currency_transfer_is_a_purchase )
{
  auto receipt = push( _alice, make_transfer_currency_operation( _exchange, price_of( scale * 10 ) ) );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  EXPECT_EQ( balance_of( _alice ), scale * 10 );
  EXPECT_EQ( currency_reserve(), price_of( scale * 10 ) );
  EXPECT_EQ( events< tessera::program::purchase_event >( *receipt, tessera::program::event_name::purchase ).size(), 1 );
}

TEST_F( exchange, buy_rejects_zero )
{
  EXPECT_TRUE( verify_reverted( buy( _bob, 0 ), program_errc::zero_amount ) );

  // Less than the price of one whole token
  EXPECT_TRUE( verify_reverted( buy( _bob, _buy_price - 1 ), program_errc::zero_amount ) );

  EXPECT_EQ( currency_balance( _bob ), scale * 1'000 );
  EXPECT_EQ( currency_reserve(), 0 );
  EXPECT_EQ( balance_of( _bob ), 0 );
}

TEST_F( exchange, buy_truncates_to_whole_tokens )
{
  auto paid = _buy_price + _buy_price / 2;

  auto receipt = buy( _alice, paid );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  EXPECT_EQ( balance_of( _alice ), scale );
  EXPECT_EQ( currency_reserve(), paid );
  EXPECT_EQ( currency_balance( _alice ), scale * 1'000 - paid );

  auto purchases = events< tessera::program::purchase_event >( *receipt, tessera::program::event_name::purchase );
  ASSERT_EQ( purchases.size(), 1 );
  EXPECT_EQ( purchases[ 0 ].paid, paid );
  EXPECT_EQ( purchases[ 0 ].tokens, scale );
}

TEST_F( exchange, buy_prefers_reserve )
{
  // Seed a reserve of 100 tokens
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::transfer, _minter, _exchange, scale * 100 ),
                       verification::processed | verification::without_reversion ) );
  ASSERT_EQ( token_reserve(), scale * 100 );

  auto supply = total_supply();

  auto receipt = buy( _alice, price_of( scale * 100 ) );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  EXPECT_EQ( total_supply(), supply );
  EXPECT_EQ( token_reserve(), 0 );
  EXPECT_EQ( balance_of( _alice ), scale * 100 );

  auto purchases = events< tessera::program::purchase_event >( *receipt, tessera::program::event_name::purchase );
  ASSERT_EQ( purchases.size(), 1 );
  EXPECT_EQ( purchases[ 0 ].from_reserve, scale * 100 );
  EXPECT_EQ( purchases[ 0 ].minted, 0 );
  EXPECT_TRUE( events< tessera::program::mint_event >( *receipt, tessera::program::event_name::mint ).empty() );
}

TEST_F( exchange, buy_mints_only_the_shortfall )
{
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::transfer, _minter, _exchange, scale * 100 ),
                       verification::processed | verification::without_reversion ) );

  auto supply = total_supply();

  auto receipt = buy( _alice, price_of( scale * 101 ) );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  EXPECT_EQ( total_supply(), supply + scale );
  EXPECT_EQ( token_reserve(), 0 );
  EXPECT_EQ( balance_of( _alice ), scale * 101 );

  auto purchases = events< tessera::program::purchase_event >( *receipt, tessera::program::event_name::purchase );
  ASSERT_EQ( purchases.size(), 1 );
  EXPECT_EQ( purchases[ 0 ].from_reserve, scale * 100 );
  EXPECT_EQ( purchases[ 0 ].minted, scale );

  EXPECT_EQ( total_supply(), sum_of_balances() );
}

TEST_F( exchange, buy_past_the_cap_keeps_the_payment_with_the_buyer )
{
  auto remaining = scale * 1'000'000 - total_supply();
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::mint, _alice, remaining - scale * 10 ),
                       verification::processed | verification::without_reversion ) );

  auto currency = currency_balance( _bob );
  auto supply   = total_supply();

  EXPECT_TRUE( verify_reverted( buy( _bob, price_of( scale * 11 ) ), program_errc::max_supply_reached ) );

  EXPECT_EQ( currency_balance( _bob ), currency );
  EXPECT_EQ( currency_reserve(), 0 );
  EXPECT_EQ( total_supply(), supply );

  EXPECT_TRUE( verify( buy( _bob, price_of( scale * 10 ) ), verification::processed | verification::without_reversion ) );
  EXPECT_EQ( total_supply(), scale * 1'000'000 );
}

TEST_F( exchange, buy_rejects_a_token_count_that_does_not_fit )
{
  // A price of one unit per whole token and buyers rich enough to overflow the token count
  reopen( std::numeric_limits< amount >::max() / 2 );

  test::deployment d;
  d.buy_price  = 1;
  d.sell_price = 1;
  deploy( d );

  auto currency = currency_balance( _bob );
  auto supply   = total_supply();
  auto paid     = std::numeric_limits< amount >::max() / scale + 1;

  EXPECT_TRUE( verify_reverted( buy( _bob, paid ), program_errc::overflow ) );

  EXPECT_EQ( currency_balance( _bob ), currency );
  EXPECT_EQ( currency_reserve(), 0 );
  EXPECT_EQ( total_supply(), supply );
  EXPECT_EQ( balance_of( _bob ), 0 );

  // The largest count that fits is still only capped by the supply
  EXPECT_TRUE( verify_reverted( buy( _bob, paid - 1 ), program_errc::max_supply_reached ) );
}

TEST_F( exchange, sell_rejects_a_payout_that_does_not_fit )
{
  reopen( scale * 1'000 );

  test::deployment d;
  d.sell_price = std::numeric_limits< amount >::max() / 2;
  deploy( d );

  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::transfer, _minter, _alice, scale ),
                       verification::processed | verification::without_reversion ) );
  ASSERT_TRUE( verify( approve( _alice, scale ), verification::processed | verification::without_reversion ) );

  auto tokens   = balance_of( _alice );
  auto currency = currency_balance( _alice );

  EXPECT_TRUE( verify_reverted( sell( _alice, amount( 3 ) ), program_errc::overflow ) );

  EXPECT_EQ( balance_of( _alice ), tokens );
  EXPECT_EQ( currency_balance( _alice ), currency );
  EXPECT_EQ( allowance( _alice, _exchange ), scale );
  EXPECT_EQ( token_reserve(), 0 );
}

TEST_F( exchange, buy_fails_without_the_minter_role )
{
  ASSERT_TRUE( verify( call( _admin, _token, token_instruction::revoke_role, role::minter, _exchange ),
                       verification::processed | verification::without_reversion ) );

  EXPECT_TRUE( verify_reverted( buy( _bob, price_of( scale ) ), program_errc::unauthorized ) );
  EXPECT_EQ( currency_balance( _bob ), scale * 1'000 );
}

TEST_F( exchange, buy_fails_while_the_token_is_paused )
{
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::pause ),
                       verification::processed | verification::without_reversion ) );

  EXPECT_TRUE( verify_reverted( buy( _bob, price_of( scale ) ), program_errc::paused ) );
  EXPECT_EQ( currency_balance( _bob ), scale * 1'000 );
}

TEST_F( exchange, sell )
{
  ASSERT_TRUE( verify( buy( _alice, scale ), verification::processed | verification::without_reversion ) );
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::transfer, _minter, _bob, scale * 100 ),
                       verification::processed | verification::without_reversion ) );

  auto total = sum_of_balances();

  EXPECT_TRUE( verify_reverted( sell( _bob, scale * 10 ), program_errc::insufficient_allowance ) );

  ASSERT_TRUE( verify( approve( _bob, scale * 10 ), verification::processed | verification::without_reversion ) );

  auto currency = currency_balance( _bob );
  auto receipt  = sell( _bob, scale * 10 );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  amount owed = scale * 10 * _sell_price / scale;

  EXPECT_EQ( balance_of( _bob ), scale * 90 );
  EXPECT_EQ( token_reserve(), scale * 10 );
  EXPECT_EQ( currency_balance( _bob ), currency + owed );
  EXPECT_EQ( currency_reserve(), scale - owed );
  EXPECT_EQ( allowance( _bob, _exchange ), 0 );
  EXPECT_EQ( sum_of_balances(), total );

  auto sales = events< tessera::program::sale_event >( *receipt, tessera::program::event_name::sale );
  ASSERT_EQ( sales.size(), 1 );
  EXPECT_EQ( sales[ 0 ].seller, _bob );
  EXPECT_EQ( sales[ 0 ].tokens, scale * 10 );
  EXPECT_EQ( sales[ 0 ].paid, owed );

  EXPECT_TRUE( verify_reverted( sell( _bob, amount( 0 ) ), program_errc::zero_amount ) );

  // One smallest unit is worth less than one smallest currency unit
  ASSERT_TRUE( verify( approve( _bob, scale * 1'000 ), verification::processed | verification::without_reversion ) );
  EXPECT_TRUE( verify_reverted( sell( _bob, amount( 1 ) ), program_errc::zero_amount ) );

  EXPECT_TRUE( verify_reverted( sell( _bob, scale * 91 ), program_errc::insufficient_balance ) );
  EXPECT_EQ( balance_of( _bob ), scale * 90 );
  EXPECT_EQ( currency_balance( _bob ), currency + owed );
}

TEST_F( exchange, sell_checks_the_currency_reserve_first )
{
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::transfer, _minter, _bob, scale * 100 ),
                       verification::processed | verification::without_reversion ) );
  ASSERT_TRUE( verify( approve( _bob, scale * 100 ), verification::processed | verification::without_reversion ) );

  auto currency = currency_balance( _bob );

  EXPECT_TRUE( verify_reverted( sell( _bob, scale * 100 ), program_errc::insufficient_reserve ) );

  EXPECT_EQ( balance_of( _bob ), scale * 100 );
  EXPECT_EQ( allowance( _bob, _exchange ), scale * 100 );
  EXPECT_EQ( currency_balance( _bob ), currency );
  EXPECT_EQ( token_reserve(), 0 );
}

TEST_F( exchange, round_trip_loses_the_spread )
{
  auto currency = currency_balance( _alice );
  auto paid     = price_of( scale * 1'000 ) + _buy_price / 2;

  ASSERT_TRUE( verify( buy( _alice, paid ), verification::processed | verification::without_reversion ) );

  auto tokens = balance_of( _alice );
  ASSERT_EQ( tokens, scale * 1'000 );

  ASSERT_TRUE( verify( approve( _alice, tokens ), verification::processed | verification::without_reversion ) );
  ASSERT_TRUE( verify( sell( _alice, tokens ), verification::processed | verification::without_reversion ) );

  EXPECT_EQ( balance_of( _alice ), 0 );
  EXPECT_LT( currency_balance( _alice ), currency );

  amount shortfall = tokens * ( _buy_price - _sell_price ) / scale + _buy_price / 2;
  EXPECT_EQ( currency - currency_balance( _alice ), shortfall );
  EXPECT_EQ( currency_reserve(), shortfall );
  EXPECT_EQ( token_reserve(), tokens );
}

TEST_F( exchange, withdraw_currency )
{
  EXPECT_TRUE( verify_reverted( call( _owner, _exchange, instruction::withdraw_currency ),
                                program_errc::insufficient_reserve ) );

  ASSERT_TRUE( verify( buy( _alice, scale * 2 ), verification::processed | verification::without_reversion ) );

  EXPECT_TRUE(
    verify_reverted( call( _alice, _exchange, instruction::withdraw_currency ), program_errc::unauthorized ) );
  EXPECT_EQ( currency_reserve(), scale * 2 );

  auto currency = currency_balance( _owner );
  auto receipt  = call( _owner, _exchange, instruction::withdraw_currency );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  EXPECT_EQ( currency_reserve(), 0 );
  EXPECT_EQ( currency_balance( _owner ), currency + scale * 2 );

  auto withdrawals =
    events< tessera::program::withdrawal_event >( *receipt, tessera::program::event_name::currency_withdrawal );
  ASSERT_EQ( withdrawals.size(), 1 );
  EXPECT_EQ( withdrawals[ 0 ].to, _owner );
  EXPECT_EQ( withdrawals[ 0 ].value, scale * 2 );
}

TEST_F( exchange, withdraw_tokens_is_bounded_by_the_reserve )
{
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::transfer, _minter, _exchange, scale * 50 ),
                       verification::processed | verification::without_reversion ) );

  EXPECT_TRUE( verify_reverted( call( _alice, _exchange, instruction::withdraw_tokens, scale ),
                                program_errc::unauthorized ) );
  EXPECT_TRUE( verify_reverted( call( _owner, _exchange, instruction::withdraw_tokens, amount( 0 ) ),
                                program_errc::zero_amount ) );
  EXPECT_TRUE( verify_reverted( call( _owner, _exchange, instruction::withdraw_tokens, scale * 50 + 1 ),
                                program_errc::insufficient_reserve ) );
  EXPECT_EQ( token_reserve(), scale * 50 );

  auto receipt = call( _owner, _exchange, instruction::withdraw_tokens, scale * 50 );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  EXPECT_EQ( token_reserve(), 0 );
  EXPECT_EQ( balance_of( _owner ), scale * 50 );

  auto withdrawals =
    events< tessera::program::withdrawal_event >( *receipt, tessera::program::event_name::token_withdrawal );
  ASSERT_EQ( withdrawals.size(), 1 );
  EXPECT_EQ( withdrawals[ 0 ].to, _owner );
  EXPECT_EQ( withdrawals[ 0 ].value, scale * 50 );
}

TEST_F( exchange, unauthorized_calls_change_nothing )
{
  ASSERT_TRUE( verify( buy( _alice, scale ), verification::processed | verification::without_reversion ) );
  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::transfer, _minter, _exchange, scale * 5 ),
                       verification::processed | verification::without_reversion ) );

  auto supply   = total_supply();
  auto reserve  = token_reserve();
  auto treasury = currency_reserve();
  auto currency = currency_balance( _bob );

  EXPECT_TRUE( verify_reverted( call( _bob, _exchange, instruction::withdraw_currency ), program_errc::unauthorized ) );
  EXPECT_TRUE( verify_reverted( call( _bob, _exchange, instruction::withdraw_tokens, scale ),
                                program_errc::unauthorized ) );
  EXPECT_TRUE( verify_reverted( call( _bob, _exchange, instruction::transfer_ownership, _bob ),
                                program_errc::unauthorized ) );
  EXPECT_TRUE( verify_reverted( call( _bob, _token, token_instruction::mint, _bob, scale ),
                                program_errc::unauthorized ) );
  EXPECT_TRUE( verify_reverted( call( _bob, _token, token_instruction::pause ), program_errc::unauthorized ) );

  EXPECT_EQ( total_supply(), supply );
  EXPECT_EQ( token_reserve(), reserve );
  EXPECT_EQ( currency_reserve(), treasury );
  EXPECT_EQ( currency_balance( _bob ), currency );
  EXPECT_EQ( balance_of( _bob ), 0 );
  EXPECT_EQ( read_account( query( _exchange, instruction::owner ) ), _owner );
}

TEST_F( exchange, ownership_transfer )
{
  EXPECT_TRUE( verify_reverted( call( _owner, _exchange, instruction::cancel_ownership_transfer ),
                                program_errc::no_pending_transfer ) );
  EXPECT_TRUE(
    verify_reverted( call( _alice, _exchange, instruction::accept_ownership ), program_errc::unauthorized ) );
  EXPECT_TRUE( verify_reverted( call( _owner, _exchange, instruction::transfer_ownership, tessera::protocol::null_account ),
                                program_errc::zero_address ) );

  auto receipt = call( _owner, _exchange, instruction::transfer_ownership, _alice );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );
  EXPECT_EQ( read_account( query( _exchange, instruction::pending_owner ) ), _alice );
  EXPECT_EQ(
    events< tessera::program::ownership_event >( *receipt, tessera::program::event_name::ownership_transfer_proposed )
      .size(),
    1 );

  // Proposing does not hand over control
  EXPECT_EQ( read_account( query( _exchange, instruction::owner ) ), _owner );
  EXPECT_TRUE(
    verify_reverted( call( _bob, _exchange, instruction::accept_ownership ), program_errc::unauthorized ) );

  receipt = call( _alice, _exchange, instruction::accept_ownership );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );

  auto transfers =
    events< tessera::program::ownership_event >( *receipt, tessera::program::event_name::ownership_transferred );
  ASSERT_EQ( transfers.size(), 1 );
  EXPECT_EQ( transfers[ 0 ].owner, _owner );
  EXPECT_EQ( transfers[ 0 ].candidate, _alice );

  EXPECT_EQ( read_account( query( _exchange, instruction::owner ) ), _alice );
  EXPECT_TRUE( read_account( query( _exchange, instruction::pending_owner ) ).null() );

  ASSERT_TRUE( verify( buy( _bob, scale ), verification::processed | verification::without_reversion ) );
  EXPECT_TRUE(
    verify_reverted( call( _owner, _exchange, instruction::withdraw_currency ), program_errc::unauthorized ) );
  EXPECT_TRUE( verify( call( _alice, _exchange, instruction::withdraw_currency ),
                       verification::processed | verification::without_reversion ) );

  ASSERT_TRUE( verify( call( _alice, _exchange, instruction::transfer_ownership, _bob ),
                       verification::processed | verification::without_reversion ) );
  receipt = call( _alice, _exchange, instruction::cancel_ownership_transfer );
  ASSERT_TRUE( verify( receipt, verification::processed | verification::without_reversion ) );
  EXPECT_EQ(
    events< tessera::program::ownership_event >( *receipt, tessera::program::event_name::ownership_transfer_canceled )
      .size(),
    1 );
  EXPECT_TRUE( verify_reverted( call( _bob, _exchange, instruction::accept_ownership ), program_errc::unauthorized ) );
}

TEST_F( exchange, malformed_input_is_rejected )
{
  EXPECT_TRUE( verify_reverted( call( _alice, _exchange, std::uint32_t( 99 ) ), program_errc::invalid_instruction ) );
  EXPECT_TRUE(
    verify_reverted( push( _alice, make_call_operation( _exchange, make_stdin( std::uint8_t( 1 ) ), scale ) ),
                     program_errc::unexpected_payload ) );
  EXPECT_TRUE( verify_reverted(
    push( _alice, make_call_operation( _exchange, make_stdin( instruction::buy, std::uint8_t( 0 ) ), scale ) ),
    program_errc::unexpected_payload ) );
  EXPECT_TRUE( verify_reverted(
    push( _alice, make_call_operation( _exchange, make_stdin( instruction::withdraw_currency ), scale ) ),
    program_errc::unexpected_value ) );
  EXPECT_TRUE( verify_reverted( call( _alice, _exchange, instruction::sell ), program_errc::unexpected_payload ) );

  EXPECT_EQ( currency_balance( _alice ), scale * 1'000 );
  EXPECT_EQ( currency_reserve(), 0 );
}

TEST_F( exchange, end_to_end )
{
  EXPECT_EQ( total_supply(), scale * 10'000 );
  EXPECT_EQ( balance_of( _minter ), scale * 10'000 );

  ASSERT_TRUE( verify( call( _minter, _token, token_instruction::mint, _alice, scale * 1'000 ),
                       verification::processed | verification::without_reversion ) );
  EXPECT_EQ( total_supply(), scale * 11'000 );

  ASSERT_TRUE( verify( buy( _bob, _buy_price * 1'000 ), verification::processed | verification::without_reversion ) );
  EXPECT_EQ( balance_of( _bob ), scale * 1'000 );
  EXPECT_EQ( total_supply(), scale * 12'000 );
  EXPECT_EQ( token_reserve(), 0 );

  ASSERT_TRUE( verify( approve( _bob, scale * 500 ), verification::processed | verification::without_reversion ) );

  auto currency = currency_balance( _bob );
  ASSERT_TRUE( verify( sell( _bob, scale * 500 ), verification::processed | verification::without_reversion ) );

  EXPECT_EQ( currency_balance( _bob ), currency + _sell_price * 500 );
  EXPECT_EQ( token_reserve(), scale * 500 );
  EXPECT_EQ( total_supply(), scale * 12'000 );

  ASSERT_TRUE( verify( buy( _alice, _buy_price * 500 ), verification::processed | verification::without_reversion ) );
  EXPECT_EQ( total_supply(), scale * 12'000 );
  EXPECT_EQ( token_reserve(), 0 );
  EXPECT_EQ( balance_of( _alice ), scale * 1'500 );

  EXPECT_EQ( total_supply(), sum_of_balances() );
  EXPECT_LE( total_supply(), read_amount( query( _token, token_instruction::max_supply ) ) );
}

// NOLINTEND
