#pragma once

#include <cstdint>
#include <string>

#include <tessera/program/error.hpp>
#include <tessera/program/program.hpp>
#include <tessera/protocol.hpp>

namespace tessera::program {

/**
 * Converts native currency into tokens and back at two fixed prices. Prices
 * are given in smallest currency units per whole token.
 *
 * Purchases are filled from the exchange's own token reserve first and only
 * the shortfall is minted. Sales are paid from the currency the exchange
 * holds. An empty input carrying currency is a purchase.
 *
 * Construction input: token account, buy price, sell price. The deployer
 * becomes the owner.
 */
struct exchange final: public program
{
  exchange()                  = default;
  exchange( const exchange& ) = delete;
  exchange( exchange&& )      = delete;
  ~exchange() override        = default;

  exchange& operator=( const exchange& ) = delete;
  exchange& operator=( exchange&& )      = delete;

  std::error_code construct( system_interface* system, std::span< const std::string > arguments ) override;
  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    authorize,
    buy,
    sell,
    withdraw_currency,
    withdraw_tokens,
    transfer_ownership,
    accept_ownership,
    cancel_ownership_transfer,
    token,
    buy_price,
    sell_price,
    owner,
    pending_owner,
    currency_reserve,
    token_reserve
  };

private:
  std::error_code dispatch( system_interface* system, instruction instr );

  std::error_code buy( system_interface* system, const protocol::account& buyer, const protocol::amount& paid );
  std::error_code sell( system_interface* system, const protocol::account& seller, const protocol::amount& tokens );
  std::error_code withdraw_currency( system_interface* system );
  std::error_code withdraw_tokens( system_interface* system, const protocol::amount& tokens );
  std::error_code transfer_ownership( system_interface* system, const protocol::account& candidate );
  std::error_code accept_ownership( system_interface* system );
  std::error_code cancel_ownership_transfer( system_interface* system );

  result< protocol::amount > token_reserve( system_interface* system );

  protocol::account token_account( system_interface* system );
  protocol::amount buy_price( system_interface* system );
  protocol::amount sell_price( system_interface* system );
  protocol::account owner( system_interface* system );
  protocol::account pending_owner( system_interface* system );
};

} // namespace tessera::program
