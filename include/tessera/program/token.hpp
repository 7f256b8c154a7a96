#pragma once

#include <cstdint>
#include <string>

#include <tessera/program/error.hpp>
#include <tessera/program/program.hpp>
#include <tessera/protocol.hpp>

namespace tessera::program {

/**
 * A fungible token with a hard supply cap, allowances, a pause switch and
 * role gated minting.
 *
 * Construction input: name, symbol, max supply, initial minter, initial
 * balance of the minter, admin, admin transfer delay in milliseconds. The
 * initial minter also holds the pauser role.
 */
struct token final: public program
{
  token()               = default;
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::error_code construct( system_interface* system, std::span< const std::string > arguments ) override;
  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    authorize,
    name,
    symbol,
    decimals,
    total_supply,
    max_supply,
    balance_of,
    allowance,
    paused,
    has_role,
    admin,
    pending_admin,
    admin_delay,
    mint,
    transfer,
    transfer_from,
    approve,
    pause,
    unpause,
    grant_role,
    revoke_role,
    renounce_role,
    propose_admin,
    accept_admin,
    cancel_admin
  };

private:
  std::error_code dispatch( system_interface* system, instruction instr );

  std::error_code mint( system_interface* system, const protocol::account& to, const protocol::amount& value );
  std::error_code move( system_interface* system,
                        const protocol::account& from,
                        const protocol::account& to,
                        const protocol::amount& value );
  std::error_code require_authority( system_interface* system, const protocol::account& account );
  std::error_code require_unpaused( system_interface* system );

  protocol::amount total_supply( system_interface* system );
  protocol::amount max_supply( system_interface* system );
  protocol::amount balance_of( system_interface* system, const protocol::account& account );
  protocol::amount allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender );
  bool paused( system_interface* system );
};

} // namespace tessera::program
