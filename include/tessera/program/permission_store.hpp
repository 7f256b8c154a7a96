#pragma once

#include <tessera/program/error.hpp>
#include <tessera/program/role.hpp>
#include <tessera/program/system_interface.hpp>
#include <tessera/protocol.hpp>

#include <cstdint>
#include <optional>

namespace tessera::program {

struct pending_admin
{
  protocol::account candidate{};
  std::uint64_t not_before = 0;
};

/**
 * Role assignments and the two step admin transfer, stored in the object
 * spaces of the program that owns the store. The admin is a single
 * principal. Minter and pauser are sets of principals managed by the admin.
 */
class permission_store final
{
public:
  static constexpr std::uint32_t role_id          = 16;
  static constexpr std::uint32_t admin_id         = 17;
  static constexpr std::uint32_t pending_admin_id = 18;
  static constexpr std::uint32_t admin_delay_id   = 19;

  explicit permission_store( system_interface* system ) noexcept;

  std::error_code initialize( const protocol::account& admin, std::uint64_t admin_delay );

  bool has_permission( protocol::account_view principal, role r ) const;

  protocol::account admin() const;
  std::optional< pending_admin > pending() const;
  std::uint64_t admin_delay() const;

  std::error_code grant( const protocol::account& sender, role r, const protocol::account& principal );
  std::error_code revoke( const protocol::account& sender, role r, const protocol::account& principal );

  /**
   * Drops a role held by the sender itself.
   */
  std::error_code renounce( const protocol::account& sender, role r, const protocol::account& principal );

  /**
   * The candidate may accept no earlier than max(not_before, now + admin_delay).
   */
  std::error_code
  propose_admin( const protocol::account& sender, const protocol::account& candidate, std::uint64_t not_before );
  std::error_code accept_admin( const protocol::account& sender );
  std::error_code cancel_admin( const protocol::account& sender );

private:
  std::error_code set_role( const protocol::account& sender, role r, const protocol::account& principal, bool granted );

  system_interface* _system;
};

} // namespace tessera::program
