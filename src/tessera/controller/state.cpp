#include <tessera/controller/state.hpp>
#include <tessera/memory.hpp>

#include <string_view>
#include <utility>

namespace tessera::controller::state {
namespace space {

enum class system_space_id : std::uint32_t
{
  metadata          = 0,
  program_data      = 1,
  transaction_nonce = 2,
  currency_balance  = 3
};

const state_db::object_space& program_data()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::program_data ) };
  return s;
}

const state_db::object_space& metadata()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::metadata ) };
  return s;
}

const state_db::object_space& transaction_nonce()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::transaction_nonce ) };
  return s;
}

const state_db::object_space& currency_balance()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::currency_balance ) };
  return s;
}

} // namespace space

namespace key {

std::span< const std::byte > head_time()
{
  static constexpr std::string_view k = "object_key::head_time";
  return memory::as_bytes( k );
}

} // namespace key

genesis_entry currency_allocation( const protocol::account& account, const protocol::amount& value )
{
  auto bytes = protocol::to_bytes( value );

  return genesis_entry{ .space = space::currency_balance(),
                        .key   = std::vector< std::byte >( account.begin(), account.end() ),
                        .value = std::vector< std::byte >( bytes.begin(), bytes.end() ) };
}

} // namespace tessera::controller::state
