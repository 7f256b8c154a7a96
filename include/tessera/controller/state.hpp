#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <tessera/protocol.hpp>
#include <tessera/state_db.hpp>

namespace tessera::controller { namespace state {

namespace space {

const state_db::object_space& program_data();
const state_db::object_space& metadata();
const state_db::object_space& transaction_nonce();
const state_db::object_space& currency_balance();

} // namespace space

namespace key {

std::span< const std::byte > head_time();

} // namespace key

struct genesis_entry
{
  state_db::object_space space;
  std::vector< std::byte > key;
  std::vector< std::byte > value;
};

using genesis_data = std::vector< genesis_entry >;

/**
 * A genesis entry crediting `value` units of native currency to `account`.
 */
genesis_entry currency_allocation( const protocol::account& account, const protocol::amount& value );

struct head
{
  std::uint64_t revision = 0;
  std::uint64_t time     = 0;
};

}} // namespace tessera::controller::state
