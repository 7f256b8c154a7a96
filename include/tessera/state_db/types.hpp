#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace tessera::state_db {

class state_node;
class state_delta;

constexpr std::size_t object_space_padding_size = 3;
constexpr std::size_t address_size              = 32;

/**
 * An object space partitions the key space of the database. System spaces
 * belong to the controller, all other spaces belong to the program whose
 * account is stored in `address`.
 */
struct object_space
{
  bool system = false;
  std::array< std::uint8_t, object_space_padding_size > padding{};
  std::array< std::byte, address_size > address{};
  std::uint32_t id = 0;
};

// The space is copied into every key, so it must not carry indeterminate bytes
static_assert( sizeof( object_space ) == 1 + object_space_padding_size + address_size + sizeof( std::uint32_t ) );

using state_node_ptr = std::shared_ptr< state_node >;
using genesis_writer = std::function< void( state_node& ) >;

} // namespace tessera::state_db
