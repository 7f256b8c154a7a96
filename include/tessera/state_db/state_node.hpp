#pragma once

#include <tessera/memory.hpp>
#include <tessera/state_db/types.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <span>
#include <vector>

namespace tessera::state_db {

// Objects are keyed by their space followed by the program chosen key
inline std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( space ) + key.size() );
  std::ranges::copy( memory::as_bytes( space ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

/**
 * A view of the ledger state. The head node owned by the database holds the
 * committed state. Transactions, operations and program calls each work in a
 * child of the node above them, which is either squashed into its parent or
 * dropped to undo everything written in it.
 */
class state_node final
{
public:
  explicit state_node( std::shared_ptr< state_delta > delta ) noexcept;
  state_node( const state_node& ) = delete;
  state_node( state_node&& )      = delete;
  ~state_node();

  state_node& operator=( const state_node& ) = delete;
  state_node& operator=( state_node&& )      = delete;

  /**
   * The returned span is invalidated by the next write to this node or any
   * of its ancestors.
   */
  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;

  void put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value );
  void remove( const object_space& space, std::span< const std::byte > key );

  state_node_ptr make_child();

  /**
   * Merge every write into the parent node. The node is unusable afterwards
   * and the head node cannot be squashed.
   */
  void squash();

  // False once squashed
  bool valid() const noexcept;

  std::uint64_t revision() const;

private:
  friend class database;

  const std::shared_ptr< state_delta >& delta() const;

  std::shared_ptr< state_delta > _delta;
};

} // namespace tessera::state_db
