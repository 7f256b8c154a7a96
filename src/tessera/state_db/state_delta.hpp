#pragma once

#include <tessera/state_db/types.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace tessera::state_db {

/**
 * A state_delta records the writes and removals made on top of its parent.
 * A delta without a parent is the root and owns the full state.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
public:
  state_delta() noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  void put( std::vector< std::byte >&& key, std::span< const std::byte > value );
  void remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  /**
   * Merges this delta into its parent. The delta is empty afterwards.
   */
  void squash();
  void clear();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

  const std::shared_ptr< state_delta >& parent() const;

  std::shared_ptr< state_delta > make_child();

private:
  using object_map = std::map< std::vector< std::byte >, std::vector< std::byte > >;

  std::shared_ptr< state_delta > _parent;
  object_map _objects;
  std::set< std::vector< std::byte > > _removed_objects;
  std::uint64_t _revision = 0;
};

} // namespace tessera::state_db
