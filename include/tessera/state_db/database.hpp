#pragma once

#include <tessera/state_db/state_node.hpp>

namespace tessera::state_db {

/**
 * database holds the single head node of the ledger. Every applied
 * transaction is committed as one child of head and moves head to the next
 * revision.
 *
 * database is not thread safe.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open an empty database at revision 0. `genesis` writes the initial
   * objects directly into head.
   */
  void open( const genesis_writer& genesis );
  void close();

  /**
   * Squash `node`, a child of head, into head and advance the head revision.
   */
  void commit( const state_node_ptr& node );

  // Empty if the database is not open
  state_node_ptr head() const;

private:
  state_node_ptr _head;
};

} // namespace tessera::state_db
