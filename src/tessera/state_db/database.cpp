#include <tessera/state_db/database.hpp>
#include <tessera/state_db/state_delta.hpp>

#include <stdexcept>

namespace tessera::state_db {

database::database() noexcept = default;

database::~database() = default;

void database::open( const genesis_writer& genesis )
{
  _head = std::make_shared< state_node >( std::make_shared< state_delta >() );

  if( genesis )
    genesis( *_head );
}

void database::close()
{
  _head.reset();
}

void database::commit( const state_node_ptr& node )
{
  if( !_head )
    throw std::runtime_error( "database is not open" );

  if( !node || node->delta()->parent() != _head->delta() )
    throw std::runtime_error( "only a child of head can be committed" );

  node->squash();
  _head->delta()->set_revision( _head->revision() + 1 );
}

state_node_ptr database::head() const
{
  return _head;
}

} // namespace tessera::state_db
