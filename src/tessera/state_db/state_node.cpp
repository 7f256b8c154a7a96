#include <tessera/state_db/state_delta.hpp>
#include <tessera/state_db/state_node.hpp>

#include <stdexcept>
#include <utility>

namespace tessera::state_db {

state_node::state_node( std::shared_ptr< state_delta > delta ) noexcept:
    _delta( std::move( delta ) )
{}

state_node::~state_node() = default;

const std::shared_ptr< state_delta >& state_node::delta() const
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  return _delta;
}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return delta()->get( make_compound_key( space, key ) );
}

void state_node::put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value )
{
  delta()->put( make_compound_key( space, key ), value );
}

void state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  delta()->remove( make_compound_key( space, key ) );
}

state_node_ptr state_node::make_child()
{
  return std::make_shared< state_node >( delta()->make_child() );
}

void state_node::squash()
{
  if( delta()->root() )
    throw std::runtime_error( "the head state node cannot be squashed" );

  _delta->squash();
  _delta.reset();
}

bool state_node::valid() const noexcept
{
  return static_cast< bool >( _delta );
}

std::uint64_t state_node::revision() const
{
  return delta()->revision();
}

} // namespace tessera::state_db
