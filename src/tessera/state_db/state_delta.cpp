#include <tessera/state_db/state_delta.hpp>

#include <stdexcept>

namespace tessera::state_db {

state_delta::state_delta() noexcept = default;

void state_delta::put( std::vector< std::byte >&& key, std::span< const std::byte > value )
{
  _removed_objects.erase( key );
  _objects.insert_or_assign( std::move( key ), std::vector< std::byte >( value.begin(), value.end() ) );
}

void state_delta::remove( std::vector< std::byte >&& key )
{
  bool existed = _objects.erase( key ) > 0;

  // The root owns the full state, a removal there needs no record
  if( root() )
    return;

  if( existed || _parent->get( key ) )
    _removed_objects.emplace( std::move( key ) );
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* node = this; node != nullptr; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto itr = node->_objects.find( key ); itr != node->_objects.end() )
      return std::span< const std::byte >( itr->second );
  }

  return {};
}

void state_delta::squash()
{
  if( !_parent )
    throw std::runtime_error( "cannot squash a state delta with no parent" );

  auto& parent = *_parent;

  // A removal here hides the parent's object, unless the parent is the root
  // where the object can simply be dropped
  while( !_removed_objects.empty() )
  {
    auto removed = _removed_objects.extract( _removed_objects.begin() );
    parent._objects.erase( removed.value() );

    if( !parent.root() )
      parent._removed_objects.insert( std::move( removed ) );
  }

  while( !_objects.empty() )
  {
    auto object = _objects.extract( _objects.begin() );

    if( !parent.root() )
      parent._removed_objects.erase( object.key() );

    parent._objects.insert_or_assign( std::move( object.key() ), std::move( object.mapped() ) );
  }
}

void state_delta::clear()
{
  _objects.clear();
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

std::uint64_t state_delta::revision() const
{
  return _revision;
}

void state_delta::set_revision( std::uint64_t revision )
{
  _revision = revision;
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  auto child       = std::make_shared< state_delta >();
  child->_parent   = shared_from_this();
  child->_revision = _revision + 1;
  return child;
}

} // namespace tessera::state_db
