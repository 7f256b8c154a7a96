#include <tessera/controller/chronicler.hpp>

#include <utility>

namespace tessera::controller {

void chronicler::push_event( protocol::event&& ev )
{
  ev.sequence = static_cast< std::uint32_t >( _events.size() );
  _events.emplace_back( std::move( ev ) );
}

std::size_t chronicler::size() const noexcept
{
  return _events.size();
}

void chronicler::rollback( std::size_t size ) noexcept
{
  if( size < _events.size() )
    _events.resize( size );
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

std::vector< protocol::event > chronicler::release() noexcept
{
  return std::exchange( _events, {} );
}

} // namespace tessera::controller
