#include <tessera/controller/call_stack.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tessera::controller {

std::error_code stack_frame::read_stdin( std::span< std::byte > buffer )
{
  if( remaining_stdin() < buffer.size() )
    return reversion_errc::read_out_of_bounds;

  std::ranges::copy( stdin.subspan( stdin_offset, buffer.size() ), buffer.begin() );
  stdin_offset += buffer.size();

  return reversion_errc::ok;
}

std::size_t stack_frame::remaining_stdin() const noexcept
{
  return stdin.size() - stdin_offset;
}

call_stack::call_stack( std::size_t depth_limit ):
    _limit( depth_limit )
{
  _frames.reserve( depth_limit );
}

std::error_code call_stack::push( stack_frame&& f ) noexcept
{
  if( _frames.size() >= _limit )
    return reversion_errc::stack_overflow;

  _frames.emplace_back( std::move( f ) );
  return reversion_errc::ok;
}

stack_frame call_stack::pop()
{
  if( _frames.empty() )
    throw std::runtime_error( "no program is executing" );

  auto frame = std::move( _frames.back() );
  _frames.pop_back();
  return frame;
}

stack_frame& call_stack::current()
{
  if( _frames.empty() )
    throw std::runtime_error( "no program is executing" );

  return _frames.back();
}

const stack_frame& call_stack::current() const
{
  if( _frames.empty() )
    throw std::runtime_error( "no program is executing" );

  return _frames.back();
}

std::size_t call_stack::depth() const noexcept
{
  return _frames.size();
}

bool call_stack::empty() const noexcept
{
  return _frames.empty();
}

} // namespace tessera::controller
