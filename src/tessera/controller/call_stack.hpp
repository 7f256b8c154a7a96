#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <tessera/controller/error.hpp>
#include <tessera/protocol.hpp>

namespace tessera::controller {

/**
 * One program invocation. The frame owns the program's view of its input
 * and collects whatever it writes until the invocation returns.
 */
struct stack_frame final
{
  protocol::account program_id{};
  protocol::account caller{};
  protocol::amount value = 0;
  std::span< const std::string > arguments;
  std::span< const std::byte > stdin;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;

  std::size_t stdin_offset = 0;

  // Consumes exactly buffer.size() bytes of stdin or nothing at all
  std::error_code read_stdin( std::span< std::byte > buffer );
  std::size_t remaining_stdin() const noexcept;
};

class call_stack final
{
public:
  // Deep enough for the exchange calling the token calling back into the exchange
  static constexpr std::size_t default_depth_limit = 32;

  call_stack( std::size_t depth_limit = default_depth_limit );

  std::error_code push( stack_frame&& f ) noexcept;
  stack_frame pop();

  stack_frame& current();
  const stack_frame& current() const;

  std::size_t depth() const noexcept;
  bool empty() const noexcept;

private:
  std::vector< stack_frame > _frames;
  std::size_t _limit;
};

} // namespace tessera::controller
