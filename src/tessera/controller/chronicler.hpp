#pragma once

#include <tessera/protocol.hpp>

#include <cstddef>
#include <vector>

namespace tessera::controller {

/**
 * Collects the events of a transaction in emission order. A failing program
 * call rolls the log back to the size it had when the call started.
 */
class chronicler final
{
public:
  void push_event( protocol::event&& ev );
  std::size_t size() const noexcept;
  void rollback( std::size_t size ) noexcept;
  const std::vector< protocol::event >& events() const noexcept;
  std::vector< protocol::event > release() noexcept;

private:
  std::vector< protocol::event > _events;
};

} // namespace tessera::controller
