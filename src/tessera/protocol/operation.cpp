#include <tessera/protocol/operation.hpp>

namespace tessera::protocol {

bool deploy_program::validate() const noexcept
{
  return id.program() && !kind.empty();
}

bool call_program::validate() const noexcept
{
  return id.program();
}

bool transfer_currency::validate() const noexcept
{
  return !to.null() && to.type() != account_type::invalid && value > 0;
}

} // namespace tessera::protocol
