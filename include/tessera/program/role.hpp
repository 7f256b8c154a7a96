#pragma once

#include <cstdint>

namespace tessera::program {

enum class role : std::uint8_t
{
  admin,
  minter,
  pauser
};

} // namespace tessera::program
