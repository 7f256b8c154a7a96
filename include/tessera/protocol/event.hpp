#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <tessera/protocol/account.hpp>

namespace tessera::protocol {

/**
 * A notification emitted by a program while a transaction runs.
 *
 * `sequence` orders the events of one transaction across every program it
 * touched. `data` holds the event structure serialized with its `name`
 * (see program/events.hpp) and `impacted` lists the accounts whose balances
 * or permissions it concerns. Events of a reverted transaction are dropped.
 */
struct event
{
  std::uint32_t sequence = 0;
  account source{};
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;
};

} // namespace tessera::protocol
