#pragma once

#include <concepts>
#include <cstdint>
#include <system_error>
#include <vector>

#include <tessera/protocol/account.hpp>
#include <tessera/protocol/event.hpp>
#include <tessera/protocol/operation.hpp>

namespace tessera::protocol {

/**
 * A batch of operations applied atomically on behalf of `payer`, the only
 * account whose authority the transaction carries. `nonce` must be exactly
 * one past the payer's last accepted nonce.
 */
struct transaction
{
  account payer{};
  std::uint64_t nonce = 0;
  std::vector< operation > operations;

  bool validate() const noexcept;
};

// A reverted transaction still consumes its nonce but keeps no events
struct transaction_receipt
{
  account payer{};
  std::uint64_t nonce = 0;
  std::uint64_t time  = 0;
  bool reverted       = false;
  std::error_code error;
  std::vector< event > events;
};

} // namespace tessera::protocol

template< typename T >
concept Transaction = std::same_as< tessera::protocol::transaction, T >;
