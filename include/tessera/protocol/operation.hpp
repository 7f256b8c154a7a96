#pragma once

#include <concepts>
#include <string>
#include <variant>

#include <tessera/protocol/account.hpp>
#include <tessera/protocol/amount.hpp>
#include <tessera/protocol/program.hpp>

namespace tessera::protocol {

/**
 * Binds a program account to a registered native program kind and runs the
 * program's constructor with `input`.
 */
struct deploy_program
{
  account id{};
  std::string kind;
  program_input input;

  bool validate() const noexcept;
};

/**
 * Calls a program, attaching `value` units of native currency. An empty
 * stdin is a bare currency transfer to the program.
 */
struct call_program
{
  account id{};
  program_input input;
  amount value = 0;

  bool validate() const noexcept;
};

struct transfer_currency
{
  account to{};
  amount value = 0;

  bool validate() const noexcept;
};

using operation = std::variant< deploy_program, call_program, transfer_currency >;

} // namespace tessera::protocol

template< typename T >
concept Operation = std::same_as< tessera::protocol::operation, T >;
