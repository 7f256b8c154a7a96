#include <tessera/program/error.hpp>

#include <string>
#include <utility>

namespace tessera::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _program_category::name() const noexcept
{
  return "program";
}

std::string _program_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< program_errc >( condition ) )
  {
    case program_errc::ok:
      return "ok"s;
    case program_errc::unauthorized:
      return "unauthorized"s;
    case program_errc::invalid_instruction:
      return "invalid instruction"s;
    case program_errc::insufficient_balance:
      return "insufficient balance"s;
    case program_errc::insufficient_allowance:
      return "insufficient allowance"s;
    case program_errc::insufficient_reserve:
      return "insufficient reserve"s;
    case program_errc::invalid_argument:
      return "invalid argument"s;
    case program_errc::zero_amount:
      return "zero amount"s;
    case program_errc::zero_address:
      return "zero address"s;
    case program_errc::max_supply_reached:
      return "max supply reached"s;
    case program_errc::paused:
      return "paused"s;
    case program_errc::not_paused:
      return "not paused"s;
    case program_errc::too_early:
      return "too early"s;
    case program_errc::no_pending_transfer:
      return "no pending transfer"s;
    case program_errc::reentrant_call:
      return "reentrant call"s;
    case program_errc::unexpected_payload:
      return "unexpected payload"s;
    case program_errc::unexpected_value:
      return "unexpected value"s;
    case program_errc::already_initialized:
      return "already initialized"s;
    case program_errc::overflow:
      return "overflow"s;
  }
  std::unreachable();
}

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace tessera::program
