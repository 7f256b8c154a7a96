#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <boost/serialization/array_wrapper.hpp>

#include <tessera/encode/error.hpp>
#include <tessera/memory.hpp>

namespace tessera::protocol {

constexpr std::size_t account_length = 32;

enum class account_type : std::uint8_t
{
  invalid = 0x00,
  user    = 0x01,
  program = 0x02
};

/**
 * A principal. The first byte encodes the account type, the remaining bytes
 * identify the principal. The all-zero account is the null principal.
 */
struct account: std::array< std::byte, account_length >
{
  bool null() const noexcept;
  bool user() const noexcept;
  bool program() const noexcept;
  account_type type() const noexcept;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & boost::serialization::make_array( memory::pointer_cast< std::uint8_t* >( data() ), size() );
  }
};

struct account_view: std::span< const std::byte, account_length >
{
  account_view( const account& ) noexcept;
  account_view( const std::byte*, std::size_t ) noexcept;

  bool null() const noexcept;
  bool user() const noexcept;
  bool program() const noexcept;
  account_type type() const noexcept;

  account to_account() const noexcept;
};

constexpr account null_account{};

account user_account( std::string_view name ) noexcept;
account user_account( const account& ) noexcept;

account program_account( std::string_view name ) noexcept;
account program_account( const account& ) noexcept;

/**
 * Parses an account written as its 32 bytes in hex, e.g. "0x02746f6b656e...".
 * The null account and unknown type prefixes are rejected.
 */
encode::result< account > account_from_hex( std::string_view hex ) noexcept;

} // namespace tessera::protocol
