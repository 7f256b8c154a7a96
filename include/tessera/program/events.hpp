#pragma once

#include <tessera/memory.hpp>
#include <tessera/program/error.hpp>
#include <tessera/program/role.hpp>
#include <tessera/program/system_interface.hpp>
#include <tessera/protocol.hpp>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::program {

namespace event_name {

constexpr std::string_view transfer                    = "token.transfer";
constexpr std::string_view mint                        = "token.mint";
constexpr std::string_view approval                    = "token.approval";
constexpr std::string_view paused                      = "token.paused";
constexpr std::string_view unpaused                    = "token.unpaused";
constexpr std::string_view role_granted                = "token.role_granted";
constexpr std::string_view role_revoked                = "token.role_revoked";
constexpr std::string_view admin_transfer_proposed     = "token.admin_transfer_proposed";
constexpr std::string_view admin_transfer_accepted     = "token.admin_transfer_accepted";
constexpr std::string_view admin_transfer_canceled     = "token.admin_transfer_canceled";
constexpr std::string_view purchase                    = "exchange.purchase";
constexpr std::string_view sale                        = "exchange.sale";
constexpr std::string_view currency_withdrawal         = "exchange.currency_withdrawal";
constexpr std::string_view token_withdrawal            = "exchange.token_withdrawal";
constexpr std::string_view ownership_transfer_proposed = "exchange.ownership_transfer_proposed";
constexpr std::string_view ownership_transferred       = "exchange.ownership_transferred";
constexpr std::string_view ownership_transfer_canceled = "exchange.ownership_transfer_canceled";

} // namespace event_name

struct transfer_event
{
  protocol::account from{};
  protocol::account to{};
  protocol::amount value = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & to;
    ar & value;
  }
};

struct mint_event
{
  protocol::account to{};
  protocol::amount value = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & to;
    ar & value;
  }
};

struct approval_event
{
  protocol::account owner{};
  protocol::account spender{};
  protocol::amount value = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
    ar & spender;
    ar & value;
  }
};

// Emitted for both pause and unpause
struct pause_event
{
  protocol::account account{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
  }
};

struct role_event
{
  tessera::program::role role = tessera::program::role::minter;
  protocol::account account{};
  protocol::account sender{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & role;
    ar & account;
    ar & sender;
  }
};

struct admin_transfer_event
{
  protocol::account admin{};
  protocol::account candidate{};
  std::uint64_t not_before = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & admin;
    ar & candidate;
    ar & not_before;
  }
};

struct purchase_event
{
  protocol::account buyer{};
  protocol::amount paid         = 0;
  protocol::amount tokens       = 0;
  protocol::amount from_reserve = 0;
  protocol::amount minted       = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & buyer;
    ar & paid;
    ar & tokens;
    ar & from_reserve;
    ar & minted;
  }
};

struct sale_event
{
  protocol::account seller{};
  protocol::amount tokens = 0;
  protocol::amount paid   = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & seller;
    ar & tokens;
    ar & paid;
  }
};

// Emitted for both currency and token withdrawals
struct withdrawal_event
{
  protocol::account to{};
  protocol::amount value = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & to;
    ar & value;
  }
};

struct ownership_event
{
  protocol::account owner{};
  protocol::account candidate{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
    ar & candidate;
  }
};

template< typename Event >
std::vector< std::byte > serialize_event( const Event& e )
{
  std::ostringstream stream;
  {
    boost::archive::binary_oarchive archive( stream, boost::archive::no_header );
    archive << e;
  }

  auto str   = stream.str();
  auto bytes = memory::as_bytes( str );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

template< typename Event >
Event deserialize_event( std::span< const std::byte > data )
{
  std::istringstream stream( std::string( memory::as_string_view( data ) ) );
  boost::archive::binary_iarchive archive( stream, boost::archive::no_header );

  Event e;
  archive >> e;
  return e;
}

template< typename Event >
std::error_code emit( system_interface* system,
                      std::string_view name,
                      const Event& e,
                      const std::vector< protocol::account >& impacted )
{
  return system->event( name, serialize_event( e ), impacted );
}

} // namespace tessera::program
