#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <tessera/encode.hpp>
#include <tessera/protocol/amount.hpp>

namespace tessera::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

/**
 * A fixed-point quantity rendered in whole units, e.g. 1500000000000000000 -> "1.5".
 */
struct units
{
  protocol::amount value;
  unsigned int decimals = protocol::decimals;
};

} // namespace tessera::log

template<>
struct fmtquill::formatter< tessera::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tessera::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tessera::log::hex >: quill::BinaryDataDeferredFormatCodec< tessera::log::hex >
{};

template<>
struct fmtquill::formatter< tessera::log::units >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::units& u, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", tessera::protocol::format_units( u.value, u.decimals ) );
  }
};

template<>
struct quill::Codec< tessera::log::units >: quill::DeferredFormatCodec< tessera::log::units >
{};
