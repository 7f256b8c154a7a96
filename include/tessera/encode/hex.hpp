#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tessera/encode/error.hpp>

namespace tessera::encode {

/**
 * Lowercase hex with a "0x" prefix. Used to render accounts and object keys
 * in logs and by the node to accept raw account references.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

// Accepts an optional "0x" or "0X" prefix and either case
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace tessera::encode
