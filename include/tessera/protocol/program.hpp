#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tessera::protocol {

// What a caller hands a program: instruction bytes on stdin
struct program_input
{
  std::vector< std::string > arguments;
  std::vector< std::byte > stdin;
};

/**
 * What a program hands back. Queries write their answer to stdout, and
 * anything a program wants to explain goes to stderr.
 */
struct program_output
{
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;
};

} // namespace tessera::protocol
