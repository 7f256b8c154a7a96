#pragma once

#include <cstdint>
#include <string_view>

#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <tessera/log/formatter.hpp>

namespace tessera::log {

// One transaction logs a handful of lines, so the queue stays small
struct frontend_options
{
  static constexpr quill::QueueType queue_type                    = quill::QueueType::UnboundedDropping;
  static constexpr std::size_t initial_queue_capacity             = 16'384;
  static constexpr std::uint32_t blocking_queue_retry_interval_ns = 800;
  static constexpr std::size_t unbounded_queue_max_capacity       = 64ull * 1'024u * 1'024u;
  static constexpr quill::HugePagesPolicy huge_pages_policy       = quill::HugePagesPolicy::Never;
};

using frontend = quill::FrontendImpl< frontend_options >;
using logger   = quill::LoggerImpl< frontend_options >;

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the root logger level from its name ("trace", "debug", "info", ...).
 * Returns false and leaves the level unchanged if the name is not recognized.
 */
bool set_level( std::string_view level ) noexcept;

} // namespace tessera::log
