#pragma once

#include <tessera/program/codec.hpp>
#include <tessera/program/error.hpp>
#include <tessera/program/events.hpp>
#include <tessera/program/exchange.hpp>
#include <tessera/program/permission_store.hpp>
#include <tessera/program/program.hpp>
#include <tessera/program/reentrancy_guard.hpp>
#include <tessera/program/role.hpp>
#include <tessera/program/system_interface.hpp>
#include <tessera/program/token.hpp>
