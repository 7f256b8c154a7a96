#pragma once

#include <tessera/state_db/database.hpp>
#include <tessera/state_db/state_node.hpp>
#include <tessera/state_db/types.hpp>
