#pragma once

#include <tessera/controller/controller.hpp>
#include <tessera/controller/error.hpp>
#include <tessera/controller/state.hpp>
