#pragma once

#include <tessera/encode/error.hpp>
#include <tessera/encode/hex.hpp>
