#pragma once

#include <tessera/protocol/account.hpp>
#include <tessera/protocol/amount.hpp>
#include <tessera/protocol/event.hpp>
#include <tessera/protocol/operation.hpp>
#include <tessera/protocol/program.hpp>
#include <tessera/protocol/transaction.hpp>
