#pragma once

#include "appender.hpp"
#include "canonical.hpp"
#include "hasher.hpp"
#include "record.hpp"
#include "scope.hpp"
#include "scope_lock.hpp"
#include "types.hpp"
#include "verifier.hpp"

namespace chainledger::ledger {
    // Aggregates ledger headers under chainledger::ledger
}
