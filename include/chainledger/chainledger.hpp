#pragma once

// High-level chainledger facade
// Composes ledger and storage modules

#include "chainledger/common/error.hpp"
#include "chainledger/ledger/ledger.hpp"
#include "chainledger/storage/ledger_store.hpp"
#include "chainledger/storage/sqlite_store.hpp"
