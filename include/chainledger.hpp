#pragma once

#include "chainledger/chainledger.hpp"
