#pragma once

#include <tally/ledger/chronicler.hpp>
#include <tally/ledger/error.hpp>
#include <tally/ledger/ledger.hpp>
