#pragma once

#include <tally/protocol/account.hpp>
#include <tally/protocol/amount.hpp>
#include <tally/protocol/event.hpp>
#include <tally/protocol/program.hpp>
