#pragma once

#include <tally/cli/address_book.hpp>
#include <tally/cli/config.hpp>
#include <tally/cli/script.hpp>
