#pragma once

#include <tally/encode/error.hpp>
#include <tally/encode/hex.hpp>
