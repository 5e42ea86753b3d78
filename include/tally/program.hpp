#pragma once

#include <tally/program/encoding.hpp>
#include <tally/program/error.hpp>
#include <tally/program/program.hpp>
#include <tally/program/system_interface.hpp>
#include <tally/program/token.hpp>
