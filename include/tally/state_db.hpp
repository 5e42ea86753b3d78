#pragma once

#include <tally/state_db/backends/backend.hpp>
#include <tally/state_db/backends/iterator.hpp>
#include <tally/state_db/backends/map/map_backend.hpp>
#include <tally/state_db/types.hpp>
