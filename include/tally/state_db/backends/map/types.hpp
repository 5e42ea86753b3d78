#pragma once

#include <tally/state_db/types.hpp>

#include <map>

namespace tally::state_db::backends::map {

using map_type      = std::map< bytes, bytes >;
using iterator_type = map_type::const_iterator;

} // namespace tally::state_db::backends::map
