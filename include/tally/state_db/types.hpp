#pragma once

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace tally::state_db {

using bytes     = std::vector< std::byte >;
using key_value = std::pair< const bytes, bytes >;

} // namespace tally::state_db
