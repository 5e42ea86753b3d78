#include <tally/state_db/backends/backend.hpp>

namespace tally::state_db::backends {

bool abstract_backend::empty() const
{
  return size() == 0;
}

} // namespace tally::state_db::backends
