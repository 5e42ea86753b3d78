#pragma once

#include <tally/protocol/event.hpp>

#include <cstdint>
#include <vector>

namespace tally::ledger {

class chronicler final
{
public:
  void push_event( protocol::event_data&& ev );
  const std::vector< protocol::event >& events() const noexcept;

  // Hands over every buffered event. Sequence numbering continues.
  std::vector< protocol::event > release();

  std::uint32_t sequence() const noexcept;

private:
  std::vector< protocol::event > _events;
  std::uint32_t _seq_no = 0;
};

} // namespace tally::ledger
