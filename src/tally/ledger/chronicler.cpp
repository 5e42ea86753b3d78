#include <tally/ledger/chronicler.hpp>

#include <utility>

namespace tally::ledger {

void chronicler::push_event( protocol::event_data&& ev )
{
  _events.emplace_back( protocol::event{ .sequence = _seq_no, .data = std::move( ev ) } );
  _seq_no++;
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

std::vector< protocol::event > chronicler::release()
{
  return std::exchange( _events, {} );
}

std::uint32_t chronicler::sequence() const noexcept
{
  return _seq_no;
}

} // namespace tally::ledger
