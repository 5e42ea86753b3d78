#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include <tally/protocol/account.hpp>
#include <tally/protocol/amount.hpp>

namespace tally::protocol {

// An absent source is a mint, an absent destination is a burn.
struct transfer_event
{
  std::optional< account > from;
  std::optional< account > to;
  amount value = 0;

  bool operator==( const transfer_event& ) const = default;
};

struct approval_event
{
  account owner{};
  account spender{};
  amount value = 0;

  bool operator==( const approval_event& ) const = default;
};

using event_data = std::variant< transfer_event, approval_event >;

struct event
{
  std::uint32_t sequence = 0;
  event_data data;
};

} // namespace tally::protocol
