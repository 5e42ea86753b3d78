#pragma once

#include <expected>
#include <system_error>

namespace tally::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  custom,
  insufficient_balance,
  insufficient_allowance,
  zero_recipient_address,
  zero_sender_address,
  safe_transfer_check_failed
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tally::ledger

template<>
struct std::is_error_code_enum< tally::ledger::ledger_errc >: public std::true_type
{};
