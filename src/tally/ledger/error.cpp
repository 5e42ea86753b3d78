#include <tally/ledger/error.hpp>

#include <string>
#include <utility>

namespace tally::ledger {

struct _ledger_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _ledger_category::name() const noexcept
{
  return "ledger";
}

std::string _ledger_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< ledger_errc >( condition ) )
  {
    case ledger_errc::ok:
      return "ok"s;
    case ledger_errc::custom:
      return "custom"s;
    case ledger_errc::insufficient_balance:
      return "insufficient balance"s;
    case ledger_errc::insufficient_allowance:
      return "insufficient allowance"s;
    case ledger_errc::zero_recipient_address:
      return "zero recipient address"s;
    case ledger_errc::zero_sender_address:
      return "zero sender address"s;
    case ledger_errc::safe_transfer_check_failed:
      return "safe transfer check failed"s;
  }
  std::unreachable();
}

const std::error_category& ledger_category() noexcept
{
  static _ledger_category category;
  return category;
}

std::error_code make_error_code( ledger_errc e )
{
  return std::error_code( static_cast< int >( e ), ledger_category() );
}

} // namespace tally::ledger
