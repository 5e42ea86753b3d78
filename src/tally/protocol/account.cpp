#include <tally/protocol/account.hpp>

#include <algorithm>

#include <tally/encode.hpp>

namespace tally::protocol {

bool account::zero() const noexcept
{
  return std::ranges::all_of( *this, []( std::byte b ) { return b == std::byte{ 0x00 }; } );
}

account make_account( account_view bytes ) noexcept
{
  account a{};
  std::ranges::copy( bytes, a.begin() );
  return a;
}

std::expected< account, std::error_code > account_from_hex( std::string_view hex ) noexcept
{
  auto bytes = encode::from_hex( hex );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != account_length )
    return std::unexpected( encode::encode_errc::invalid_length );

  return make_account( account_view( bytes->data(), account_length ) );
}

std::string to_hex( const account& a ) noexcept
{
  return encode::to_hex( a );
}

} // namespace tally::protocol
