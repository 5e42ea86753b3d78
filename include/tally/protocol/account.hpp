#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <boost/container_hash/hash.hpp>

namespace tally::protocol {

constexpr std::size_t account_length = 32;

struct account: std::array< std::byte, account_length >
{
  bool zero() const noexcept;
};

using account_view = std::span< const std::byte, account_length >;

account make_account( account_view bytes ) noexcept;

std::expected< account, std::error_code > account_from_hex( std::string_view hex ) noexcept;
std::string to_hex( const account& a ) noexcept;

} // namespace tally::protocol

template<>
struct std::hash< tally::protocol::account >
{
  std::size_t operator()( const tally::protocol::account& a ) const noexcept
  {
    return boost::hash_range( a.begin(), a.end() );
  }
};
