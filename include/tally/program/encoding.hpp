#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <tally/program/error.hpp>
#include <tally/program/token.hpp>
#include <tally/protocol/account.hpp>
#include <tally/protocol/amount.hpp>

namespace tally::program {

void append( std::vector< std::byte >& input, token::instruction i );
void append( std::vector< std::byte >& input, const protocol::account& account );
void append( std::vector< std::byte >& input, const protocol::amount& value );

// Builds the stdin of a token call.
template< typename... Args >
std::vector< std::byte > encode_call( token::instruction i, const Args&... args )
{
  std::vector< std::byte > input;
  append( input, i );
  ( append( input, args ), ... );
  return input;
}

result< protocol::amount > decode_amount( std::span< const std::byte > output );
result< std::optional< std::string > > decode_optional_string( std::span< const std::byte > output );
result< std::uint8_t > decode_decimals( std::span< const std::byte > output );

} // namespace tally::program
