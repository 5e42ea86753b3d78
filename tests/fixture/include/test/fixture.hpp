#pragma once

#include <tally/controller.hpp>
#include <tally/program.hpp>
#include <tally/protocol.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace test {

// Deterministic account whose leading bytes spell the seed.
tally::protocol::account make_account( std::string_view seed ) noexcept;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture() = default;

  template< typename... Args >
  tally::protocol::program_input make_call( tally::program::token::instruction i, const Args&... args ) const
  {
    return make_input( tally::program::encode_call( i, args... ) );
  }

  tally::protocol::program_input make_input( std::vector< std::byte >&& stdin,
                                             std::vector< std::string >&& arguments = {} ) const noexcept;

  tally::protocol::amount query_amount( const tally::protocol::program_input& input ) const;

  tally::protocol::amount balance_of( const tally::protocol::account& owner ) const;
  tally::protocol::amount allowance( const tally::protocol::account& owner, const tally::protocol::account& spender ) const;
  tally::protocol::amount total_supply() const;

  std::unique_ptr< tally::controller::controller > _controller;
  tally::protocol::account _creator;
};

} // namespace test
