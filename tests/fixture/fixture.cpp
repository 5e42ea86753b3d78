// NOLINTBEGIN

#include <test/fixture.hpp>

#include <algorithm>
#include <stdexcept>

#include <tally/log.hpp>

namespace test {

tally::protocol::account make_account( std::string_view seed ) noexcept
{
  tally::protocol::account a{};

  std::size_t length = std::min( seed.length(), a.size() );
  for( std::size_t i = 0; i < length; ++i )
    a.at( i ) = static_cast< std::byte >( seed[ i ] );

  return a;
}

fixture::fixture( const std::string& name, const std::string& log_level ):
    _creator( make_account( "creator" ) )
{
  tally::log::initialize();
  tally::log::set_level( log_level );

  LOG_INFO( tally::log::instance(), "Starting fixture: {}", name );

  _controller = std::make_unique< tally::controller::controller >( tally::controller::default_genesis( _creator ) );
}

tally::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin,
                                                    std::vector< std::string >&& arguments ) const noexcept
{
  tally::protocol::program_input input;
  input.stdin     = std::move( stdin );
  input.arguments = std::move( arguments );
  return input;
}

tally::protocol::amount fixture::query_amount( const tally::protocol::program_input& input ) const
{
  auto output = _controller->call( _creator, input );
  if( !output )
    throw std::runtime_error( "query failed: " + output.error().message() );

  auto value = tally::program::decode_amount( output->stdout );
  if( !value )
    throw std::runtime_error( "query returned a malformed amount" );

  return *value;
}

tally::protocol::amount fixture::balance_of( const tally::protocol::account& owner ) const
{
  return query_amount( make_call( tally::program::token::instruction::balance_of, owner ) );
}

tally::protocol::amount fixture::allowance( const tally::protocol::account& owner,
                                            const tally::protocol::account& spender ) const
{
  return query_amount( make_call( tally::program::token::instruction::allowance, owner, spender ) );
}

tally::protocol::amount fixture::total_supply() const
{
  return query_amount( make_call( tally::program::token::instruction::total_supply ) );
}

} // namespace test

// NOLINTEND
