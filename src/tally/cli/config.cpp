#include <tally/cli/config.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace tally::cli {

protocol::amount parse_amount( std::string_view text )
{
  if( text.empty() || !std::ranges::all_of( text, []( char c ) { return c >= '0' && c <= '9'; } ) )
    throw std::runtime_error( "invalid amount '" + std::string( text ) + "'" );

  boost::multiprecision::cpp_int value( std::string( text ).c_str() );
  if( value > boost::multiprecision::cpp_int( std::numeric_limits< protocol::amount >::max() ) )
    throw std::runtime_error( "amount '" + std::string( text ) + "' does not fit in 128 bits" );

  return static_cast< protocol::amount >( value );
}

static std::optional< std::string > optional_text( const YAML::Node& node )
{
  if( node.IsNull() )
    return std::nullopt;

  return node.as< std::string >();
}

controller::genesis_data load_genesis( const YAML::Node& config, address_book& accounts )
{
  if( const auto& aliases = config[ "accounts" ]; aliases )
  {
    for( const auto& entry: aliases )
    {
      auto alias   = entry.first.as< std::string >();
      auto account = protocol::account_from_hex( entry.second.as< std::string >() );
      if( !account )
        throw std::runtime_error( "invalid account for alias '" + alias + "': " + account.error().message() );

      accounts.add( alias, *account );
    }
  }

  const auto& token = config[ "token" ];
  if( !token || !token[ "creator" ] )
    throw std::runtime_error( "configuration requires token.creator" );

  auto genesis = controller::default_genesis( accounts.resolve( token[ "creator" ].as< std::string >() ) );

  if( const auto& name = token[ "name" ]; name )
    genesis.metadata.name = optional_text( name );

  if( const auto& symbol = token[ "symbol" ]; symbol )
    genesis.metadata.symbol = optional_text( symbol );

  if( const auto& decimals = token[ "decimals" ]; decimals )
  {
    auto value = decimals.as< unsigned int >();
    if( value > std::numeric_limits< std::uint8_t >::max() )
      throw std::runtime_error( "token.decimals must fit in a byte" );

    genesis.metadata.decimals = static_cast< std::uint8_t >( value );
  }

  if( const auto& supply = token[ "initial-supply" ]; supply )
    genesis.initial_supply = parse_amount( supply.as< std::string >() );

  return genesis;
}

} // namespace tally::cli
