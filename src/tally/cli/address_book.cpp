#include <tally/cli/address_book.hpp>

#include <stdexcept>

namespace tally::cli {

void address_book::add( const std::string& alias, const protocol::account& account )
{
  if( !_accounts.emplace( alias, account ).second )
    throw std::runtime_error( "duplicate account alias '" + alias + "'" );

  _aliases.emplace( account, alias );
}

protocol::account address_book::resolve( std::string_view name ) const
{
  if( auto itr = _accounts.find( std::string( name ) ); itr != _accounts.end() )
    return itr->second;

  auto account = protocol::account_from_hex( name );
  if( !account )
    throw std::runtime_error( "unknown account '" + std::string( name ) + "': " + account.error().message() );

  return *account;
}

std::string address_book::display( const protocol::account& account ) const
{
  if( auto itr = _aliases.find( account ); itr != _aliases.end() )
    return itr->second;

  return protocol::to_hex( account );
}

} // namespace tally::cli
