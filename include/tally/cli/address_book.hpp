#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include <tally/protocol/account.hpp>

namespace tally::cli {

/*
 * Maps human readable aliases to accounts and back. Names that are not a
 * known alias are parsed as hex accounts.
 */
class address_book
{
public:
  void add( const std::string& alias, const protocol::account& account );

  protocol::account resolve( std::string_view name ) const;
  std::string display( const protocol::account& account ) const;

private:
  std::unordered_map< std::string, protocol::account > _accounts;
  std::unordered_map< protocol::account, std::string > _aliases;
};

} // namespace tally::cli
