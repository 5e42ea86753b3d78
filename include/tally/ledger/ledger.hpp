#pragma once

#include <tally/ledger/chronicler.hpp>
#include <tally/ledger/error.hpp>
#include <tally/protocol/account.hpp>
#include <tally/protocol/amount.hpp>
#include <tally/state_db/backends/backend.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tally::ledger {

struct token_metadata
{
  std::optional< std::string > name;
  std::optional< std::string > symbol;
  std::uint8_t decimals = 0;
};

/*
 * Fungible token ledger.
 *
 * Holds the total supply, the owner to balance mapping and the
 * (owner, spender) to allowance mapping. Every mutating operation either
 * commits all of its writes and records its events with the chronicler, or
 * fails before its first write. Absent balances and allowances are zero and
 * zero values are never stored.
 */
class ledger final
{
public:
  ledger( const protocol::account& creator,
          const protocol::amount& initial_supply,
          token_metadata metadata,
          chronicler& events,
          std::unique_ptr< state_db::backends::abstract_backend > backend );
  ledger( const protocol::account& creator,
          const protocol::amount& initial_supply,
          token_metadata metadata,
          chronicler& events );
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  protocol::amount total_supply() const;
  protocol::amount balance_of( const protocol::account& owner ) const;
  protocol::amount allowance( const protocol::account& owner, const protocol::account& spender ) const;

  // Every account holding a non-zero balance, ordered by account.
  std::vector< std::pair< protocol::account, protocol::amount > > balances() const;

  result< void > transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value );

  result< void > transfer_from( const protocol::account& caller,
                                const protocol::account& from,
                                const protocol::account& to,
                                const protocol::amount& value );

  // Overwrites, never accumulates.
  result< void >
  approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value );

  result< void > increase_allowance( const protocol::account& caller,
                                     const protocol::account& spender,
                                     const protocol::amount& delta );

  result< void > decrease_allowance( const protocol::account& caller,
                                     const protocol::account& spender,
                                     const protocol::amount& delta );

  // Open to any caller.
  result< void > mint( const protocol::account& caller, const protocol::amount& value );
  result< void > burn( const protocol::account& caller, const protocol::amount& value );

  const std::optional< std::string >& token_name() const noexcept;
  const std::optional< std::string >& token_symbol() const noexcept;
  std::uint8_t token_decimals() const noexcept;

  const state_db::backends::abstract_backend& backend() const noexcept;

private:
  result< void > move_balance( const protocol::account& from, const protocol::account& to, const protocol::amount& value );

  protocol::amount read( const state_db::bytes& key ) const;
  void write( state_db::bytes&& key, const protocol::amount& value );

  token_metadata _metadata;
  chronicler& _chronicler;
  std::unique_ptr< state_db::backends::abstract_backend > _backend;
};

} // namespace tally::ledger
