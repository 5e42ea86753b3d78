#pragma once

#include <cstdint>
#include <string>

#include <tally/ledger/ledger.hpp>
#include <tally/program/error.hpp>
#include <tally/program/program.hpp>

namespace tally::program {

/*
 * Routes a host call into the ledger.
 *
 * Input is a little-endian std::uint32_t instruction followed by its
 * arguments, accounts as protocol::account_length raw bytes and amounts as
 * protocol::amount_length little-endian bytes. Query results are written to
 * stdout in the same encoding. Optional strings are prefixed by a presence
 * byte and decimals are written as a single byte.
 */
struct token final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    allowance,
    transfer,
    transfer_from,
    approve,
    increase_allowance,
    decrease_allowance,
    mint,
    burn
  };

  explicit token( ledger::ledger& l );
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

private:
  ledger::ledger& _ledger;
};

} // namespace tally::program
