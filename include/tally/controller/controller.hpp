#pragma once

#include <tally/controller/error.hpp>
#include <tally/ledger.hpp>
#include <tally/program.hpp>
#include <tally/protocol.hpp>

#include <memory>
#include <vector>

namespace tally::controller {

struct genesis_data
{
  protocol::account creator{};
  protocol::amount initial_supply = 0;
  ledger::token_metadata metadata;
};

// 1 000 000 MyToken (MTK) with 18 decimals.
genesis_data default_genesis( const protocol::account& creator );

class controller
{
public:
  explicit controller( const genesis_data& data );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller()                   = default;

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /*
   * Runs one token call on behalf of caller. On success the output carries
   * whatever the call wrote to stdout and the events it emitted. A failed
   * call has changed nothing.
   */
  result< protocol::program_output > call( const protocol::account& caller, const protocol::program_input& input );

  const ledger::ledger& state() const noexcept;
  const std::vector< protocol::event >& genesis_events() const noexcept;

private:
  ledger::chronicler _chronicler;
  std::unique_ptr< ledger::ledger > _ledger;
  std::unique_ptr< program::token > _token;
  std::vector< protocol::event > _genesis_events;
};

} // namespace tally::controller
