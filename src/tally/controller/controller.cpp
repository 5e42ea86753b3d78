#include <tally/controller/controller.hpp>
#include <tally/controller/execution_context.hpp>

#include <tally/log.hpp>

#include <stdexcept>

namespace tally::controller {

genesis_data default_genesis( const protocol::account& creator )
{
  static constexpr std::uint64_t default_supply   = 1'000'000;
  static constexpr std::uint8_t default_decimals = 18;

  return genesis_data{
    .creator        = creator,
    .initial_supply = default_supply,
    .metadata       = ledger::token_metadata{ .name = "MyToken", .symbol = "MTK", .decimals = default_decimals }
  };
}

controller::controller( const genesis_data& data )
{
  _ledger = std::make_unique< ledger::ledger >( data.creator, data.initial_supply, data.metadata, _chronicler );
  _token  = std::make_unique< program::token >( *_ledger );
  _genesis_events = _chronicler.release();

  LOG_INFO( tally::log::instance(),
            "Created ledger - Supply: {}, Creator: {}, Decimals: {}",
            data.initial_supply,
            data.creator,
            data.metadata.decimals );
}

result< protocol::program_output > controller::call( const protocol::account& caller,
                                                     const protocol::program_input& input )
{
  execution_context context( caller, input );

  LOG_DEBUG( tally::log::instance(), "Calling token - Caller: {}, Input: {} bytes", caller, input.stdin.size() );

  if( auto error = _token->run( &context, input.arguments ); error )
  {
    // Nothing may have been recorded by a failed call
    if( !_chronicler.events().empty() )
      throw std::runtime_error( "failed call emitted events" );

    LOG_WARNING( tally::log::instance(), "Call from {} failed: {}", caller, error.message() );
    return std::unexpected( error );
  }

  auto& output  = context.output();
  output.events = _chronicler.release();

  LOG_DEBUG( tally::log::instance(), "Call from {} emitted {} event(s)", caller, output.events.size() );

  return std::move( output );
}

const ledger::ledger& controller::state() const noexcept
{
  return *_ledger;
}

const std::vector< protocol::event >& controller::genesis_events() const noexcept
{
  return _genesis_events;
}

} // namespace tally::controller
