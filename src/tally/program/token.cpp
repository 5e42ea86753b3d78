#include <tally/program/token.hpp>

#include <boost/endian.hpp>

#include <tally/memory.hpp>
#include <tally/protocol.hpp>

#include <utility>

namespace tally::program {

static std::error_code read_account( system_interface* system, protocol::account& account )
{
  return system->read( file_descriptor::stdin, memory::as_writable_bytes( account ) );
}

static std::error_code read_amount( system_interface* system, protocol::amount& value )
{
  protocol::amount_bytes bytes{};
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( bytes ) ); error )
    return error;

  value = protocol::from_bytes( bytes );
  return {};
}

static std::error_code write_amount( system_interface* system, const protocol::amount& value )
{
  return system->write( file_descriptor::stdout, memory::as_bytes( protocol::to_bytes( value ) ) );
}

static std::error_code write_optional_string( system_interface* system, const std::optional< std::string >& str )
{
  const std::uint8_t present = str.has_value() ? 1 : 0;
  if( auto error = system->write( file_descriptor::stdout, memory::as_bytes( present ) ); error )
    return error;

  if( !str )
    return {};

  return system->write( file_descriptor::stdout, memory::as_bytes( *str ) );
}

static std::error_code to_error_code( const ledger::result< void >& result )
{
  if( !result )
    return result.error();

  return {};
}

token::token( ledger::ledger& l ):
    _ledger( l )
{}

std::error_code token::run( system_interface* system, const std::span< const std::string > arguments )
{
  if( !arguments.empty() )
    return program_errc::invalid_argument;

  std::uint32_t instruction = 0;
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( instruction ) ); error )
    return error;

  boost::endian::little_to_native_inplace( instruction );

  const auto& caller = system->get_caller();

  switch( instruction )
  {
    case std::to_underlying( instruction::name ):
      return write_optional_string( system, _ledger.token_name() );
    case std::to_underlying( instruction::symbol ):
      return write_optional_string( system, _ledger.token_symbol() );
    case std::to_underlying( instruction::decimals ):
      {
        auto decimals = _ledger.token_decimals();
        return system->write( file_descriptor::stdout, memory::as_bytes( decimals ) );
      }
    case std::to_underlying( instruction::total_supply ):
      return write_amount( system, _ledger.total_supply() );
    case std::to_underlying( instruction::balance_of ):
      {
        protocol::account owner{};
        if( auto error = read_account( system, owner ); error )
          return error;

        return write_amount( system, _ledger.balance_of( owner ) );
      }
    case std::to_underlying( instruction::allowance ):
      {
        protocol::account owner{};
        protocol::account spender{};

        if( auto error = read_account( system, owner ); error )
          return error;

        if( auto error = read_account( system, spender ); error )
          return error;

        return write_amount( system, _ledger.allowance( owner, spender ) );
      }
    case std::to_underlying( instruction::transfer ):
      {
        protocol::account to{};
        protocol::amount value = 0;

        if( auto error = read_account( system, to ); error )
          return error;

        if( auto error = read_amount( system, value ); error )
          return error;

        return to_error_code( _ledger.transfer( caller, to, value ) );
      }
    case std::to_underlying( instruction::transfer_from ):
      {
        protocol::account from{};
        protocol::account to{};
        protocol::amount value = 0;

        if( auto error = read_account( system, from ); error )
          return error;

        if( auto error = read_account( system, to ); error )
          return error;

        if( auto error = read_amount( system, value ); error )
          return error;

        return to_error_code( _ledger.transfer_from( caller, from, to, value ) );
      }
    case std::to_underlying( instruction::approve ):
    case std::to_underlying( instruction::increase_allowance ):
    case std::to_underlying( instruction::decrease_allowance ):
      {
        protocol::account spender{};
        protocol::amount value = 0;

        if( auto error = read_account( system, spender ); error )
          return error;

        if( auto error = read_amount( system, value ); error )
          return error;

        if( instruction == std::to_underlying( instruction::approve ) )
          return to_error_code( _ledger.approve( caller, spender, value ) );
        else if( instruction == std::to_underlying( instruction::increase_allowance ) )
          return to_error_code( _ledger.increase_allowance( caller, spender, value ) );

        return to_error_code( _ledger.decrease_allowance( caller, spender, value ) );
      }
    case std::to_underlying( instruction::mint ):
    case std::to_underlying( instruction::burn ):
      {
        protocol::amount value = 0;
        if( auto error = read_amount( system, value ); error )
          return error;

        if( instruction == std::to_underlying( instruction::mint ) )
          return to_error_code( _ledger.mint( caller, value ) );

        return to_error_code( _ledger.burn( caller, value ) );
      }
    default:
      return program_errc::invalid_instruction;
  }
}

} // namespace tally::program
