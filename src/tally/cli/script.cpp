#include <tally/cli/script.hpp>

#include <cstdint>
#include <format>
#include <map>
#include <print>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include <boost/algorithm/string.hpp>

#include <tally/cli/config.hpp>
#include <tally/program.hpp>

namespace tally::cli {

namespace {

constexpr char comment_marker = '#';

using program::token;

enum class argument_kind : std::uint8_t
{
  account,
  amount
};

enum class result_kind : std::uint8_t
{
  none,
  amount,
  text,
  decimals
};

struct command
{
  token::instruction id;
  std::vector< argument_kind > arguments;
  result_kind result = result_kind::none;
};

const std::map< std::string, command, std::less<> >& commands()
{
  using enum argument_kind;

  // clang-format off
  static const std::map< std::string, command, std::less<> > table{
    { "name"              , { token::instruction::name              , {}                          , result_kind::text     } },
    { "symbol"            , { token::instruction::symbol            , {}                          , result_kind::text     } },
    { "decimals"          , { token::instruction::decimals          , {}                          , result_kind::decimals } },
    { "total_supply"      , { token::instruction::total_supply      , {}                          , result_kind::amount   } },
    { "balance_of"        , { token::instruction::balance_of        , { account }                 , result_kind::amount   } },
    { "allowance"         , { token::instruction::allowance         , { account, account }        , result_kind::amount   } },
    { "transfer"          , { token::instruction::transfer          , { account, amount }         , result_kind::none     } },
    { "transfer_from"     , { token::instruction::transfer_from     , { account, account, amount }, result_kind::none     } },
    { "approve"           , { token::instruction::approve           , { account, amount }         , result_kind::none     } },
    { "increase_allowance", { token::instruction::increase_allowance, { account, amount }         , result_kind::none     } },
    { "decrease_allowance", { token::instruction::decrease_allowance, { account, amount }         , result_kind::none     } },
    { "mint"              , { token::instruction::mint              , { amount }                  , result_kind::none     } },
    { "burn"              , { token::instruction::burn              , { amount }                  , result_kind::none     } }
  };
  // clang-format on

  return table;
}

std::string describe_result( const protocol::program_output& output, result_kind kind )
{
  switch( kind )
  {
    case result_kind::none:
      return "ok";
    case result_kind::amount:
      {
        auto value = program::decode_amount( output.stdout );
        if( !value )
          throw std::runtime_error( "unexpected call output: " + value.error().message() );

        return value->str();
      }
    case result_kind::text:
      {
        auto text = program::decode_optional_string( output.stdout );
        if( !text )
          throw std::runtime_error( "unexpected call output: " + text.error().message() );

        return text->value_or( "(none)" );
      }
    case result_kind::decimals:
      {
        auto decimals = program::decode_decimals( output.stdout );
        if( !decimals )
          throw std::runtime_error( "unexpected call output: " + decimals.error().message() );

        return std::to_string( *decimals );
      }
  }

  std::unreachable();
}

std::runtime_error line_error( std::size_t line_number, const std::string& what )
{
  return std::runtime_error( "line " + std::to_string( line_number ) + ": " + what );
}

// Returns false when the token rejected the call.
bool run_line( controller::controller& controller,
               const address_book& accounts,
               const std::vector< std::string >& tokens,
               std::size_t line_number,
               std::ostream& out )
{
  if( tokens.size() < 2 )
    throw line_error( line_number, "expected '<caller> <instruction> [args]'" );

  auto itr = commands().find( tokens[ 1 ] );
  if( itr == commands().end() )
    throw line_error( line_number, "unknown instruction '" + tokens[ 1 ] + "'" );

  const auto& cmd = itr->second;
  if( tokens.size() != cmd.arguments.size() + 2 )
    throw line_error( line_number,
                      tokens[ 1 ] + " takes " + std::to_string( cmd.arguments.size() ) + " argument(s)" );

  protocol::program_input call;
  protocol::account caller{};

  try
  {
    caller = accounts.resolve( tokens[ 0 ] );

    program::append( call.stdin, cmd.id );
    for( std::size_t i = 0; i < cmd.arguments.size(); ++i )
    {
      const auto& arg = tokens[ i + 2 ];
      if( cmd.arguments[ i ] == argument_kind::account )
        program::append( call.stdin, accounts.resolve( arg ) );
      else
        program::append( call.stdin, parse_amount( arg ) );
    }
  }
  catch( const std::runtime_error& e )
  {
    throw line_error( line_number, e.what() );
  }

  auto output = controller.call( caller, call );
  if( !output )
  {
    std::println( out, "{}: {} {} failed: {}", line_number, tokens[ 0 ], tokens[ 1 ], output.error().message() );
    return false;
  }

  std::println( out, "{}: {} {} -> {}", line_number, tokens[ 0 ], tokens[ 1 ], describe_result( *output, cmd.result ) );
  for( const auto& ev: output->events )
    std::println( out, "    {}", cli::describe( ev, accounts ) );

  return true;
}

} // namespace

std::string describe( const protocol::event& ev, const address_book& accounts )
{
  if( const auto* transfer = std::get_if< protocol::transfer_event >( &ev.data ) )
  {
    return std::format( "#{} Transfer {} -> {}: {}",
                        ev.sequence,
                        transfer->from ? accounts.display( *transfer->from ) : "(mint)",
                        transfer->to ? accounts.display( *transfer->to ) : "(burn)",
                        transfer->value.str() );
  }

  const auto& approval = std::get< protocol::approval_event >( ev.data );
  return std::format( "#{} Approval {} -> {}: {}",
                      ev.sequence,
                      accounts.display( approval.owner ),
                      accounts.display( approval.spender ),
                      approval.value.str() );
}

std::size_t run_script( controller::controller& controller,
                        const address_book& accounts,
                        std::istream& script,
                        std::ostream& out )
{
  std::size_t rejected    = 0;
  std::size_t line_number = 0;

  for( std::string line; std::getline( script, line ); )
  {
    ++line_number;

    if( auto comment = line.find( comment_marker ); comment != std::string::npos )
      line.erase( comment );

    boost::algorithm::trim( line );
    if( line.empty() )
      continue;

    std::vector< std::string > tokens;
    boost::algorithm::split( tokens, line, boost::algorithm::is_space(), boost::algorithm::token_compress_on );

    if( !run_line( controller, accounts, tokens, line_number, out ) )
      ++rejected;
  }

  return rejected;
}

} // namespace tally::cli
