#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <print>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <tally/cli.hpp>
#include <tally/controller.hpp>
#include <tally/log.hpp>

namespace constants {

constexpr auto log_level_default = "info";

} // namespace constants

auto main( int argc, char** argv ) -> int
{
  tally::log::initialize();

  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( "help,h"     , "Print this help message and exit" )
    ( "version,v"  , "Print version string and exit" )
    ( "config,c"   , boost::program_options::value< std::string >(), "The token configuration file (YAML)" )
    ( "script,s"   , boost::program_options::value< std::string >(), "The script of token calls to run (default: stdin)" )
    ( "log-level,l", boost::program_options::value< std::string >()->default_value( constants::log_level_default ), "The log filtering level" );
  // clang-format on

  try
  {
    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::println( "tally v{}", TALLY_VERSION );
      return EXIT_SUCCESS;
    }

    tally::log::set_level( args[ "log-level" ].as< std::string >() );

    if( !args.count( "config" ) )
    {
      LOG_ERROR( tally::log::instance(), "A configuration file is required" );
      return EXIT_FAILURE;
    }

    const std::filesystem::path config_file = args[ "config" ].as< std::string >();
    if( !std::filesystem::exists( config_file ) )
    {
      LOG_ERROR( tally::log::instance(), "Unable to locate configuration file at {}", config_file.string() );
      return EXIT_FAILURE;
    }

    LOG_INFO( tally::log::instance(), "Loading configuration: {}", config_file.string() );

    tally::cli::address_book accounts;
    auto genesis = tally::cli::load_genesis( YAML::LoadFile( config_file.string() ), accounts );

    tally::controller::controller controller( genesis );
    for( const auto& ev: controller.genesis_events() )
      std::println( "genesis: {}", tally::cli::describe( ev, accounts ) );

    std::size_t rejected = 0;
    if( args.count( "script" ) )
    {
      const auto script_file = args[ "script" ].as< std::string >();
      std::ifstream script( script_file );
      if( !script )
      {
        LOG_ERROR( tally::log::instance(), "Unable to open script {}", script_file );
        return EXIT_FAILURE;
      }

      LOG_INFO( tally::log::instance(), "Running script: {}", script_file );
      rejected = tally::cli::run_script( controller, accounts, script, std::cout );
    }
    else
    {
      LOG_INFO( tally::log::instance(), "Reading calls from stdin" );
      rejected = tally::cli::run_script( controller, accounts, std::cin, std::cout );
    }

    const auto& state = controller.state();
    std::println( "total supply: {}", state.total_supply().str() );
    for( const auto& [ owner, balance ]: state.balances() )
      std::println( "  {}: {}", accounts.display( owner ), balance.str() );

    LOG_INFO( tally::log::instance(), "Script complete - Rejected calls: {}", rejected );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( tally::log::instance(), "Invalid configuration: {}", e.what() );
    return EXIT_FAILURE;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( tally::log::instance(), "{}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
