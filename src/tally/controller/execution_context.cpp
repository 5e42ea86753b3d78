#include <tally/controller/execution_context.hpp>

#include <algorithm>

namespace tally::controller {

execution_context::execution_context( const protocol::account& caller, const protocol::program_input& input ):
    _caller( caller ),
    _input( input )
{}

std::span< const std::string > execution_context::arguments()
{
  return _input.arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd != program::file_descriptor::stdout )
    return controller_errc::bad_file_descriptor;

  _output.stdout.insert( _output.stdout.end(), buffer.begin(), buffer.end() );
  return controller_errc::ok;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return controller_errc::bad_file_descriptor;

  if( buffer.size() > remaining_input() )
    return controller_errc::truncated_input;

  auto start = _input.stdin.begin() + static_cast< std::ptrdiff_t >( _input_offset );
  std::ranges::copy( start, start + static_cast< std::ptrdiff_t >( buffer.size() ), buffer.begin() );
  _input_offset += buffer.size();
  return controller_errc::ok;
}

const protocol::account& execution_context::get_caller()
{
  return _caller;
}

std::size_t execution_context::remaining_input() const noexcept
{
  return _input.stdin.size() - _input_offset;
}

protocol::program_output& execution_context::output() noexcept
{
  return _output;
}

} // namespace tally::controller
