#include <tally/program/encoding.hpp>

#include <boost/endian.hpp>

#include <tally/memory.hpp>

#include <utility>

namespace tally::program {

void append( std::vector< std::byte >& input, token::instruction i )
{
  auto value = boost::endian::native_to_little( std::to_underlying( i ) );
  const auto bytes = memory::as_bytes( value );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

void append( std::vector< std::byte >& input, const protocol::account& account )
{
  input.insert( input.end(), account.begin(), account.end() );
}

void append( std::vector< std::byte >& input, const protocol::amount& value )
{
  const auto bytes = protocol::to_bytes( value );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

result< protocol::amount > decode_amount( std::span< const std::byte > output )
{
  if( output.size() != protocol::amount_length )
    return std::unexpected( program_errc::malformed_output );

  return protocol::from_bytes( output );
}

result< std::optional< std::string > > decode_optional_string( std::span< const std::byte > output )
{
  if( output.empty() )
    return std::unexpected( program_errc::malformed_output );

  switch( std::to_integer< std::uint8_t >( output.front() ) )
  {
    case 0:
      if( output.size() != 1 )
        return std::unexpected( program_errc::malformed_output );

      return std::optional< std::string >{};
    case 1:
      {
        auto text = output.subspan( 1 );
        return std::optional< std::string >(
          std::in_place,
          memory::pointer_cast< const char* >( text.data() ),
          text.size() );
      }
    default:
      return std::unexpected( program_errc::malformed_output );
  }
}

result< std::uint8_t > decode_decimals( std::span< const std::byte > output )
{
  if( output.size() != sizeof( std::uint8_t ) )
    return std::unexpected( program_errc::malformed_output );

  return std::to_integer< std::uint8_t >( output.front() );
}

} // namespace tally::program
