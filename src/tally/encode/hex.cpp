#include <tally/encode/hex.hpp>

#include <cstdint>

namespace tally::encode {

constexpr std::string_view hex_prefix = "0x";
constexpr std::string_view hex_digits = "0123456789abcdef";
constexpr unsigned nibble_bits        = 4;
constexpr std::uint8_t nibble_mask    = 0x0f;

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string text( hex_prefix );
  text.reserve( hex_prefix.size() + 2 * s.size() );

  for( auto b: s )
  {
    const auto value = std::to_integer< std::uint8_t >( b );
    text.push_back( hex_digits[ value >> nibble_bits ] );
    text.push_back( hex_digits[ value & nibble_mask ] );
  }

  return text;
}

static result< std::uint8_t > nibble( char c ) noexcept
{
  constexpr char decimal_digits = 10;

  if( c >= '0' && c <= '9' )
    return static_cast< std::uint8_t >( c - '0' );
  if( c >= 'a' && c <= 'f' )
    return static_cast< std::uint8_t >( c - 'a' + decimal_digits );
  if( c >= 'A' && c <= 'F' )
    return static_cast< std::uint8_t >( c - 'A' + decimal_digits );

  return std::unexpected( encode_errc::invalid_character );
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  // Accept either prefix case
  if( sv.size() >= hex_prefix.size() && sv[ 0 ] == '0' && ( sv[ 1 ] == 'x' || sv[ 1 ] == 'X' ) )
    sv.remove_prefix( hex_prefix.size() );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes( sv.size() / 2 );

  for( std::size_t i = 0; i < bytes.size(); ++i )
  {
    auto high = nibble( sv[ 2 * i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = nibble( sv[ 2 * i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes[ i ] = static_cast< std::byte >( ( *high << nibble_bits ) | *low );
  }

  return bytes;
}

} // namespace tally::encode
