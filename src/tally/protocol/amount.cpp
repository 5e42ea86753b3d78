#include <tally/protocol/amount.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <boost/endian.hpp>

#include <tally/memory.hpp>

namespace tally::protocol {

static constexpr unsigned word_bits = 64;

amount saturating_add( const amount& lhs, const amount& rhs ) noexcept
{
  amount sum = lhs + rhs;
  if( sum < lhs )
    return std::numeric_limits< amount >::max();

  return sum;
}

amount saturating_sub( const amount& lhs, const amount& rhs ) noexcept
{
  if( rhs > lhs )
    return 0;

  return lhs - rhs;
}

amount_bytes to_bytes( const amount& value ) noexcept
{
  static const amount word_mask{ std::numeric_limits< std::uint64_t >::max() };

  auto low  = boost::endian::native_to_little( static_cast< std::uint64_t >( value & word_mask ) );
  auto high = boost::endian::native_to_little( static_cast< std::uint64_t >( value >> word_bits ) );

  amount_bytes bytes{};
  std::ranges::copy( memory::as_bytes( low ), bytes.begin() );
  std::ranges::copy( memory::as_bytes( high ), bytes.begin() + sizeof( std::uint64_t ) );
  return bytes;
}

amount from_bytes( std::span< const std::byte > bytes )
{
  if( bytes.size() != amount_length )
    throw std::runtime_error( "unexpected amount length" );

  auto low  = boost::endian::little_to_native( memory::bit_cast< std::uint64_t >( bytes.first( sizeof( std::uint64_t ) ) ) );
  auto high = boost::endian::little_to_native( memory::bit_cast< std::uint64_t >( bytes.last( sizeof( std::uint64_t ) ) ) );

  return ( amount( high ) << word_bits ) | amount( low );
}

} // namespace tally::protocol
