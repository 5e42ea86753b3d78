#pragma once

#include <cstring>
#include <memory>
#include <ranges>
#include <span>
#include <stdexcept>
#include <type_traits>

namespace tally::memory {

template< typename T >
concept trivially_copyable = std::is_trivially_copyable_v< T >;

template< typename R >
concept byte_viewable_range = std::ranges::contiguous_range< R > && std::ranges::sized_range< R >
                              && trivially_copyable< std::ranges::range_value_t< R > >;

template< typename T, typename U >
  requires( std::is_pointer_v< T > && trivially_copyable< std::remove_pointer_t< T > > )
T pointer_cast( U* p )
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

// Reads a T from the front of bytes.
template< trivially_copyable T >
  requires( !std::is_pointer_v< T > )
inline T bit_cast( std::span< const std::byte > bytes )
{
  if( bytes.size() < sizeof( T ) )
    throw std::runtime_error( "byte span is too small" );

  T t;
  std::memcpy( &t, bytes.data(), sizeof( T ) );
  return t;
}

template< byte_viewable_range R >
inline std::span< const std::byte > as_bytes( const R& r )
{
  return std::as_bytes( std::span( std::ranges::data( r ), std::ranges::size( r ) ) );
}

template< trivially_copyable T >
  requires( !std::ranges::range< T > )
inline std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( std::addressof( t ), 1 ) );
}

template< byte_viewable_range R >
inline std::span< std::byte > as_writable_bytes( R& r )
{
  return std::as_writable_bytes( std::span( std::ranges::data( r ), std::ranges::size( r ) ) );
}

template< trivially_copyable T >
  requires( !std::ranges::range< T > )
inline std::span< std::byte > as_writable_bytes( T& t )
{
  return std::as_writable_bytes( std::span( std::addressof( t ), 1 ) );
}

} // namespace tally::memory
