#include <tally/state_db/backends/map/map_backend.hpp>

namespace tally::state_db::backends::map {

iterator map_backend::begin() const noexcept
{
  return iterator( std::make_unique< map_iterator >( _map.begin(), _map ) );
}

iterator map_backend::end() const noexcept
{
  return iterator( std::make_unique< map_iterator >( _map.end(), _map ) );
}

iterator map_backend::lower_bound( const bytes& key ) const
{
  return iterator( std::make_unique< map_iterator >( _map.lower_bound( key ), _map ) );
}

void map_backend::put( bytes&& key, std::span< const std::byte > value )
{
  _map.insert_or_assign( std::move( key ), bytes( value.begin(), value.end() ) );
}

std::optional< std::span< const std::byte > > map_backend::get( const bytes& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

void map_backend::remove( const bytes& key )
{
  _map.erase( key );
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

void map_backend::start_write_batch() {}

void map_backend::end_write_batch() {}

} // namespace tally::state_db::backends::map
