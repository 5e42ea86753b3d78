#pragma once

#include <tally/state_db/backends/backend.hpp>
#include <tally/state_db/backends/map/map_iterator.hpp>

namespace tally::state_db::backends::map {

class map_backend final: public abstract_backend
{
public:
  map_backend()                                = default;
  map_backend( const map_backend& )            = delete;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = delete;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() final                         = default;

  // Iterators
  iterator begin() const noexcept final;
  iterator end() const noexcept final;
  iterator lower_bound( const bytes& key ) const final;

  // Modifiers
  void put( bytes&& key, std::span< const std::byte > value ) final;
  std::optional< std::span< const std::byte > > get( const bytes& key ) const final;
  void remove( const bytes& key ) final;

  std::uint64_t size() const noexcept final;

  void start_write_batch() final;
  void end_write_batch() final;

private:
  map_type _map;
};

} // namespace tally::state_db::backends::map
