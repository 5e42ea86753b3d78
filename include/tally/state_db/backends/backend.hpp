#pragma once

#include <tally/state_db/backends/iterator.hpp>
#include <tally/state_db/types.hpp>

#include <cstdint>
#include <optional>
#include <span>

namespace tally::state_db::backends {

/*
 * Ordered byte-keyed object store. Every write issued between
 * start_write_batch() and end_write_batch() belongs to a single call and
 * a persistent implementation must commit them together.
 */
class abstract_backend
{
public:
  abstract_backend()                                     = default;
  abstract_backend( const abstract_backend& )            = delete;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = delete;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual iterator begin() const = 0;
  virtual iterator end() const   = 0;

  // First entry whose key is not less than key.
  virtual iterator lower_bound( const bytes& key ) const = 0;

  virtual void put( bytes&& key, std::span< const std::byte > value )               = 0;
  virtual std::optional< std::span< const std::byte > > get( const bytes& key ) const = 0;
  virtual void remove( const bytes& key )                                            = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;

  virtual void start_write_batch() = 0;
  virtual void end_write_batch()   = 0;
};

} // namespace tally::state_db::backends
