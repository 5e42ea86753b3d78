#include <tally/ledger/ledger.hpp>

#include <tally/state_db/backends/map/map_backend.hpp>

#include <stdexcept>

namespace tally::ledger {

namespace space {

constexpr std::byte supply{ 0x00 };
constexpr std::byte balance{ 0x01 };
constexpr std::byte allowance{ 0x02 };

} // namespace space

static state_db::bytes supply_key()
{
  return state_db::bytes{ space::supply };
}

static state_db::bytes balance_key( const protocol::account& owner )
{
  state_db::bytes key;
  key.reserve( 1 + protocol::account_length );
  key.push_back( space::balance );
  key.insert( key.end(), owner.begin(), owner.end() );
  return key;
}

static state_db::bytes allowance_key( const protocol::account& owner, const protocol::account& spender )
{
  state_db::bytes key;
  key.reserve( 1 + 2 * protocol::account_length );
  key.push_back( space::allowance );
  key.insert( key.end(), owner.begin(), owner.end() );
  key.insert( key.end(), spender.begin(), spender.end() );
  return key;
}

class write_batch final
{
public:
  explicit write_batch( state_db::backends::abstract_backend& backend ):
      _backend( backend )
  {
    _backend.start_write_batch();
  }

  write_batch( const write_batch& )            = delete;
  write_batch( write_batch&& )                 = delete;
  write_batch& operator=( const write_batch& ) = delete;
  write_batch& operator=( write_batch&& )      = delete;

  ~write_batch()
  {
    _backend.end_write_batch();
  }

private:
  state_db::backends::abstract_backend& _backend;
};

ledger::ledger( const protocol::account& creator,
                const protocol::amount& initial_supply,
                token_metadata metadata,
                chronicler& events,
                std::unique_ptr< state_db::backends::abstract_backend > backend ):
    _metadata( std::move( metadata ) ),
    _chronicler( events ),
    _backend( std::move( backend ) )
{
  if( !_backend )
    throw std::invalid_argument( "ledger requires a backend" );

  if( !_backend->empty() )
    throw std::runtime_error( "encountered unexpected objects in initial ledger state" );

  {
    write_batch batch( *_backend );
    write( supply_key(), initial_supply );
    write( balance_key( creator ), initial_supply );
  }

  _chronicler.push_event( protocol::transfer_event{ .from = std::nullopt, .to = creator, .value = initial_supply } );
}

ledger::ledger( const protocol::account& creator,
                const protocol::amount& initial_supply,
                token_metadata metadata,
                chronicler& events ):
    ledger( creator,
            initial_supply,
            std::move( metadata ),
            events,
            std::make_unique< state_db::backends::map::map_backend >() )
{}

protocol::amount ledger::read( const state_db::bytes& key ) const
{
  auto object = _backend->get( key );
  if( !object )
    return 0;

  return protocol::from_bytes( *object );
}

void ledger::write( state_db::bytes&& key, const protocol::amount& value )
{
  if( value == 0 )
  {
    _backend->remove( key );
    return;
  }

  _backend->put( std::move( key ), protocol::to_bytes( value ) );
}

protocol::amount ledger::total_supply() const
{
  return read( supply_key() );
}

protocol::amount ledger::balance_of( const protocol::account& owner ) const
{
  return read( balance_key( owner ) );
}

protocol::amount ledger::allowance( const protocol::account& owner, const protocol::account& spender ) const
{
  return read( allowance_key( owner, spender ) );
}

std::vector< std::pair< protocol::account, protocol::amount > > ledger::balances() const
{
  std::vector< std::pair< protocol::account, protocol::amount > > holders;

  for( auto itr = _backend->lower_bound( { space::balance } ); itr != _backend->end(); ++itr )
  {
    const auto& [ key, value ] = *itr;
    if( key.empty() || key.front() != space::balance )
      break;

    if( key.size() != 1 + protocol::account_length )
      throw std::runtime_error( "encountered malformed balance key" );

    holders.emplace_back(
      protocol::make_account( protocol::account_view( key.data() + 1, protocol::account_length ) ),
      protocol::from_bytes( value ) );
  }

  return holders;
}

result< void >
ledger::move_balance( const protocol::account& from, const protocol::account& to, const protocol::amount& value )
{
  auto from_balance = balance_of( from );
  if( from_balance < value )
    return std::unexpected( ledger_errc::insufficient_balance );

  write( balance_key( from ), from_balance - value );

  // Read after the debit so a self transfer nets to zero
  auto to_balance = balance_of( to );
  write( balance_key( to ), protocol::saturating_add( to_balance, value ) );

  return {};
}

result< void >
ledger::transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value )
{
  {
    write_batch batch( *_backend );
    if( auto moved = move_balance( caller, to, value ); !moved )
      return moved;
  }

  _chronicler.push_event( protocol::transfer_event{ .from = caller, .to = to, .value = value } );
  return {};
}

result< void > ledger::transfer_from( const protocol::account& caller,
                                      const protocol::account& from,
                                      const protocol::account& to,
                                      const protocol::amount& value )
{
  auto remaining = allowance( from, caller );
  if( remaining < value )
    return std::unexpected( ledger_errc::insufficient_allowance );

  {
    write_batch batch( *_backend );
    if( auto moved = move_balance( from, to, value ); !moved )
      return moved;

    write( allowance_key( from, caller ), protocol::saturating_sub( remaining, value ) );
  }

  _chronicler.push_event( protocol::transfer_event{ .from = from, .to = to, .value = value } );
  return {};
}

result< void >
ledger::approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value )
{
  {
    write_batch batch( *_backend );
    write( allowance_key( caller, spender ), value );
  }

  _chronicler.push_event( protocol::approval_event{ .owner = caller, .spender = spender, .value = value } );
  return {};
}

result< void > ledger::increase_allowance( const protocol::account& caller,
                                           const protocol::account& spender,
                                           const protocol::amount& delta )
{
  return approve( caller, spender, protocol::saturating_add( allowance( caller, spender ), delta ) );
}

result< void > ledger::decrease_allowance( const protocol::account& caller,
                                           const protocol::account& spender,
                                           const protocol::amount& delta )
{
  auto current = allowance( caller, spender );
  if( current < delta )
    return std::unexpected( ledger_errc::insufficient_allowance );

  return approve( caller, spender, current - delta );
}

result< void > ledger::mint( const protocol::account& caller, const protocol::amount& value )
{
  {
    write_batch batch( *_backend );
    write( balance_key( caller ), protocol::saturating_add( balance_of( caller ), value ) );
    write( supply_key(), protocol::saturating_add( total_supply(), value ) );
  }

  _chronicler.push_event( protocol::transfer_event{ .from = std::nullopt, .to = caller, .value = value } );
  return {};
}

result< void > ledger::burn( const protocol::account& caller, const protocol::amount& value )
{
  auto balance = balance_of( caller );
  if( balance < value )
    return std::unexpected( ledger_errc::insufficient_balance );

  {
    write_batch batch( *_backend );
    write( balance_key( caller ), balance - value );

    // A saturated mint can leave the supply below the sum of balances
    write( supply_key(), protocol::saturating_sub( total_supply(), value ) );
  }

  _chronicler.push_event( protocol::transfer_event{ .from = caller, .to = std::nullopt, .value = value } );
  return {};
}

const std::optional< std::string >& ledger::token_name() const noexcept
{
  return _metadata.name;
}

const std::optional< std::string >& ledger::token_symbol() const noexcept
{
  return _metadata.symbol;
}

std::uint8_t ledger::token_decimals() const noexcept
{
  return _metadata.decimals;
}

const state_db::backends::abstract_backend& ledger::backend() const noexcept
{
  return *_backend;
}

} // namespace tally::ledger
