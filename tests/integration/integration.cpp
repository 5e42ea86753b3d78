// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tally/controller.hpp>
#include <tally/ledger.hpp>
#include <tally/program.hpp>
#include <test/fixture.hpp>

using instruction = tally::program::token::instruction;
using tally::protocol::amount;
using tally::protocol::approval_event;
using tally::protocol::transfer_event;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration", "info" ),
      alice( test::make_account( "alice" ) ),
      bob( test::make_account( "bob" ) ),
      dave( test::make_account( "dave" ) )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  tally::protocol::account alice;
  tally::protocol::account bob;
  tally::protocol::account dave;
};

TEST_F( integration, genesis )
{
  EXPECT_EQ( total_supply(), 1'000'000 );
  EXPECT_EQ( balance_of( _creator ), 1'000'000 );

  const auto& events = _controller->genesis_events();
  ASSERT_EQ( events.size(), 1 );
  EXPECT_EQ( std::get< transfer_event >( events.front().data ),
             ( transfer_event{ .from = std::nullopt, .to = _creator, .value = 1'000'000 } ) );
}

TEST_F( integration, metadata )
{
  auto response = _controller->call( alice, make_call( instruction::name ) );
  ASSERT_TRUE( response.has_value() );
  auto name = tally::program::decode_optional_string( response->stdout );
  ASSERT_TRUE( name );
  ASSERT_TRUE( name->has_value() );
  EXPECT_EQ( **name, "MyToken" );
  EXPECT_TRUE( response->events.empty() );

  response = _controller->call( alice, make_call( instruction::symbol ) );
  ASSERT_TRUE( response.has_value() );
  auto symbol = tally::program::decode_optional_string( response->stdout );
  ASSERT_TRUE( symbol );
  ASSERT_TRUE( symbol->has_value() );
  EXPECT_EQ( **symbol, "MTK" );

  response = _controller->call( alice, make_call( instruction::decimals ) );
  ASSERT_TRUE( response.has_value() );
  auto decimals = tally::program::decode_decimals( response->stdout );
  ASSERT_TRUE( decimals );
  EXPECT_EQ( *decimals, 18 );
}

TEST_F( integration, anonymous_token_metadata )
{
  tally::controller::controller anonymous( tally::controller::genesis_data{ .creator = alice, .initial_supply = 5 } );

  auto response = anonymous.call( alice, make_call( instruction::name ) );
  ASSERT_TRUE( response.has_value() );
  auto name = tally::program::decode_optional_string( response->stdout );
  ASSERT_TRUE( name );
  EXPECT_FALSE( name->has_value() );

  response = anonymous.call( alice, make_call( instruction::decimals ) );
  ASSERT_TRUE( response.has_value() );
  auto decimals = tally::program::decode_decimals( response->stdout );
  ASSERT_TRUE( decimals );
  EXPECT_EQ( *decimals, 0 );

  EXPECT_EQ( anonymous.state().balance_of( alice ), 5 );
}

TEST_F( integration, transfer )
{
  auto response = _controller->call( _creator, make_call( instruction::transfer, alice, amount( 400 ) ) );
  ASSERT_TRUE( response.has_value() );
  EXPECT_TRUE( response->stdout.empty() );
  ASSERT_EQ( response->events.size(), 1 );
  EXPECT_EQ( std::get< transfer_event >( response->events.front().data ),
             ( transfer_event{ .from = _creator, .to = alice, .value = 400 } ) );

  EXPECT_EQ( balance_of( _creator ), 999'600 );
  EXPECT_EQ( balance_of( alice ), 400 );

  response = _controller->call( alice, make_call( instruction::transfer, bob, amount( 401 ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::ledger::ledger_errc::insufficient_balance );
  EXPECT_EQ( balance_of( alice ), 400 );
  EXPECT_EQ( balance_of( bob ), 0 );
}

TEST_F( integration, delegated_transfer )
{
  ASSERT_TRUE( _controller->call( _creator, make_call( instruction::transfer, alice, amount( 400 ) ) ) );

  auto response = _controller->call( alice, make_call( instruction::approve, bob, amount( 100 ) ) );
  ASSERT_TRUE( response.has_value() );
  ASSERT_EQ( response->events.size(), 1 );
  EXPECT_EQ( std::get< approval_event >( response->events.front().data ),
             ( approval_event{ .owner = alice, .spender = bob, .value = 100 } ) );

  response = _controller->call( bob, make_call( instruction::transfer_from, alice, dave, amount( 50 ) ) );
  ASSERT_TRUE( response.has_value() );
  ASSERT_EQ( response->events.size(), 1 );
  EXPECT_EQ( std::get< transfer_event >( response->events.front().data ),
             ( transfer_event{ .from = alice, .to = dave, .value = 50 } ) );

  EXPECT_EQ( allowance( alice, bob ), 50 );
  EXPECT_EQ( balance_of( alice ), 350 );
  EXPECT_EQ( balance_of( dave ), 50 );

  response = _controller->call( bob, make_call( instruction::transfer_from, alice, dave, amount( 200 ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::ledger::ledger_errc::insufficient_allowance );
  EXPECT_EQ( balance_of( alice ), 350 );
  EXPECT_EQ( balance_of( dave ), 50 );
}

TEST_F( integration, allowance_adjustment )
{
  ASSERT_TRUE( _controller->call( alice, make_call( instruction::increase_allowance, bob, amount( 30 ) ) ) );
  ASSERT_TRUE( _controller->call( alice, make_call( instruction::increase_allowance, bob, amount( 20 ) ) ) );
  EXPECT_EQ( allowance( alice, bob ), 50 );

  auto response = _controller->call( alice, make_call( instruction::decrease_allowance, bob, amount( 51 ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::ledger::ledger_errc::insufficient_allowance );
  EXPECT_EQ( allowance( alice, bob ), 50 );

  response = _controller->call( alice, make_call( instruction::decrease_allowance, bob, amount( 45 ) ) );
  ASSERT_TRUE( response.has_value() );
  ASSERT_EQ( response->events.size(), 1 );
  EXPECT_EQ( std::get< approval_event >( response->events.front().data ),
             ( approval_event{ .owner = alice, .spender = bob, .value = 5 } ) );
  EXPECT_EQ( allowance( alice, bob ), 5 );
}

TEST_F( integration, mint_and_burn )
{
  auto supply = total_supply();

  auto response = _controller->call( dave, make_call( instruction::mint, amount( 10 ) ) );
  ASSERT_TRUE( response.has_value() );
  ASSERT_EQ( response->events.size(), 1 );
  EXPECT_EQ( std::get< transfer_event >( response->events.front().data ),
             ( transfer_event{ .from = std::nullopt, .to = dave, .value = 10 } ) );
  EXPECT_EQ( total_supply(), supply + 10 );
  EXPECT_EQ( balance_of( dave ), 10 );

  response = _controller->call( dave, make_call( instruction::burn, amount( 11 ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::ledger::ledger_errc::insufficient_balance );

  response = _controller->call( dave, make_call( instruction::burn, amount( 10 ) ) );
  ASSERT_TRUE( response.has_value() );
  ASSERT_EQ( response->events.size(), 1 );
  EXPECT_EQ( std::get< transfer_event >( response->events.front().data ),
             ( transfer_event{ .from = dave, .to = std::nullopt, .value = 10 } ) );
  EXPECT_EQ( total_supply(), supply );
  EXPECT_EQ( balance_of( dave ), 0 );
}

TEST_F( integration, event_sequence_spans_calls )
{
  auto first = _controller->call( _creator, make_call( instruction::transfer, alice, amount( 1 ) ) );
  auto second = _controller->call( _creator, make_call( instruction::approve, bob, amount( 1 ) ) );

  ASSERT_TRUE( first.has_value() );
  ASSERT_TRUE( second.has_value() );
  ASSERT_EQ( first->events.size(), 1 );
  ASSERT_EQ( second->events.size(), 1 );
  EXPECT_EQ( second->events.front().sequence, first->events.front().sequence + 1 );
  EXPECT_EQ( _controller->genesis_events().front().sequence, 0 );
}

TEST_F( integration, malformed_calls )
{
  // Missing amount
  auto response = _controller->call( alice, make_input( tally::program::encode_call( instruction::burn ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::controller::controller_errc::truncated_input );

  // Unknown instruction
  std::vector< std::byte > unknown{ std::byte{ 0xff }, std::byte{ 0xff }, std::byte{ 0xff }, std::byte{ 0xff } };
  response = _controller->call( alice, make_input( std::move( unknown ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::program::program_errc::invalid_instruction );

  // Truncated amount leaves balances untouched
  auto input = tally::program::encode_call( instruction::transfer, alice, amount( 5 ) );
  input.pop_back();
  response = _controller->call( _creator, make_input( std::move( input ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::controller::controller_errc::truncated_input );
  EXPECT_EQ( balance_of( alice ), 0 );
  EXPECT_EQ( balance_of( _creator ), 1'000'000 );

  // The token takes no string arguments
  response = _controller->call( alice, make_input( tally::program::encode_call( instruction::name ), { "extra" } ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::program::program_errc::invalid_argument );

  // Empty input
  response = _controller->call( alice, make_input( {} ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), tally::controller::controller_errc::truncated_input );
}

// NOLINTEND
