#include <gtest/gtest.h>

#include <tally/program/encoding.hpp>

#include <vector>

using instruction = tally::program::token::instruction;

TEST( encoding, call_layout )
{
  tally::protocol::account spender{};
  spender.fill( std::byte{ 0xaa } );

  auto input = tally::program::encode_call( instruction::approve, spender, tally::protocol::amount( 7 ) );

  ASSERT_EQ( input.size(), 4 + tally::protocol::account_length + tally::protocol::amount_length );
  EXPECT_EQ( input.at( 0 ), std::byte{ 0x08 } );
  EXPECT_EQ( input.at( 1 ), std::byte{ 0x00 } );
  EXPECT_EQ( input.at( 4 ), std::byte{ 0xaa } );
  EXPECT_EQ( input.at( 4 + tally::protocol::account_length ), std::byte{ 0x07 } );
}

TEST( encoding, decode_optional_string )
{
  std::vector< std::byte > output{ std::byte{ 0x01 }, std::byte{ 'M' }, std::byte{ 'T' }, std::byte{ 'K' } };
  auto symbol = tally::program::decode_optional_string( output );
  ASSERT_TRUE( symbol );
  ASSERT_TRUE( symbol->has_value() );
  EXPECT_EQ( **symbol, "MTK" );

  output = { std::byte{ 0x00 } };
  symbol = tally::program::decode_optional_string( output );
  ASSERT_TRUE( symbol );
  EXPECT_FALSE( symbol->has_value() );

  output = { std::byte{ 0x00 }, std::byte{ 'M' } };
  symbol = tally::program::decode_optional_string( output );
  ASSERT_FALSE( symbol );
  EXPECT_EQ( symbol.error(), tally::program::program_errc::malformed_output );

  output = { std::byte{ 0x02 } };
  EXPECT_FALSE( tally::program::decode_optional_string( output ) );

  output.clear();
  EXPECT_FALSE( tally::program::decode_optional_string( output ) );
}

TEST( encoding, decode_fixed_width )
{
  std::vector< std::byte > output{ std::byte{ 18 } };
  auto decimals = tally::program::decode_decimals( output );
  ASSERT_TRUE( decimals );
  EXPECT_EQ( *decimals, 18 );

  auto value = tally::program::decode_amount( output );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), tally::program::program_errc::malformed_output );

  output.assign( tally::protocol::amount_length, std::byte{ 0x00 } );
  output.front() = std::byte{ 0x2a };
  value = tally::program::decode_amount( output );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 42 );

  EXPECT_FALSE( tally::program::decode_decimals( output ) );
}
