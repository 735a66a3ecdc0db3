// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tessera/encode/hex.hpp>
#include <tessera/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  EXPECT_EQ( tessera::encode::to_hex( tessera::memory::as_bytes( data ) ), valid_hex_str );
  EXPECT_EQ( tessera::encode::to_hex( tessera::memory::as_bytes( data ), false ), valid_hex_str.substr( 2 ) );
}

TEST( hex, decode )
{
  auto decoded_data = tessera::encode::from_hex( valid_hex_str );

  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, tessera::memory::as_bytes( data ) ) );

  decoded_data = tessera::encode::from_hex( valid_hex_str.substr( 2 ) );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, tessera::memory::as_bytes( data ) ) );

  decoded_data = tessera::encode::from_hex( "0x04080F10172A"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, tessera::memory::as_bytes( data ) ) );

  decoded_data = tessera::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), tessera::encode::encode_errc::invalid_length );
    EXPECT_EQ( decoded_data.error(), tessera::error_kind::format );
  }

  decoded_data = tessera::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
    EXPECT_EQ( decoded_data.error(), tessera::encode::encode_errc::invalid_character );
}

TEST( hex, empty )
{
  auto decoded_data = tessera::encode::from_hex( ""sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );

  decoded_data = tessera::encode::from_hex( "0x"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );
}

// NOLINTEND
