// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tessera/crypto/tz.hpp>
#include <tessera/memory/memory.hpp>

#include <string>

using namespace std::string_view_literals;

namespace tz = tessera::crypto::tz;

TEST( tz, empty_is_identity )
{
  auto identity = tz::sum( {} );

  auto digest = tz::sum( tessera::memory::as_bytes( "carpe diem"sv ) );
  std::array< tz::digest, 2 > parts{ identity, digest };

  auto combined = tz::concat( parts );
  ASSERT_TRUE( combined );
  EXPECT_EQ( *combined, digest );
}

TEST( tz, concat_matches_whole )
{
  auto text = "A quick brown fox jumps over the lazy dog"sv;
  auto data = tessera::memory::as_bytes( text );

  for( std::size_t split: { std::size_t( 0 ), std::size_t( 1 ), std::size_t( 17 ), data.size() } )
  {
    std::array< tz::digest, 2 > parts{ tz::sum( data.first( split ) ), tz::sum( data.subspan( split ) ) };

    auto combined = tz::concat( parts );
    ASSERT_TRUE( combined );
    EXPECT_EQ( *combined, tz::sum( data ) ) << "split at " << split;
  }
}

TEST( tz, concat_is_ordered )
{
  auto a = tz::sum( tessera::memory::as_bytes( "alice"sv ) );
  auto b = tz::sum( tessera::memory::as_bytes( "bob"sv ) );

  std::array< tz::digest, 2 > ab{ a, b };
  std::array< tz::digest, 2 > ba{ b, a };

  EXPECT_NE( *tz::concat( ab ), *tz::concat( ba ) );
}

TEST( tz, concat_empty_list )
{
  auto combined = tz::concat( {} );
  ASSERT_FALSE( combined );
  EXPECT_EQ( combined.error(), tessera::crypto::crypto_errc::empty_concat );
}

TEST( tz, concat_invalid_digest )
{
  tz::digest bad{};
  bad.fill( std::byte{ 0xff } );

  std::array< tz::digest, 1 > parts{ bad };
  auto combined = tz::concat( parts );
  ASSERT_FALSE( combined );
  EXPECT_EQ( combined.error(), tessera::crypto::crypto_errc::invalid_digest );
}

TEST( tz, streaming_matches_sum )
{
  std::vector< std::byte > data( 1'000 );
  for( std::size_t i = 0; i < data.size(); ++i )
    data[ i ] = std::byte( i * 31 % 251 );

  tz::hasher h;
  for( std::size_t offset = 0; offset < data.size(); offset += 64 )
    h.absorb( std::span( data ).subspan( offset, std::min< std::size_t >( 64, data.size() - offset ) ) );

  EXPECT_EQ( h.size(), data.size() );
  EXPECT_EQ( h.finalize(), tz::sum( data ) );

  h.reset();
  EXPECT_EQ( h.size(), 0 );
  EXPECT_EQ( h.finalize(), tz::sum( {} ) );
}

TEST( tz, distinct_inputs )
{
  EXPECT_NE( tz::sum( tessera::memory::as_bytes( "ab"sv ) ), tz::sum( tessera::memory::as_bytes( "ba"sv ) ) );
  EXPECT_NE( tz::sum( tessera::memory::as_bytes( "a"sv ) ), tz::sum( {} ) );
}

TEST( tz, salt_xor )
{
  std::array< std::byte, 5 > data{ std::byte{ 0x00 }, std::byte{ 0x01 }, std::byte{ 0x02 }, std::byte{ 0x03 }, std::byte{ 0x04 } };
  std::array< std::byte, 2 > salt{ std::byte{ 0xf0 }, std::byte{ 0x0f } };

  auto salted = tz::salt_xor( data, salt );
  ASSERT_EQ( salted.size(), data.size() );
  EXPECT_EQ( salted[ 0 ], std::byte{ 0xf0 } );
  EXPECT_EQ( salted[ 1 ], std::byte{ 0x0e } );
  EXPECT_EQ( salted[ 2 ], std::byte{ 0xf2 } );
  EXPECT_EQ( salted[ 3 ], std::byte{ 0x0c } );
  EXPECT_EQ( salted[ 4 ], std::byte{ 0xf4 } );

  EXPECT_TRUE( std::ranges::equal( tz::salt_xor( salted, salt ), data ) );
  EXPECT_TRUE( std::ranges::equal( tz::salt_xor( data, {} ), data ) );
}

// NOLINTEND
