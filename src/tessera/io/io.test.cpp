// NOLINTBEGIN

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <tessera/io.hpp>

namespace {

std::vector< std::byte > sequence( std::size_t n )
{
  std::vector< std::byte > data( n );
  for( std::size_t i = 0; i < n; ++i )
    data[ i ] = std::byte( i % 256 );
  return data;
}

class temp_file
{
public:
  explicit temp_file( const std::string& name ):
      _path( std::filesystem::temp_directory_path() / ( "tessera_io_test_" + name ) )
  {}

  ~temp_file()
  {
    std::error_code ec;
    std::filesystem::remove( _path, ec );
  }

  const std::filesystem::path& path() const noexcept
  {
    return _path;
  }

private:
  std::filesystem::path _path;
};

} // namespace

TEST( memory_source, read )
{
  tessera::io::memory_source src( sequence( 10 ) );
  EXPECT_EQ( src.size(), 10 );

  std::array< std::byte, 4 > buffer{};
  auto count = src.read( 8, buffer );
  ASSERT_TRUE( count );
  EXPECT_EQ( *count, 2 );
  EXPECT_EQ( buffer[ 0 ], std::byte{ 8 } );
  EXPECT_EQ( buffer[ 1 ], std::byte{ 9 } );

  count = src.read( 10, buffer );
  ASSERT_TRUE( count );
  EXPECT_EQ( *count, 0 );
}

TEST( read_range, short_source )
{
  tessera::io::memory_source src( sequence( 10 ) );

  auto bytes = tessera::io::read_range( src, 2, 5 );
  ASSERT_TRUE( bytes );
  ASSERT_EQ( bytes->size(), 5 );
  EXPECT_EQ( bytes->front(), std::byte{ 2 } );

  bytes = tessera::io::read_range( src, 7, 100 );
  ASSERT_TRUE( bytes );
  EXPECT_EQ( bytes->size(), 3 );

  bytes = tessera::io::read_range( src, 50, 4'000'000'000 );
  ASSERT_TRUE( bytes );
  EXPECT_TRUE( bytes->empty() );
}

TEST( file_source, read )
{
  temp_file file( "source" );
  auto data = sequence( 1'000 );
  {
    std::ofstream out( file.path(), std::ios::binary );
    out.write( reinterpret_cast< const char* >( data.data() ), static_cast< std::streamsize >( data.size() ) );
  }

  auto src = tessera::io::file_source::open( file.path() );
  ASSERT_TRUE( src );
  EXPECT_EQ( ( *src )->size(), 1'000 );

  auto bytes = tessera::io::read_range( **src, 300, 400 );
  ASSERT_TRUE( bytes );
  EXPECT_TRUE( std::ranges::equal( *bytes, std::span( data ).subspan( 300, 400 ) ) );

  bytes = tessera::io::read_range( **src, 900, 400 );
  ASSERT_TRUE( bytes );
  EXPECT_EQ( bytes->size(), 100 );
}

TEST( file_source, missing )
{
  auto src = tessera::io::file_source::open( std::filesystem::temp_directory_path() / "tessera_io_test_missing" );
  ASSERT_FALSE( src );
  EXPECT_EQ( src.error(), tessera::io::io_errc::open_failed );
  EXPECT_EQ( src.error(), tessera::error_kind::io );
}

TEST( file_sink, write )
{
  temp_file file( "sink" );
  auto data = sequence( 300 );

  {
    auto sink = tessera::io::file_sink::create( file.path() );
    ASSERT_TRUE( sink );

    ASSERT_TRUE( ( *sink )->write( std::span( data ).first( 100 ) ) );
    ASSERT_TRUE( ( *sink )->write( std::span( data ).subspan( 100 ) ) );
    EXPECT_EQ( ( *sink )->written(), 300 );
  }

  auto src = tessera::io::file_source::open( file.path() );
  ASSERT_TRUE( src );

  auto bytes = tessera::io::read_range( **src, 0, 300 );
  ASSERT_TRUE( bytes );
  EXPECT_EQ( *bytes, data );
}

TEST( file_sink, unwritable )
{
  auto sink = tessera::io::file_sink::create( "/nonexistent-directory/tessera/out.bin" );
  ASSERT_FALSE( sink );
  EXPECT_EQ( sink.error(), tessera::io::io_errc::open_failed );
}

TEST( deferred_file_sink, existing_file_untouched_until_write )
{
  temp_file file( "deferred" );
  auto original = sequence( 64 );

  {
    auto sink = tessera::io::file_sink::create( file.path() );
    ASSERT_TRUE( sink );
    ASSERT_TRUE( ( *sink )->write( original ) );
  }

  auto replacement = sequence( 10 );

  {
    tessera::io::deferred_file_sink sink( file.path() );
    EXPECT_FALSE( sink.opened() );
    EXPECT_EQ( sink.written(), 0 );
    ASSERT_TRUE( sink.write( {} ) );
    EXPECT_FALSE( sink.opened() );
    EXPECT_EQ( std::filesystem::file_size( file.path() ), original.size() );

    ASSERT_TRUE( sink.write( replacement ) );
    EXPECT_TRUE( sink.opened() );
    EXPECT_EQ( sink.written(), replacement.size() );
    ASSERT_TRUE( sink.finish() );
  }

  auto src = tessera::io::file_source::open( file.path() );
  ASSERT_TRUE( src );
  EXPECT_EQ( ( *src )->size(), replacement.size() );
}

TEST( deferred_file_sink, finish_creates_empty_file )
{
  temp_file file( "deferred_empty" );

  tessera::io::deferred_file_sink sink( file.path() );
  EXPECT_FALSE( std::filesystem::exists( file.path() ) );

  ASSERT_TRUE( sink.finish() );
  EXPECT_TRUE( sink.opened() );
  EXPECT_TRUE( std::filesystem::exists( file.path() ) );
  EXPECT_EQ( std::filesystem::file_size( file.path() ), 0 );
}

TEST( deferred_file_sink, unwritable )
{
  tessera::io::deferred_file_sink sink( "/nonexistent-directory/tessera/out.bin" );

  auto data    = sequence( 4 );
  auto written = sink.write( data );
  ASSERT_FALSE( written );
  EXPECT_EQ( written.error(), tessera::io::io_errc::open_failed );
  EXPECT_FALSE( sink.opened() );
}

TEST( memory_sink, write )
{
  tessera::io::memory_sink sink;
  auto data = sequence( 5 );

  ASSERT_TRUE( sink.write( data ) );
  ASSERT_TRUE( sink.write( {} ) );
  EXPECT_EQ( sink.written(), 5 );
  EXPECT_EQ( sink.data(), data );
}

// NOLINTEND
