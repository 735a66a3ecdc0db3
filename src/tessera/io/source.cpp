#include <tessera/io/source.hpp>

#include <algorithm>
#include <system_error>

#include <tessera/log.hpp>

namespace tessera::io {

file_source::file_source( std::unique_ptr< FILE, decltype( &fclose ) > file, std::uint64_t size ) noexcept:
    _file( std::move( file ) ),
    _size( size )
{}

result< std::unique_ptr< file_source > > file_source::open( const std::filesystem::path& path )
{
  std::error_code ec;
  auto size = std::filesystem::file_size( path, ec );
  if( ec )
  {
    LOG_ERROR( tessera::log::instance(), "Unable to stat {}: {}", path.string(), ec.message() );
    return std::unexpected( io_errc::open_failed );
  }

  std::unique_ptr< FILE, decltype( &fclose ) > file( fopen( path.c_str(), "rb" ), fclose );
  if( !file )
  {
    LOG_ERROR( tessera::log::instance(), "Unable to open {} for reading", path.string() );
    return std::unexpected( io_errc::open_failed );
  }

  return std::unique_ptr< file_source >( new file_source( std::move( file ), size ) );
}

std::uint64_t file_source::size() const noexcept
{
  return _size;
}

result< std::size_t > file_source::read( std::uint64_t offset, std::span< std::byte > buffer )
{
  if( offset >= _size || buffer.empty() )
    return 0;

  if( fseeko( _file.get(), static_cast< off_t >( offset ), SEEK_SET ) )
    return std::unexpected( io_errc::seek_failed );

  auto count = fread( buffer.data(), 1, buffer.size(), _file.get() );
  if( count < buffer.size() && ferror( _file.get() ) )
    return std::unexpected( io_errc::read_failed );

  return count;
}

memory_source::memory_source( std::vector< std::byte > data ) noexcept:
    _data( std::move( data ) )
{}

std::uint64_t memory_source::size() const noexcept
{
  return _data.size();
}

result< std::size_t > memory_source::read( std::uint64_t offset, std::span< std::byte > buffer )
{
  if( offset >= _data.size() )
    return 0;

  auto count = std::min< std::uint64_t >( buffer.size(), _data.size() - offset );
  std::copy_n( _data.begin() + static_cast< std::ptrdiff_t >( offset ), count, buffer.begin() );
  return count;
}

result< std::vector< std::byte > > read_range( source& src, std::uint64_t offset, std::uint64_t length )
{
  auto available = offset < src.size() ? src.size() - offset : 0;
  std::vector< std::byte > bytes( std::min( length, available ) );
  std::size_t filled = 0;

  while( filled < bytes.size() )
  {
    auto count = src.read( offset + filled, std::span( bytes ).subspan( filled ) );
    if( !count )
      return std::unexpected( count.error() );

    if( *count == 0 )
      break;

    filled += *count;
  }

  bytes.resize( filled );
  return bytes;
}

} // namespace tessera::io
