#include <tessera/io/sink.hpp>

#include <tessera/log.hpp>

namespace tessera::io {

file_sink::file_sink( std::unique_ptr< FILE, decltype( &fclose ) > file ) noexcept:
    _file( std::move( file ) )
{}

result< std::unique_ptr< file_sink > > file_sink::create( const std::filesystem::path& path )
{
  std::unique_ptr< FILE, decltype( &fclose ) > file( fopen( path.c_str(), "wb" ), fclose );
  if( !file )
  {
    LOG_ERROR( tessera::log::instance(), "Unable to open {} for writing", path.string() );
    return std::unexpected( io_errc::open_failed );
  }

  return std::unique_ptr< file_sink >( new file_sink( std::move( file ) ) );
}

result< void > file_sink::write( std::span< const std::byte > bytes )
{
  if( bytes.empty() )
    return {};

  if( fwrite( bytes.data(), 1, bytes.size(), _file.get() ) != bytes.size() || fflush( _file.get() ) )
    return std::unexpected( io_errc::write_failed );

  _written += bytes.size();
  return {};
}

std::uint64_t file_sink::written() const noexcept
{
  return _written;
}

deferred_file_sink::deferred_file_sink( std::filesystem::path path ) noexcept:
    _path( std::move( path ) )
{}

result< void > deferred_file_sink::open()
{
  if( _sink )
    return {};

  auto sink = file_sink::create( _path );
  if( !sink )
    return std::unexpected( sink.error() );

  _sink = std::move( *sink );
  return {};
}

result< void > deferred_file_sink::write( std::span< const std::byte > bytes )
{
  if( bytes.empty() )
    return {};

  if( auto opened = open(); !opened )
    return opened;

  return _sink->write( bytes );
}

std::uint64_t deferred_file_sink::written() const noexcept
{
  return _sink ? _sink->written() : 0;
}

result< void > deferred_file_sink::finish()
{
  return open();
}

bool deferred_file_sink::opened() const noexcept
{
  return _sink != nullptr;
}

result< void > memory_sink::write( std::span< const std::byte > bytes )
{
  _data.insert( _data.end(), bytes.begin(), bytes.end() );
  return {};
}

std::uint64_t memory_sink::written() const noexcept
{
  return _data.size();
}

const std::vector< std::byte >& memory_sink::data() const noexcept
{
  return _data;
}

} // namespace tessera::io
