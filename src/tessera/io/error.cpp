#include <tessera/io/error.hpp>

#include <string>
#include <utility>

namespace tessera::io {

struct _io_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "io";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< io_errc >( condition ) )
    {
      case io_errc::ok:
        return "ok"s;
      case io_errc::open_failed:
        return "unable to open file"s;
      case io_errc::read_failed:
        return "read failed"s;
      case io_errc::write_failed:
        return "write failed"s;
      case io_errc::seek_failed:
        return "seek failed"s;
    }
    std::unreachable();
  }

  std::error_condition default_error_condition( int condition ) const noexcept final
  {
    if( static_cast< io_errc >( condition ) == io_errc::ok )
      return make_error_condition( error_kind::none );

    return make_error_condition( error_kind::io );
  }
};

const std::error_category& io_category() noexcept
{
  static _io_category category;
  return category;
}

std::error_code make_error_code( io_errc e )
{
  return std::error_code( static_cast< int >( e ), io_category() );
}

} // namespace tessera::io
