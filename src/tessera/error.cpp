#include <tessera/error.hpp>

#include <string>
#include <utility>

namespace tessera {

struct _error_kind_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "error kind";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< error_kind >( condition ) )
    {
      case error_kind::none:
        return "no error"s;
      case error_kind::format:
        return "format error"s;
      case error_kind::connection:
        return "connection error"s;
      case error_kind::protocol_integrity:
        return "protocol integrity error"s;
      case error_kind::remote_rejection:
        return "remote rejection"s;
      case error_kind::io:
        return "I/O error"s;
    }
    std::unreachable();
  }
};

const std::error_category& error_kind_category() noexcept
{
  static _error_kind_category category;
  return category;
}

std::error_condition make_error_condition( error_kind e ) noexcept
{
  return std::error_condition( static_cast< int >( e ), error_kind_category() );
}

} // namespace tessera
