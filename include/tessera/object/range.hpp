#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tessera/object/error.hpp>
#include <tessera/object/object.hpp>

namespace tessera::object {

struct range
{
  std::uint64_t offset = 0;
  std::uint64_t length = 0;

  bool operator==( const range& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & offset;
    ar & length;
  }
};

// "offset:length", both decimal and within 32 bits
result< range > parse_range( std::string_view text ) noexcept;
result< std::vector< range > > parse_ranges( const std::vector< std::string >& texts ) noexcept;

// "key=value" or "key", the latter yielding an empty value
result< user_header > parse_user_header( std::string_view text ) noexcept;
result< std::vector< header > > parse_user_headers( const std::vector< std::string >& texts ) noexcept;

std::string to_string( const range& r );

} // namespace tessera::object
