#pragma once

#include <exception>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/is_bitwise_serializable.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/variant.hpp>
#include <boost/serialization/vector.hpp>

#include <tessera/encode/error.hpp>
#include <tessera/memory/memory.hpp>

BOOST_IS_BITWISE_SERIALIZABLE( std::byte )

namespace tessera::encode {

constexpr unsigned int archive_flags = boost::archive::no_header | boost::archive::no_tracking;

template< typename T >
std::vector< std::byte > to_bytes( const T& t )
{
  std::stringstream ss;
  {
    boost::archive::binary_oarchive oa( ss, archive_flags );
    oa << t;
  }

  return memory::to_vector( memory::as_bytes( ss.view() ) );
}

template< typename T >
result< T > from_bytes( std::span< const std::byte > bytes ) noexcept
{
  try
  {
    std::stringstream ss( std::string( memory::as_string_view( bytes ) ) );
    boost::archive::binary_iarchive ia( ss, archive_flags );

    T t{};
    ia >> t;
    return t;
  }
  catch( const std::exception& )
  {
    return std::unexpected( encode_errc::invalid_archive );
  }
}

} // namespace tessera::encode
