#pragma once

#include <array>
#include <string>
#include <string_view>

#include <boost/serialization/access.hpp>
#include <boost/serialization/array.hpp>

#include <tessera/refs/error.hpp>

namespace tessera::refs {

constexpr std::size_t object_id_length = 16;

using object_id_data = std::array< std::byte, object_id_length >;

// Random (version 4) UUID, written as xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
class object_id
{
public:
  object_id() = default;
  explicit object_id( const object_id_data& bytes ) noexcept;

  bool operator==( const object_id& rhs ) const noexcept = default;

  static object_id generate() noexcept;

  const object_id_data& bytes() const noexcept;

private:
  friend class boost::serialization::access;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & _bytes;
  }

  object_id_data _bytes{};
};

result< object_id > parse_object_id( std::string_view text ) noexcept;
std::string to_string( const object_id& id ) noexcept;

} // namespace tessera::refs
