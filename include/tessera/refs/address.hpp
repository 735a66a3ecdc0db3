#pragma once

#include <string>
#include <string_view>

#include <boost/serialization/access.hpp>

#include <tessera/refs/container_id.hpp>
#include <tessera/refs/error.hpp>
#include <tessera/refs/object_id.hpp>
#include <tessera/refs/owner_id.hpp>

namespace tessera::refs {

class address
{
public:
  address() = default;
  address( const container_id& container, const object_id& object ) noexcept;

  bool operator==( const address& rhs ) const noexcept = default;

  const container_id& container() const noexcept;
  const object_id& object() const noexcept;

private:
  friend class boost::serialization::access;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & _container;
    ar & _object;
  }

  container_id _container;
  object_id _object;
};

// Text form is "<container id>/<object id>"
result< address > parse_address( std::string_view text ) noexcept;
std::string to_string( const address& addr ) noexcept;

} // namespace tessera::refs
