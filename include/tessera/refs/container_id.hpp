#pragma once

#include <array>
#include <string>
#include <string_view>

#include <boost/serialization/access.hpp>
#include <boost/serialization/array.hpp>

#include <tessera/refs/error.hpp>

namespace tessera::refs {

constexpr std::size_t container_id_length = 32;

using container_id_data = std::array< std::byte, container_id_length >;

class container_id
{
public:
  container_id() = default;
  explicit container_id( const container_id_data& bytes ) noexcept;

  bool operator==( const container_id& rhs ) const noexcept = default;

  const container_id_data& bytes() const noexcept;

private:
  friend class boost::serialization::access;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & _bytes;
  }

  container_id_data _bytes{};
};

result< container_id > parse_container_id( std::string_view text ) noexcept;
std::string to_string( const container_id& id ) noexcept;

} // namespace tessera::refs
