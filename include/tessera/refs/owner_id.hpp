#pragma once

#include <array>
#include <string>
#include <string_view>

#include <boost/serialization/access.hpp>
#include <boost/serialization/array.hpp>

#include <tessera/crypto/public_key.hpp>
#include <tessera/refs/error.hpp>

namespace tessera::refs {

constexpr std::size_t owner_id_length = 25;
constexpr std::byte owner_id_version{ 0x35 };

using owner_id_data = std::array< std::byte, owner_id_length >;

/*
 * Owner identifiers are derived from a public key:
 *   [0]      version
 *   [1, 21)  leading bytes of the key digest
 *   [21, 25) checksum, leading bytes of the double digest of [0, 21)
 */
class owner_id
{
public:
  owner_id() = default;
  explicit owner_id( const owner_id_data& bytes ) noexcept;

  bool operator==( const owner_id& rhs ) const noexcept = default;

  const owner_id_data& bytes() const noexcept;

private:
  friend class boost::serialization::access;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & _bytes;
  }

  owner_id_data _bytes{};
};

owner_id make_owner_id( const crypto::public_key& key ) noexcept;

result< owner_id > parse_owner_id( std::string_view text ) noexcept;
std::string to_string( const owner_id& id ) noexcept;

} // namespace tessera::refs
