#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include <boost/serialization/vector.hpp>

#include <tessera/encode/archive.hpp>
#include <tessera/refs.hpp>
#include <tessera/session/token.hpp>

namespace tessera::protocol {

struct session_init
{
  refs::owner_id owner_id;
  std::vector< refs::object_id > object_ids;
  std::uint64_t first_epoch = 0;
  std::uint64_t last_epoch  = 0;

  bool operator==( const session_init& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner_id;
    ar & object_ids;
    ar & first_epoch;
    ar & last_epoch;
  }
};

struct session_signed
{
  session::token token;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & token;
  }
};

struct session_unsigned
{
  session::token token;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & token;
  }
};

struct session_result
{
  session::token token;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & token;
  }
};

using session_request  = std::variant< session_init, session_signed >;
using session_response = std::variant< session_unsigned, session_result >;

} // namespace tessera::protocol
