#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <tessera/object/error.hpp>

namespace tessera::object {

constexpr std::string_view root_object_key   = "ROOT_OBJECT";
constexpr std::string_view storage_group_key = "STORAGE_GROUP";

enum class match_type : std::uint8_t
{
  exact,
  regex
};

struct filter
{
  match_type type = match_type::exact;
  std::string name;
  std::string value;

  bool operator==( const filter& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & type;
    ar & name;
    ar & value;
  }
};

struct query
{
  std::vector< filter > filters;

  bool operator==( const query& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & filters;
  }
};

/*
 * Builds a search query. Each consecutive (name, value) pair is matched as a
 * regular expression; root objects and storage groups are selected with
 * exact filters on the marker keys.
 */
result< query >
make_query( const std::vector< std::string >& pairs, bool root_only = false, bool storage_groups = false );

} // namespace tessera::object
