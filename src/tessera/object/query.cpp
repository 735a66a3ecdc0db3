#include <tessera/object/query.hpp>

namespace tessera::object {

result< query > make_query( const std::vector< std::string >& pairs, bool root_only, bool storage_groups )
{
  if( pairs.size() % 2 )
    return std::unexpected( object_errc::invalid_filter );

  query q;

  for( std::size_t i = 0; i < pairs.size(); i += 2 )
    q.filters.push_back( filter{ .type = match_type::regex, .name = pairs[ i ], .value = pairs[ i + 1 ] } );

  if( root_only )
    q.filters.push_back( filter{ .type = match_type::exact, .name = std::string( root_object_key ), .value = {} } );

  if( storage_groups )
    q.filters.push_back( filter{ .type = match_type::exact, .name = std::string( storage_group_key ), .value = {} } );

  return q;
}

} // namespace tessera::object
