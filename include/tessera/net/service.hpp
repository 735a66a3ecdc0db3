#pragma once

#include <memory>

#include <tessera/net/context.hpp>
#include <tessera/net/error.hpp>
#include <tessera/net/stream.hpp>
#include <tessera/protocol.hpp>

namespace tessera::net {

using put_stream     = client_stream< protocol::put_request, protocol::put_response >;
using get_stream     = server_stream< protocol::get_response >;
using session_stream = bidi_stream< protocol::session_request, protocol::session_response >;

class object_service
{
public:
  virtual ~object_service() = default;

  virtual result< std::unique_ptr< put_stream > > put( const call_context& ctx )                                  = 0;
  virtual result< std::unique_ptr< get_stream > > get( const protocol::get_request& req, const call_context& ctx ) = 0;

  virtual result< protocol::delete_response > remove( const protocol::delete_request& req, const call_context& ctx ) = 0;
  virtual result< protocol::head_response > head( const protocol::head_request& req, const call_context& ctx )       = 0;
  virtual result< protocol::search_response > search( const protocol::search_request& req,
                                                      const call_context& ctx )                                     = 0;
  virtual result< protocol::range_response > get_range( const protocol::range_request& req,
                                                        const call_context& ctx )                                   = 0;
  virtual result< protocol::range_hash_response > get_range_hash( const protocol::range_hash_request& req,
                                                                  const call_context& ctx )                         = 0;
};

class session_service
{
public:
  virtual ~session_service() = default;

  virtual result< std::unique_ptr< session_stream > > create( const call_context& ctx ) = 0;
};

} // namespace tessera::net
