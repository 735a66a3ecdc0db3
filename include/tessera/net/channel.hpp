#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <tessera/net/context.hpp>
#include <tessera/net/frame.hpp>
#include <tessera/net/service.hpp>

namespace tessera::net {

class call;

struct channel_options
{
  std::string host;
  std::string port;
  bool tls = false;
  bool verify_peer = true;
  std::string ca_path;
};

/*
 * A single connection to a storage node. Calls are multiplexed one at a
 * time: while a stream is open any other call fails with channel_busy.
 * Streams hold a reference to the channel and must not outlive it.
 */
class channel final: public object_service,
                     public session_service
{
public:
  channel( const channel& )            = delete;
  channel( channel&& )                 = delete;
  channel& operator=( const channel& ) = delete;
  channel& operator=( channel&& )      = delete;
  ~channel() override;

  static result< std::unique_ptr< channel > > connect( const channel_options& options, const call_context& ctx );

  result< std::unique_ptr< put_stream > > put( const call_context& ctx ) override;
  result< std::unique_ptr< get_stream > > get( const protocol::get_request& req, const call_context& ctx ) override;
  result< protocol::delete_response > remove( const protocol::delete_request& req, const call_context& ctx ) override;
  result< protocol::head_response > head( const protocol::head_request& req, const call_context& ctx ) override;
  result< protocol::search_response > search( const protocol::search_request& req,
                                              const call_context& ctx ) override;
  result< protocol::range_response > get_range( const protocol::range_request& req, const call_context& ctx ) override;
  result< protocol::range_hash_response > get_range_hash( const protocol::range_hash_request& req,
                                                          const call_context& ctx ) override;

  result< std::unique_ptr< session_stream > > create( const call_context& ctx ) override;

  bool connected() const noexcept;
  bool busy() const noexcept;
  void disconnect() noexcept;

  // Code and message of the status frame that rejected the latest call
  const std::optional< remote_status >& last_rejection() const noexcept;
  const channel_options& options() const noexcept;

private:
  friend class call;

  using tls_stream = boost::asio::ssl::stream< boost::asio::ip::tcp::socket >;
  using completion = std::function< void( const boost::system::error_code& ) >;

  explicit channel( channel_options options );

  result< void > open( const call_context& ctx );
  result< std::unique_ptr< call > > begin( net::method m, const call_context& ctx );

  template< typename Response, typename Request >
  result< Response > unary( net::method m, const Request& request, const call_context& ctx );

  result< void > write_frame( const frame& f, const call_context& ctx );
  result< frame > read_frame( const call_context& ctx );

  result< void > run( const call_context& ctx, net_errc failure, const std::function< void( completion ) >& initiate );
  void abort() noexcept;
  void release() noexcept;
  void reject( remote_status status );

  channel_options _options;
  boost::asio::io_context _io;
  boost::asio::ssl::context _context;
  std::unique_ptr< tls_stream > _stream;
  bool _connected = false;
  std::atomic< bool > _busy = false;
  std::optional< remote_status > _rejection;
  std::mutex _abort_mutex;
  bool _aborting = false;
};

} // namespace tessera::net
