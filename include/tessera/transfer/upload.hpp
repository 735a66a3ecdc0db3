#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include <tessera/crypto/tz.hpp>
#include <tessera/io/source.hpp>
#include <tessera/net/context.hpp>
#include <tessera/net/service.hpp>
#include <tessera/object/object.hpp>
#include <tessera/protocol/object.hpp>
#include <tessera/session/token.hpp>
#include <tessera/transfer/error.hpp>

namespace tessera::transfer {

constexpr std::size_t default_chunk_size = 3 * 1'024 * 1'024;

enum class upload_state : std::uint8_t
{
  idle,
  header_sent,
  streaming,
  closed,
  failed
};

const char* to_string( upload_state s ) noexcept;

/*
 * Chunked put of one object.
 *
 *   idle --send_header--> header_sent --stream--> streaming --close--> closed
 *
 * Every payload byte sent is absorbed by the upload's own hasher so the
 * remote copy can be checked against payload_digest() afterwards. Any
 * failure cancels the stream and leaves the upload in failed.
 */
class upload
{
public:
  explicit upload( net::object_service& service, std::size_t chunk_size = default_chunk_size ) noexcept;
  upload( const upload& )            = delete;
  upload( upload&& )                 = delete;
  upload& operator=( const upload& ) = delete;
  upload& operator=( upload&& )      = delete;
  ~upload();

  result< void > send_header( const object::object& obj,
                              const session::token& token,
                              std::uint32_t ttl,
                              const net::call_context& ctx );
  result< void > stream( io::source& src );
  result< refs::address > close();

  upload_state state() const noexcept;
  std::uint64_t payload_length() const noexcept;
  std::uint64_t bytes_sent() const noexcept;
  std::size_t chunks_sent() const noexcept;
  crypto::tz::digest payload_digest() const noexcept;

private:
  std::error_code fail( std::error_code ec ) noexcept;

  net::object_service& _service;
  std::size_t _chunk_size;
  std::unique_ptr< net::put_stream > _stream;
  std::optional< refs::address > _address;
  crypto::tz::hasher _hasher;
  upload_state _state           = upload_state::idle;
  std::uint64_t _payload_length = 0;
  std::uint64_t _bytes_sent     = 0;
  std::size_t _chunks_sent      = 0;
};

} // namespace tessera::transfer
