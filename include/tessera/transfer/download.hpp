#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include <tessera/crypto/tz.hpp>
#include <tessera/io/sink.hpp>
#include <tessera/net/context.hpp>
#include <tessera/net/service.hpp>
#include <tessera/object/object.hpp>
#include <tessera/protocol/object.hpp>
#include <tessera/transfer/error.hpp>

namespace tessera::transfer {

enum class download_state : std::uint8_t
{
  idle,
  awaiting_first,
  receiving,
  done,
  removed,
  failed
};

const char* to_string( download_state s ) noexcept;

enum class download_outcome : std::uint8_t
{
  fetched,
  removed
};

/*
 * Chunked get of one object.
 *
 *   idle --open--> awaiting_first --receive--> receiving --> done
 *                                          \-> removed
 *
 * The first frame carries the whole object header; the remote end never
 * splits it across frames. A tombstoned object is verified and reported
 * as removed without touching the sink. Payload frames are written in
 * arrival order; on error the sink keeps whatever was written.
 */
class download
{
public:
  explicit download( net::object_service& service ) noexcept;
  download( const download& )            = delete;
  download( download&& )                 = delete;
  download& operator=( const download& ) = delete;
  download& operator=( download&& )      = delete;
  ~download();

  result< void > open( const refs::address& addr, std::uint32_t ttl, const net::call_context& ctx );
  result< download_outcome > receive( io::sink& sink );

  download_state state() const noexcept;
  const std::optional< object::object >& header() const noexcept;
  std::uint64_t bytes_received() const noexcept;
  std::size_t chunks_received() const noexcept;
  crypto::tz::digest payload_digest() const noexcept;

private:
  std::error_code fail( std::error_code ec ) noexcept;
  result< void > append( io::sink& sink, std::span< const std::byte > bytes );
  result< download_outcome > finish_removed();

  net::object_service& _service;
  std::unique_ptr< net::get_stream > _stream;
  std::optional< refs::address > _address;
  std::optional< object::object > _header;
  crypto::tz::hasher _hasher;
  download_state _state         = download_state::idle;
  std::uint64_t _bytes_received = 0;
  std::size_t _chunks_received  = 0;
};

} // namespace tessera::transfer
