#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <boost/serialization/string.hpp>

#include <tessera/net/error.hpp>

namespace tessera::net {

/*
 * Wire frame:
 *   [u32 big endian payload length][u8 kind][u8 method][payload]
 */
enum class frame_kind : std::uint8_t
{
  open = 0,
  message,
  close_send,
  end,
  status
};

enum class method : std::uint8_t
{
  put = 0,
  get,
  remove,
  head,
  search,
  get_range,
  get_range_hash,
  session_create
};

constexpr std::size_t frame_header_length = 6;
constexpr std::size_t max_frame_size      = 16 * 1'024 * 1'024;

using frame_header_data = std::array< std::byte, frame_header_length >;

struct frame_header
{
  frame_kind kind      = frame_kind::open;
  net::method method   = method::put;
  std::uint32_t length = 0;
};

struct frame
{
  frame_kind kind    = frame_kind::open;
  net::method method = method::put;
  std::vector< std::byte > payload;
};

// Payload of a status frame
struct status
{
  std::uint32_t code = 0;
  std::string message;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & code;
    ar & message;
  }
};

result< std::vector< std::byte > > encode_frame( const frame& f );
result< frame_header > decode_frame_header( std::span< const std::byte > header ) noexcept;

const char* to_string( frame_kind kind ) noexcept;
const char* to_string( net::method m ) noexcept;

} // namespace tessera::net
