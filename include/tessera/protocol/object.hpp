#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include <boost/serialization/vector.hpp>

#include <tessera/crypto/tz.hpp>
#include <tessera/encode/archive.hpp>
#include <tessera/object.hpp>
#include <tessera/refs.hpp>
#include <tessera/session/token.hpp>

namespace tessera::protocol {

constexpr std::uint32_t default_ttl = 2;

struct chunk
{
  std::vector< std::byte > data;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & data;
  }
};

// Header frame of a put; the object carries no payload
struct put_header
{
  object::object object;
  session::token token;
  std::uint32_t ttl = default_ttl;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & object;
    ar & token;
    ar & ttl;
  }
};

using put_request = std::variant< put_header, chunk >;

struct put_response
{
  refs::address address;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & address;
  }
};

struct get_request
{
  refs::address address;
  std::uint32_t ttl = default_ttl;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & address;
    ar & ttl;
  }
};

// The first frame of a get carries the object, every later frame a chunk
using get_response = std::variant< object::object, chunk >;

struct delete_request
{
  refs::address address;
  refs::owner_id owner_id;
  session::token token;
  std::uint32_t ttl = default_ttl;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & address;
    ar & owner_id;
    ar & token;
    ar & ttl;
  }
};

struct delete_response
{
  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {}
};

struct head_request
{
  refs::address address;
  bool full_headers = false;
  std::uint32_t ttl = default_ttl;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & address;
    ar & full_headers;
    ar & ttl;
  }
};

struct head_response
{
  object::object object;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & object;
  }
};

struct search_request
{
  refs::container_id container_id;
  object::query query;
  std::uint32_t ttl = default_ttl;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & container_id;
    ar & query;
    ar & ttl;
  }
};

struct search_response
{
  std::vector< refs::address > addresses;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & addresses;
  }
};

struct range_request
{
  refs::address address;
  std::vector< object::range > ranges;
  std::uint32_t ttl = default_ttl;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & address;
    ar & ranges;
    ar & ttl;
  }
};

struct range_response
{
  std::vector< std::vector< std::byte > > fragments;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & fragments;
  }
};

struct range_hash_request
{
  refs::address address;
  std::vector< object::range > ranges;
  std::vector< std::byte > salt;
  std::uint32_t ttl = default_ttl;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & address;
    ar & ranges;
    ar & salt;
    ar & ttl;
  }
};

struct range_hash_response
{
  std::vector< crypto::tz::digest > hashes;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & hashes;
  }
};

} // namespace tessera::protocol
