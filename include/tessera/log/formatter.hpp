#pragma once

#include <span>
#include <stdexcept>
#include <type_traits>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <tessera/encode/base58.hpp>
#include <tessera/encode/hex.hpp>
#include <tessera/refs/address.hpp>

namespace tessera::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

struct base58_tag
{};

using base58 = quill::BinaryData< base58_tag >;

template< typename T1, typename T2 >
  requires std::is_integral_v< T1 > && std::is_integral_v< T2 >
struct percent
{
  T1 numerator;
  T2 denominator;
};

} // namespace tessera::log

template<>
struct fmtquill::formatter< tessera::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tessera::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tessera::log::hex >: quill::BinaryDataDeferredFormatCodec< tessera::log::hex >
{};

template<>
struct fmtquill::formatter< tessera::log::base58 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::base58& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tessera::encode::to_base58( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tessera::log::base58 >: quill::BinaryDataDeferredFormatCodec< tessera::log::base58 >
{};

template< typename T1, typename T2 >
struct fmtquill::formatter< tessera::log::percent< T1, T2 > >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::percent< T1, T2 >& p, format_context& ctx ) const
  {
    static constexpr auto one_hundred_percent = 100;

    if( !p.denominator )
      return fmtquill::format_to( ctx.out(), "100%" );

    auto percent = static_cast< double >( p.numerator ) / static_cast< double >( p.denominator ) * one_hundred_percent;
    return fmtquill::format_to( ctx.out(), "{:.1f}%", percent );
  }
};

template< typename T1, typename T2 >
struct quill::Codec< tessera::log::percent< T1, T2 > >: quill::DeferredFormatCodec< tessera::log::percent< T1, T2 > >
{};

// Identifiers log in their canonical text form
template< typename T >
  requires( std::is_same_v< T, tessera::refs::container_id > || std::is_same_v< T, tessera::refs::object_id >
            || std::is_same_v< T, tessera::refs::owner_id > || std::is_same_v< T, tessera::refs::address > )
struct fmtquill::formatter< T >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const T& id, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", tessera::refs::to_string( id ) );
  }
};

template< typename T >
  requires( std::is_same_v< T, tessera::refs::container_id > || std::is_same_v< T, tessera::refs::object_id >
            || std::is_same_v< T, tessera::refs::owner_id > || std::is_same_v< T, tessera::refs::address > )
struct quill::Codec< T >: quill::DeferredFormatCodec< T >
{};
