#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <ranges>
#include <string_view>
#include <type_traits>

namespace tessera::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

// Incremental BLAKE3 hashing, one hasher per thread
void hasher_reset() noexcept;
digest hasher_finalize() noexcept;
void hasher_update( const void* ptr, std::size_t len = 0 ) noexcept;
void hasher_update( std::string_view sv ) noexcept;

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  hasher_update( &t, sizeof( T ) );
}

template< typename T, std::size_t N >
void hasher_update( const std::array< T, N >& a ) noexcept
{
  hasher_update( a.data(), sizeof( T ) * N );
}

template< std::ranges::contiguous_range Range >
  requires std::is_trivially_copyable_v< std::ranges::range_value_t< Range > >
void hasher_update( const Range& values ) noexcept
{
  hasher_update( std::ranges::data( values ), std::ranges::size( values ) * sizeof( std::ranges::range_value_t< Range > ) );
}

digest hash( const void* ptr, std::size_t len = 0 ) noexcept;
digest hash( std::string_view sv ) noexcept;

inline digest hash( const char* s ) noexcept
{
  return hash( std::string_view( s ) );
}

template< typename T, std::size_t N >
digest hash( const std::array< T, N >& a ) noexcept
{
  return hash( a.data(), sizeof( T ) * N );
}

template< std::ranges::contiguous_range Range >
  requires std::is_trivially_copyable_v< std::ranges::range_value_t< Range > >
digest hash( const Range& values ) noexcept
{
  return hash( std::ranges::data( values ), std::ranges::size( values ) * sizeof( std::ranges::range_value_t< Range > ) );
}

} // namespace tessera::crypto
