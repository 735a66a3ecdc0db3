#pragma once

#include <array>
#include <cstring>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tessera::memory {

template< typename T, typename U >
  requires( std::is_same_v< T, void* >
            || (std::is_pointer_v< T > && std::is_trivially_copyable_v< std::remove_pointer_t< T > >))
T pointer_cast( U* p )
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

template< std::ranges::range T >
std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( t ) );
}

template< typename T, std::size_t N >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const std::array< T, N >& a )
{
  return std::as_bytes( std::span< const T, std::dynamic_extent >( a.data(), a.size() ) );
}

inline std::span< const std::byte > as_bytes( const std::string& s )
{
  return std::as_bytes( std::span( s ) );
}

inline std::span< const std::byte > as_bytes( const std::string_view& sv )
{
  return std::as_bytes( std::span( sv ) );
}

template< typename T >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const T* ptr, std::size_t len )
{
  return std::as_bytes( std::span( ptr, len ) );
}

inline std::vector< std::byte > to_vector( std::span< const std::byte > bytes )
{
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

template< std::size_t N >
inline std::array< std::byte, N > to_array( std::span< const std::byte > bytes )
{
  if( bytes.size() != N )
    throw std::runtime_error( "byte span has unexpected length" );

  std::array< std::byte, N > a{};
  std::memcpy( a.data(), bytes.data(), N );
  return a;
}

inline std::string_view as_string_view( std::span< const std::byte > bytes ) noexcept
{
  return std::string_view( pointer_cast< const char* >( bytes.data() ), bytes.size() );
}

} // namespace tessera::memory
