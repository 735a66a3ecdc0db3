#include <tessera/crypto/tz.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>

namespace tessera::crypto::tz {

namespace {

using detail::gf127;
using detail::sl2;

constexpr unsigned int field_degree    = 127;
constexpr std::uint64_t hi_mask        = ~( std::uint64_t( 1 ) << 63 );
constexpr std::uint64_t reduction_bits = std::uint64_t( 1 ) | ( std::uint64_t( 1 ) << 63 );
constexpr unsigned int bits_per_byte   = 8;

gf127 add( const gf127& x, const gf127& y ) noexcept
{
  return { x.lo ^ y.lo, x.hi ^ y.hi };
}

gf127 mul_x( const gf127& x ) noexcept
{
  gf127 r;
  r.hi = ( ( x.hi << 1 ) | ( x.lo >> 63 ) ) & hi_mask;
  r.lo = x.lo << 1;

  // x^127 = x^63 + 1
  if( x.hi >> 62 & 1 )
    r.lo ^= reduction_bits;

  return r;
}

bool bit( const gf127& x, unsigned int i ) noexcept
{
  return i < 64 ? ( x.lo >> i & 1 ) : ( x.hi >> ( i - 64 ) & 1 );
}

gf127 mul( const gf127& x, const gf127& y ) noexcept
{
  gf127 r;
  for( unsigned int i = field_degree; i-- > 0; )
  {
    r = mul_x( r );
    if( bit( y, i ) )
      r = add( r, x );
  }
  return r;
}

sl2 mul( const sl2& m, const sl2& n ) noexcept
{
  sl2 r;
  r.a = add( mul( m.a, n.a ), mul( m.b, n.c ) );
  r.b = add( mul( m.a, n.b ), mul( m.b, n.d ) );
  r.c = add( mul( m.c, n.a ), mul( m.d, n.c ) );
  r.d = add( mul( m.c, n.b ), mul( m.d, n.d ) );
  return r;
}

// Right multiplication by A = [[x, 1], [1, 0]] or B = [[x, x + 1], [1, 1]]
void absorb_bit( sl2& m, bool one ) noexcept
{
  auto ax = mul_x( m.a );
  auto cx = mul_x( m.c );

  if( one )
  {
    auto b = add( add( ax, m.a ), m.b );
    auto d = add( add( cx, m.c ), m.d );
    m.a    = add( ax, m.b );
    m.c    = add( cx, m.d );
    m.b    = b;
    m.d    = d;
  }
  else
  {
    auto a = add( ax, m.b );
    auto c = add( cx, m.d );
    m.b    = m.a;
    m.d    = m.c;
    m.a    = a;
    m.c    = c;
  }
}

void store( const gf127& x, std::byte* out ) noexcept
{
  auto hi = boost::endian::native_to_big( x.hi );
  auto lo = boost::endian::native_to_big( x.lo );
  std::memcpy( out, &hi, sizeof( hi ) );
  std::memcpy( out + sizeof( hi ), &lo, sizeof( lo ) );
}

bool load( const std::byte* in, gf127& x ) noexcept
{
  std::memcpy( &x.hi, in, sizeof( x.hi ) );
  std::memcpy( &x.lo, in + sizeof( x.hi ), sizeof( x.lo ) );
  boost::endian::big_to_native_inplace( x.hi );
  boost::endian::big_to_native_inplace( x.lo );
  return !( x.hi & ~hi_mask );
}

digest encode( const sl2& m ) noexcept
{
  digest out{};
  store( m.a, out.data() );
  store( m.b, out.data() + element_length );
  store( m.c, out.data() + 2 * element_length );
  store( m.d, out.data() + 3 * element_length );
  return out;
}

bool decode( const digest& in, sl2& m ) noexcept
{
  return load( in.data(), m.a ) && load( in.data() + element_length, m.b )
         && load( in.data() + 2 * element_length, m.c ) && load( in.data() + 3 * element_length, m.d );
}

} // namespace

void hasher::absorb( std::span< const std::byte > data ) noexcept
{
  for( auto byte: data )
  {
    auto value = std::to_integer< unsigned int >( byte );
    for( unsigned int i = bits_per_byte; i-- > 0; )
      absorb_bit( _state, value >> i & 1 );
  }

  _size += data.size();
}

digest hasher::finalize() const noexcept
{
  return encode( _state );
}

void hasher::reset() noexcept
{
  _state = sl2{};
  _size  = 0;
}

std::uint64_t hasher::size() const noexcept
{
  return _size;
}

digest sum( std::span< const std::byte > data ) noexcept
{
  hasher h;
  h.absorb( data );
  return h.finalize();
}

result< digest > concat( std::span< const digest > digests ) noexcept
{
  if( digests.empty() )
    return std::unexpected( crypto_errc::empty_concat );

  sl2 product;
  if( !decode( digests.front(), product ) )
    return std::unexpected( crypto_errc::invalid_digest );

  for( const auto& d: digests.subspan( 1 ) )
  {
    sl2 m;
    if( !decode( d, m ) )
      return std::unexpected( crypto_errc::invalid_digest );

    product = mul( product, m );
  }

  return encode( product );
}

std::vector< std::byte > salt_xor( std::span< const std::byte > data, std::span< const std::byte > salt )
{
  std::vector< std::byte > out( data.begin(), data.end() );
  if( salt.empty() )
    return out;

  for( std::size_t i = 0; i < out.size(); ++i )
    out[ i ] ^= salt[ i % salt.size() ];

  return out;
}

} // namespace tessera::crypto::tz
