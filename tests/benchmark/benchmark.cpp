// NOLINTBEGIN

#include <benchmark/benchmark.h>
#include <cstdlib>
#include <memory>

#include <tessera/log.hpp>
#include <test/fixture.hpp>

static std::unique_ptr< test::fixture > fixture;

static std::vector< std::byte > payload;
static tessera::crypto::secret_key alice_secret_key;

constexpr auto min_warmup_time = 1;
constexpr auto min_time        = 5;

static void tz_sum( benchmark::State& state )
{
  for( auto _: state )
  {
    auto digest = tessera::crypto::tz::sum( std::span( payload ).first( state.range( 0 ) ) );
    benchmark::DoNotOptimize( digest );
  }

  state.SetBytesProcessed( std::int64_t( state.iterations() ) * state.range( 0 ) );
}

BENCHMARK( tz_sum )->RangeMultiplier( 16 )->Range( 1'024, 4 * test::mebibyte )->MinWarmUpTime( min_warmup_time );

static void negotiations( benchmark::State& state )
{
  for( auto _: state )
  {
    [[maybe_unused]]
    auto token = fixture->negotiate( alice_secret_key, { tessera::refs::object_id::generate() } );
  }

  state.counters[ "negotiations" ] = benchmark::Counter( double( state.iterations() ), benchmark::Counter::kIsRate );

  state.counters[ "negotiation_time" ] =
    benchmark::Counter( double( state.iterations() ), benchmark::Counter::kIsRate | benchmark::Counter::kInvert );
}

BENCHMARK( negotiations )->UseRealTime()->MinWarmUpTime( min_warmup_time )->MinTime( min_time );

static void uploads( benchmark::State& state )
{
  auto client = fixture->make_client( alice_secret_key );

  for( auto _: state )
  {
    tessera::io::memory_source src( payload );

    [[maybe_unused]]
    auto receipt = client.put( fixture->_container, src );
  }

  state.SetBytesProcessed( std::int64_t( state.iterations() ) * std::int64_t( payload.size() ) );
}

// Every upload stays in the node, so the iteration count bounds memory
constexpr auto upload_iterations = 32;

BENCHMARK( uploads )->UseRealTime()->Iterations( upload_iterations );

int main( int argc, char** argv )
{
  fixture          = std::make_unique< test::fixture >( "benchmark", "info" );
  payload          = fixture->make_payload( 4 * test::mebibyte );
  alice_secret_key = tessera::crypto::secret_key::create( tessera::crypto::hash( "alice" ) );

  ::benchmark::Initialize( &argc, argv );
  ::benchmark::RunSpecifiedBenchmarks();
  ::benchmark::Shutdown();
  fixture = nullptr;
  return EXIT_SUCCESS;
}

// NOLINTEND
