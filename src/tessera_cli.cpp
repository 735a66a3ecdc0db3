#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/program_options.hpp>

#include <tessera/client.hpp>
#include <tessera/crypto.hpp>
#include <tessera/encode.hpp>
#include <tessera/log.hpp>
#include <tessera/memory.hpp>
#include <tessera/net.hpp>
#include <tessera/object.hpp>
#include <tessera/refs.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option         = "help,h"s;
constexpr auto version_option      = "version,v"s;
constexpr auto config_option       = "config,c"s;
constexpr auto host_option         = "host"s;
constexpr auto key_option          = "key,k"s;
constexpr auto tls_option          = "tls"s;
constexpr auto tls_default         = false;
constexpr auto ca_option           = "ca"s;
constexpr auto ttl_option          = "ttl"s;
constexpr auto timeout_option      = "timeout"s;
constexpr auto timeout_default     = 0u;
constexpr auto chunk_size_option   = "chunk-size"s;
constexpr auto log_level_option    = "log-level,l"s;
constexpr auto log_level_default   = "info"s;
constexpr auto command_option      = "command"s;
constexpr auto arguments_option    = "arguments"s;
constexpr auto cid_option          = "cid"s;
constexpr auto oid_option          = "oid"s;
constexpr auto file_option         = "file,f"s;
constexpr auto user_option         = "user,u"s;
constexpr auto verify_option       = "verify"s;
constexpr auto full_headers_option = "full-headers"s;
constexpr auto root_option         = "root"s;
constexpr auto sg_option           = "sg"s;
constexpr auto salt_option         = "salt"s;
constexpr auto ranges_option       = "range"s;

} // namespace constants

using namespace tessera;

namespace {

namespace po = boost::program_options;

struct command_context
{
  tessera::client::client& client;
  const net::channel& channel;
  std::vector< std::string > arguments;
};

void report( const std::string& what, const std::error_code& ec )
{
  LOG_ERROR( tessera::log::instance(), "{}: {} ({})", what, ec.message(), ec.category().name() );
}

// Failures of remote calls, with the service's own message on rejection
void report( const command_context& ctx, const std::string& what, const std::error_code& ec )
{
  const auto& rejection = ctx.channel.last_rejection();
  if( ec != error_kind::remote_rejection || !rejection )
  {
    report( what, ec );
    return;
  }

  LOG_ERROR( tessera::log::instance(),
             "{}: {} ({}): {}",
             what,
             ctx.channel.options().host,
             static_cast< std::uint32_t >( rejection->code ),
             rejection->message.empty() ? ec.message() : rejection->message );
}

po::variables_map parse_arguments( const po::options_description& options,
                                   const std::vector< std::string >& arguments,
                                   const po::positional_options_description& positional = {} )
{
  po::variables_map args;
  po::store( po::command_line_parser( arguments ).options( options ).positional( positional ).run(), args );
  po::notify( args );
  return args;
}

std::optional< refs::address > parse_target( const po::variables_map& args )
{
  auto cid = refs::parse_container_id( args[ constants::cid_option ].as< std::string >() );
  if( !cid )
  {
    report( "Invalid container id", cid.error() );
    return std::nullopt;
  }

  auto oid = refs::parse_object_id( args[ constants::oid_option ].as< std::string >() );
  if( !oid )
  {
    report( "Invalid object id", oid.error() );
    return std::nullopt;
  }

  return refs::address( *cid, *oid );
}

int put_command( command_context& ctx )
{
  po::options_description options( "put" );

  // clang-format off
  options.add_options()
    ( constants::cid_option.c_str()   , po::value< std::string >()->required(), "Container to put the objects into" )
    ( constants::file_option.c_str()  , po::value< std::vector< std::string > >()->required(), "Files to upload, one object per file" )
    ( constants::user_option.c_str()  , po::value< std::vector< std::string > >()->default_value( {}, "" ), "User headers as key=value" )
    ( constants::verify_option.c_str(), po::bool_switch(), "Verify the stored payload after upload" );
  // clang-format on

  auto args = parse_arguments( options, ctx.arguments );

  auto cid = refs::parse_container_id( args[ constants::cid_option ].as< std::string >() );
  if( !cid )
  {
    report( "Invalid container id", cid.error() );
    return EXIT_FAILURE;
  }

  auto user_headers = object::parse_user_headers( args[ "user" ].as< std::vector< std::string > >() );
  if( !user_headers )
  {
    report( "Invalid user header", user_headers.error() );
    return EXIT_FAILURE;
  }

  bool verify = args[ constants::verify_option ].as< bool >();

  for( const auto& path: args[ "file" ].as< std::vector< std::string > >() )
  {
    auto source = io::file_source::open( path );
    if( !source )
    {
      report( "Unable to read " + path, source.error() );
      return EXIT_FAILURE;
    }

    auto receipt = ctx.client.put( *cid, **source, *user_headers, verify );
    if( !receipt )
    {
      report( ctx, "Unable to put " + path, receipt.error() );
      return EXIT_FAILURE;
    }

    std::cout << "[" << path << "] Object successfully stored\n";
    std::cout << "  ID: " << refs::to_string( receipt->address.object() ) << "\n";
    std::cout << "  CID: " << refs::to_string( receipt->address.container() ) << "\n";

    if( receipt->verification )
    {
      if( !*receipt->verification )
        std::cout << "  Verification: " << receipt->verification->error().message() << "\n";
      else if( ( *receipt->verification )->matches_local.value_or( false ) )
        std::cout << "  Verification: success\n";
      else
        std::cout << "  Verification: payload hash mismatch\n";
    }
  }

  return EXIT_SUCCESS;
}

int get_command( command_context& ctx )
{
  po::options_description options( "get" );

  // clang-format off
  options.add_options()
    ( constants::cid_option.c_str() , po::value< std::string >()->required(), "Container of the object" )
    ( constants::oid_option.c_str() , po::value< std::string >()->required(), "Object to fetch" )
    ( constants::file_option.c_str(), po::value< std::string >()->required(), "Destination file" );
  // clang-format on

  auto args   = parse_arguments( options, ctx.arguments );
  auto target = parse_target( args );
  if( !target )
    return EXIT_FAILURE;

  auto path = args[ "file" ].as< std::string >();
  io::deferred_file_sink sink( path );

  auto outcome = ctx.client.get( *target, sink );
  if( !outcome )
  {
    report( ctx, "Unable to get " + refs::to_string( *target ), outcome.error() );
    return EXIT_FAILURE;
  }

  if( *outcome == transfer::download_outcome::removed )
  {
    std::cout << "Object " << refs::to_string( *target ) << " was removed\n";
    return EXIT_SUCCESS;
  }

  if( auto finished = sink.finish(); !finished )
  {
    report( "Unable to write " + path, finished.error() );
    return EXIT_FAILURE;
  }

  std::cout << "Object " << refs::to_string( *target ) << " written to " << path << "\n";
  return EXIT_SUCCESS;
}

int delete_command( command_context& ctx )
{
  po::options_description options( "delete" );

  // clang-format off
  options.add_options()
    ( constants::cid_option.c_str(), po::value< std::string >()->required(), "Container of the object" )
    ( constants::oid_option.c_str(), po::value< std::string >()->required(), "Object to delete" );
  // clang-format on

  auto args   = parse_arguments( options, ctx.arguments );
  auto target = parse_target( args );
  if( !target )
    return EXIT_FAILURE;

  if( auto removed = ctx.client.remove( *target ); !removed )
  {
    report( ctx, "Unable to delete " + refs::to_string( *target ), removed.error() );
    return EXIT_FAILURE;
  }

  std::cout << "Request for object deletion was sent\n";
  return EXIT_SUCCESS;
}

std::string describe( const object::header& h )
{
  return std::visit(
    []( const auto& value ) -> std::string
    {
      using T = std::decay_t< decltype( value ) >;
      if constexpr( std::is_same_v< T, object::user_header > )
        return "user header: " + value.key + "=" + value.value;
      else if constexpr( std::is_same_v< T, object::tombstone > )
        return "tombstone at epoch " + std::to_string( value.epoch );
      else if constexpr( std::is_same_v< T, object::storage_group > )
        return "storage group";
      else if constexpr( std::is_same_v< T, object::root_marker > )
        return "root object";
      else if constexpr( std::is_same_v< T, object::verification_header > )
        return "verification key: " + encode::to_hex( memory::as_bytes( value.public_key ) );
      else
        return "integrity checksum: " + encode::to_hex( memory::as_bytes( value.headers_checksum ) );
    },
    h );
}

int head_command( command_context& ctx )
{
  po::options_description options( "head" );

  // clang-format off
  options.add_options()
    ( constants::cid_option.c_str()         , po::value< std::string >()->required(), "Container of the object" )
    ( constants::oid_option.c_str()         , po::value< std::string >()->required(), "Object to inspect" )
    ( constants::full_headers_option.c_str(), po::bool_switch(), "Include every header" );
  // clang-format on

  auto args   = parse_arguments( options, ctx.arguments );
  auto target = parse_target( args );
  if( !target )
    return EXIT_FAILURE;

  auto obj = ctx.client.head( *target, args[ constants::full_headers_option ].as< bool >() );
  if( !obj )
  {
    report( ctx, "Unable to head " + refs::to_string( *target ), obj.error() );
    return EXIT_FAILURE;
  }

  std::cout << "System headers:\n";
  std::cout << "  Object ID   : " << refs::to_string( obj->system.id ) << "\n";
  std::cout << "  Owner ID    : " << refs::to_string( obj->system.owner_id ) << "\n";
  std::cout << "  Container ID: " << refs::to_string( obj->system.container_id ) << "\n";
  std::cout << "  Payload Size: " << obj->system.payload_length << "\n";
  std::cout << "  Version     : " << obj->system.version << "\n";
  std::cout << "  Created at  : epoch #" << obj->system.created_at.epoch << ", unix time "
            << obj->system.created_at.unix_time << "\n";

  if( !obj->headers.empty() )
  {
    std::cout << "Other headers:\n";
    for( const auto& h: obj->headers )
      std::cout << "  " << describe( h ) << "\n";
  }

  return EXIT_SUCCESS;
}

int search_command( command_context& ctx )
{
  po::options_description options( "search" );

  // clang-format off
  options.add_options()
    ( constants::cid_option.c_str() , po::value< std::string >()->required(), "Container to search" )
    ( constants::root_option.c_str(), po::bool_switch(), "Only root objects" )
    ( constants::sg_option.c_str()  , po::bool_switch(), "Only storage groups" )
    ( "filters"                     , po::value< std::vector< std::string > >()->default_value( {}, "" ), "Header name value pairs" );
  // clang-format on

  po::positional_options_description positional;
  positional.add( "filters", -1 );

  auto args = parse_arguments( options, ctx.arguments, positional );

  auto cid = refs::parse_container_id( args[ constants::cid_option ].as< std::string >() );
  if( !cid )
  {
    report( "Invalid container id", cid.error() );
    return EXIT_FAILURE;
  }

  auto q = object::make_query( args[ "filters" ].as< std::vector< std::string > >(),
                               args[ constants::root_option ].as< bool >(),
                               args[ constants::sg_option ].as< bool >() );
  if( !q )
  {
    report( "Invalid query", q.error() );
    return EXIT_FAILURE;
  }

  auto addresses = ctx.client.search( *cid, *q );
  if( !addresses )
  {
    report( ctx, "Search failed", addresses.error() );
    return EXIT_FAILURE;
  }

  std::cout << "Container ID: Object ID\n";
  for( const auto& addr: *addresses )
    std::cout << refs::to_string( addr.container() ) << ": " << refs::to_string( addr.object() ) << "\n";

  return EXIT_SUCCESS;
}

int get_range_command( command_context& ctx )
{
  po::options_description options( "get-range" );

  // clang-format off
  options.add_options()
    ( constants::cid_option.c_str()   , po::value< std::string >()->required(), "Container of the object" )
    ( constants::oid_option.c_str()   , po::value< std::string >()->required(), "Object to read" )
    ( constants::ranges_option.c_str(), po::value< std::vector< std::string > >()->required(), "Ranges as offset:length" );
  // clang-format on

  po::positional_options_description positional;
  positional.add( constants::ranges_option.c_str(), -1 );

  auto args   = parse_arguments( options, ctx.arguments, positional );
  auto target = parse_target( args );
  if( !target )
    return EXIT_FAILURE;

  auto ranges = object::parse_ranges( args[ constants::ranges_option ].as< std::vector< std::string > >() );
  if( !ranges )
  {
    report( "Invalid range", ranges.error() );
    return EXIT_FAILURE;
  }

  auto fragments = ctx.client.get_range( *target, *ranges );
  if( !fragments )
  {
    report( ctx, "Unable to get ranges of " + refs::to_string( *target ), fragments.error() );
    return EXIT_FAILURE;
  }

  for( std::size_t i = 0; i < ranges->size(); ++i )
  {
    auto text = memory::as_string_view( ( *fragments )[ i ] );
    std::cout << "Offset=" << ( *ranges )[ i ].offset << " (Length=" << ( *ranges )[ i ].length << ")\t: " << text
              << "\n";
  }

  return EXIT_SUCCESS;
}

int get_range_hash_command( command_context& ctx )
{
  po::options_description options( "get-range-hash" );

  // clang-format off
  options.add_options()
    ( constants::cid_option.c_str()   , po::value< std::string >()->required(), "Container of the object" )
    ( constants::oid_option.c_str()   , po::value< std::string >()->required(), "Object to hash" )
    ( constants::salt_option.c_str()  , po::value< std::string >()->default_value( "" ), "Hex encoded salt" )
    ( constants::file_option.c_str()  , po::value< std::string >(), "Local copy to compare with" )
    ( constants::ranges_option.c_str(), po::value< std::vector< std::string > >()->required(), "Ranges as offset:length" );
  // clang-format on

  po::positional_options_description positional;
  positional.add( constants::ranges_option.c_str(), -1 );

  auto args   = parse_arguments( options, ctx.arguments, positional );
  auto target = parse_target( args );
  if( !target )
    return EXIT_FAILURE;

  auto ranges = object::parse_ranges( args[ constants::ranges_option ].as< std::vector< std::string > >() );
  if( !ranges )
  {
    report( "Invalid range", ranges.error() );
    return EXIT_FAILURE;
  }

  auto salt = encode::from_hex( args[ constants::salt_option ].as< std::string >() );
  if( !salt )
  {
    report( "Invalid salt", salt.error() );
    return EXIT_FAILURE;
  }

  std::unique_ptr< io::file_source > local;
  if( args.count( "file" ) )
  {
    auto opened = io::file_source::open( args[ "file" ].as< std::string >() );
    if( !opened )
    {
      report( "Unable to read the local copy", opened.error() );
      return EXIT_FAILURE;
    }

    local = std::move( *opened );
  }

  auto checks = ctx.client.get_range_hash( *target, *ranges, *salt, local.get() );
  if( !checks )
  {
    report( ctx, "Unable to get range hashes of " + refs::to_string( *target ), checks.error() );
    return EXIT_FAILURE;
  }

  for( const auto& check: *checks )
  {
    std::cout << "Offset=" << check.range.offset << " (Length=" << check.range.length
              << ")\t: " << encode::to_hex( memory::as_bytes( check.digest ), false );

    if( check.matches_local )
      std::cout << ( *check.matches_local ? "\tmatches local copy" : "\tdiffers from local copy" );

    std::cout << "\n";
  }

  return EXIT_SUCCESS;
}

std::optional< crypto::secret_key > load_key( const std::string& seed_hex )
{
  auto seed = encode::from_hex( seed_hex );
  if( !seed )
  {
    LOG_ERROR( tessera::log::instance(), "Invalid key: {}", seed.error().message() );
    return std::nullopt;
  }

  auto key = crypto::secret_key::from_seed( *seed );
  if( !key )
  {
    LOG_ERROR( tessera::log::instance(), "The key must be a {} byte hex encoded seed", crypto::digest_length );
    return std::nullopt;
  }

  return std::move( *key );
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  try
  {
    po::options_description options( "Options" );

    // clang-format off
    options.add_options()
      ( constants::help_option.c_str()      , "Print this help message and exit" )
      ( constants::version_option.c_str()   , "Print version string and exit" )
      ( constants::config_option.c_str()    , po::value< std::string >(), "Read options from an INI file" )
      ( constants::host_option.c_str()      , po::value< std::string >(), "Storage node as <host>:<port>" )
      ( constants::key_option.c_str()       , po::value< std::string >(), "Hex encoded 32 byte key seed" )
      ( constants::tls_option.c_str()       , po::value< bool >()->default_value( constants::tls_default ), "Connect over TLS" )
      ( constants::ca_option.c_str()        , po::value< std::string >()->default_value( "" ), "CA bundle to verify the node against" )
      ( constants::ttl_option.c_str()       , po::value< std::uint32_t >()->default_value( protocol::default_ttl ), "Request TTL" )
      ( constants::timeout_option.c_str()   , po::value< unsigned >()->default_value( constants::timeout_default ), "Operation timeout in milliseconds, 0 for none" )
      ( constants::chunk_size_option.c_str(), po::value< std::size_t >()->default_value( transfer::default_chunk_size ), "Payload chunk size in bytes" )
      ( constants::log_level_option.c_str() , po::value< std::string >()->default_value( constants::log_level_default ), "The log filtering level" )
      ( constants::command_option.c_str()   , po::value< std::string >(), "put, get, delete, head, search, get-range or get-range-hash" )
      ( constants::arguments_option.c_str() , po::value< std::vector< std::string > >(), "Command arguments" );
    // clang-format on

    po::positional_options_description positional;
    positional.add( constants::command_option.c_str(), 1 );
    positional.add( constants::arguments_option.c_str(), -1 );

    auto parsed =
      po::command_line_parser( argc, argv ).options( options ).positional( positional ).allow_unregistered().run();

    po::variables_map args;
    po::store( parsed, args );

    if( args.count( "config" ) )
    {
      std::ifstream config_file( args[ "config" ].as< std::string >() );
      if( !config_file )
      {
        std::cerr << "Unable to open config file " << args[ "config" ].as< std::string >() << "\n";
        return EXIT_FAILURE;
      }

      po::store( po::parse_config_file( config_file, options, true ), args );
    }

    po::notify( args );

    if( args.count( "version" ) )
    {
      std::cout << "v0.0.1\n";
      return EXIT_SUCCESS;
    }

    if( args.count( "help" ) || !args.count( constants::command_option ) )
    {
      std::cout << "Usage: tessera-cli [options] <command> [command options]\n";
      options.print( std::cout );
      return args.count( "help" ) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    tessera::log::initialize( args[ "log-level" ].as< std::string >() );

    auto command = args[ constants::command_option ].as< std::string >();

    std::vector< std::string > arguments = po::collect_unrecognized( parsed.options, po::include_positional );
    if( !arguments.empty() && arguments.front() == command )
      arguments.erase( arguments.begin() );

    if( !args.count( constants::host_option ) || !args.count( "key" ) )
    {
      LOG_ERROR( tessera::log::instance(), "Both --host and --key are required" );
      return EXIT_FAILURE;
    }

    const auto endpoint  = args[ constants::host_option ].as< std::string >();
    const auto colon_pos = endpoint.rfind( ':' );
    if( colon_pos == std::string::npos )
    {
      LOG_ERROR( tessera::log::instance(), "Invalid host format. Expected: <host>:<port> (e.g., localhost:8080)" );
      return EXIT_FAILURE;
    }

    auto key = load_key( args[ "key" ].as< std::string >() );
    if( !key )
      return EXIT_FAILURE;

    client::config cfg;
    cfg.chunk_size = args[ constants::chunk_size_option ].as< std::size_t >();
    cfg.ttl        = args[ constants::ttl_option ].as< std::uint32_t >();
    if( auto timeout = args[ constants::timeout_option ].as< unsigned >() )
      cfg.timeout = std::chrono::milliseconds( timeout );

    net::channel_options channel_options;
    channel_options.host    = endpoint.substr( 0, colon_pos );
    channel_options.port    = endpoint.substr( colon_pos + 1 );
    channel_options.tls     = args[ constants::tls_option ].as< bool >();
    channel_options.ca_path = args[ constants::ca_option ].as< std::string >();

    net::call_context connect_ctx = cfg.timeout ? net::call_context( *cfg.timeout ) : net::call_context();

    auto channel = net::channel::connect( channel_options, connect_ctx );
    if( !channel )
    {
      report( "Unable to connect to " + endpoint, channel.error() );
      return EXIT_FAILURE;
    }

    client::client c( **channel, **channel, *key, cfg );
    command_context ctx{ .client = c, .channel = **channel, .arguments = std::move( arguments ) };

    LOG_INFO( tessera::log::instance(), "Acting as owner {}", c.owner_id() );

    if( command == "put" )
      return put_command( ctx );
    if( command == "get" )
      return get_command( ctx );
    if( command == "delete" )
      return delete_command( ctx );
    if( command == "head" )
      return head_command( ctx );
    if( command == "search" )
      return search_command( ctx );
    if( command == "get-range" )
      return get_range_command( ctx );
    if( command == "get-range-hash" )
      return get_range_hash_command( ctx );

    LOG_ERROR( tessera::log::instance(), "Unknown command '{}'", command );
    return EXIT_FAILURE;
  }
  catch( const po::error& e )
  {
    std::cerr << "Invalid arguments: " << e.what() << "\n";
  }
  catch( const std::exception& e )
  {
    std::cerr << "Fatal error: " << e.what() << "\n";
  }

  return EXIT_FAILURE;
}
