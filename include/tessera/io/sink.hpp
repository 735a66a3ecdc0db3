#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include <tessera/io/error.hpp>

namespace tessera::io {

// Sequential payload destination
class sink
{
public:
  virtual ~sink() = default;

  virtual result< void > write( std::span< const std::byte > bytes ) = 0;
  virtual std::uint64_t written() const noexcept                     = 0;
};

class file_sink final: public sink
{
public:
  static result< std::unique_ptr< file_sink > > create( const std::filesystem::path& path );

  result< void > write( std::span< const std::byte > bytes ) override;
  std::uint64_t written() const noexcept override;

private:
  explicit file_sink( std::unique_ptr< FILE, decltype( &fclose ) > file ) noexcept;

  std::unique_ptr< FILE, decltype( &fclose ) > _file;
  std::uint64_t _written = 0;
};

/*
 * File destination that is created on the first write, so an existing file
 * is left untouched until payload actually arrives. finish() creates the
 * file when the payload turned out to be empty.
 */
class deferred_file_sink final: public sink
{
public:
  explicit deferred_file_sink( std::filesystem::path path ) noexcept;

  result< void > write( std::span< const std::byte > bytes ) override;
  std::uint64_t written() const noexcept override;

  result< void > finish();
  bool opened() const noexcept;

private:
  result< void > open();

  std::filesystem::path _path;
  std::unique_ptr< file_sink > _sink;
};

class memory_sink final: public sink
{
public:
  result< void > write( std::span< const std::byte > bytes ) override;
  std::uint64_t written() const noexcept override;

  const std::vector< std::byte >& data() const noexcept;

private:
  std::vector< std::byte > _data;
};

} // namespace tessera::io
