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

// Random access payload source
class source
{
public:
  virtual ~source() = default;

  virtual std::uint64_t size() const noexcept = 0;

  // Fills as much of the buffer as the source holds past offset
  virtual result< std::size_t > read( std::uint64_t offset, std::span< std::byte > buffer ) = 0;
};

class file_source final: public source
{
public:
  static result< std::unique_ptr< file_source > > open( const std::filesystem::path& path );

  std::uint64_t size() const noexcept override;
  result< std::size_t > read( std::uint64_t offset, std::span< std::byte > buffer ) override;

private:
  file_source( std::unique_ptr< FILE, decltype( &fclose ) > file, std::uint64_t size ) noexcept;

  std::unique_ptr< FILE, decltype( &fclose ) > _file;
  std::uint64_t _size = 0;
};

class memory_source final: public source
{
public:
  memory_source() = default;
  explicit memory_source( std::vector< std::byte > data ) noexcept;

  std::uint64_t size() const noexcept override;
  result< std::size_t > read( std::uint64_t offset, std::span< std::byte > buffer ) override;

private:
  std::vector< std::byte > _data;
};

// Reads the whole of [offset, offset + length), short when the source ends first
result< std::vector< std::byte > > read_range( source& src, std::uint64_t offset, std::uint64_t length );

} // namespace tessera::io
