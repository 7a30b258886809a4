#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace tc {

struct ChunkReaderConfig {
  std::size_t chunk_bytes = 512 * 1024;      // 512 KiB
};

// Buffered byte source over a stream, filled in fixed-size chunks.
class ChunkReader {
public:
  using Config = ChunkReaderConfig;

  explicit ChunkReader(std::istream& in);           // borrowed stream
  ChunkReader(std::istream& in, Config cfg);
  ChunkReader(std::unique_ptr<std::istream> in, Config cfg);  // owned stream

  // Opens `path` in binary mode; check ok() afterwards.
  static ChunkReader open_file(const std::string& path, Config cfg = {});
  static ChunkReader from_string(std::string data, Config cfg = {});

  ChunkReader(ChunkReader&&) noexcept;
  ChunkReader& operator=(ChunkReader&&) noexcept;
  ~ChunkReader();

  bool get(char& c);
  bool peek(char& c);

  bool ok() const noexcept;             // false after an open or read failure
  int  last_error() const noexcept;     // errno of the last failure
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}
