#include "typed_csv/chunk_reader.hpp"
#include <cerrno>
#include <fstream>
#include <istream>
#include <sstream>
#include <vector>

namespace tc {

struct ChunkReader::Impl {
  std::unique_ptr<std::istream> owned;
  std::istream* in{nullptr};
  Config cfg;
  std::vector<char> buf;
  std::size_t head{0};
  std::size_t tail{0};
  int last_errno{0};
  bool failed{false};
  std::uint64_t bytes{0};

  bool fill() {
    if (head < tail) return true;
    if (failed || !in) return false;
    head = tail = 0;
    if (buf.size() != cfg.chunk_bytes) buf.resize(cfg.chunk_bytes ? cfg.chunk_bytes : 1);
    in->read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize n = in->gcount();
    if (n <= 0) {
      if (in->bad()) { last_errno = errno; failed = true; }
      return false;
    }
    tail = static_cast<std::size_t>(n);
    bytes += static_cast<std::uint64_t>(n);
    return true;
  }
};

ChunkReader::ChunkReader(std::istream& in) : ChunkReader(in, Config{}) {}

ChunkReader::ChunkReader(std::istream& in, Config cfg) : p_(new Impl) {
  p_->in = &in;
  p_->cfg = cfg;
}

ChunkReader::ChunkReader(std::unique_ptr<std::istream> in, Config cfg) : p_(new Impl) {
  p_->owned = std::move(in);
  p_->in = p_->owned.get();
  p_->cfg = cfg;
}

ChunkReader ChunkReader::open_file(const std::string& path, Config cfg) {
  auto f = std::make_unique<std::ifstream>(path, std::ios::binary);
  const bool opened = f->is_open();
  const int e = errno;
  ChunkReader r(std::move(f), cfg);
  if (!opened) { r.p_->failed = true; r.p_->last_errno = e; }
  return r;
}

ChunkReader ChunkReader::from_string(std::string data, Config cfg) {
  return ChunkReader(std::make_unique<std::istringstream>(std::move(data)), cfg);
}

ChunkReader::ChunkReader(ChunkReader&&) noexcept = default;
ChunkReader& ChunkReader::operator=(ChunkReader&&) noexcept = default;
ChunkReader::~ChunkReader() = default;

bool ChunkReader::get(char& c) {
  if (!p_->fill()) return false;
  c = p_->buf[p_->head++];
  return true;
}

bool ChunkReader::peek(char& c) {
  if (!p_->fill()) return false;
  c = p_->buf[p_->head];
  return true;
}

bool ChunkReader::ok() const noexcept { return !p_->failed; }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

}
