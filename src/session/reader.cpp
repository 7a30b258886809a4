#include "typed_csv/reader.hpp"
#include <istream>

namespace tc {

Reader Reader::from_string(std::string data, ReaderConfig cfg) {
  auto src = std::make_unique<CsvReader>(ChunkReader::from_string(std::move(data), cfg.chunk), cfg.csv);
  return Reader(std::move(src), std::move(cfg));
}

Reader Reader::from_stream(std::istream& in, ReaderConfig cfg) {
  auto src = std::make_unique<CsvReader>(ChunkReader(in, cfg.chunk), cfg.csv);
  return Reader(std::move(src), std::move(cfg));
}

Reader Reader::from_file(const std::string& path, ReaderConfig cfg) {
  auto src = std::make_unique<CsvReader>(ChunkReader::open_file(path, cfg.chunk), cfg.csv);
  return Reader(std::move(src), std::move(cfg));
}

Reader Reader::from_source(std::unique_ptr<RowSource> src, ReaderConfig cfg) {
  return Reader(std::move(src), std::move(cfg));
}

}
