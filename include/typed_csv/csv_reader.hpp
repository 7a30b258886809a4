#pragma once
#include "typed_csv/chunk_reader.hpp"
#include "typed_csv/codec.hpp"
#include "typed_csv/csv_config.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tc {

// RFC-4180 field tokenizer over a ChunkReader. Quoted fields may span lines;
// blank lines between records are skipped. The first record is the header
// row.
class CsvReader : public RowSource {
public:
  explicit CsvReader(ChunkReader in, CsvConfig cfg = {});
  ~CsvReader() override;
  CsvReader(CsvReader&&) noexcept;
  CsvReader& operator=(CsvReader&&) noexcept;

  ReadStatus read_header_row(std::vector<std::string>& out) override;
  NextField next_field() override;
  const Error& error() const override { return err_; }

  std::uint64_t records() const noexcept;   // completed records, header included
  std::uint64_t line() const noexcept;      // 1-based line of the read position
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
  Error err_;
};

}
