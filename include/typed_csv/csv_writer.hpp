#pragma once
#include "typed_csv/codec.hpp"
#include "typed_csv/csv_config.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace tc {

// Row sink writing delimited text to a stream. A row holding a single empty
// field is written as a quoted empty string so it is not read back as a
// blank line.
class CsvWriter : public RowSink {
public:
  CsvWriter(std::ostream& out, CsvWriterConfig cfg = {});                  // borrowed
  CsvWriter(std::unique_ptr<std::ostream> out, CsvWriterConfig cfg = {});  // owned

  // Truncates `path`; check error() after construction.
  static CsvWriter open_file(const std::string& path, CsvWriterConfig cfg = {});
  static CsvWriter in_memory(CsvWriterConfig cfg = {});

  CsvWriter(CsvWriter&&) noexcept;
  CsvWriter& operator=(CsvWriter&&) noexcept;
  ~CsvWriter() override;

  bool write_row(const std::vector<std::string>& fields) override;
  bool flush() override;
  const Error& error() const override { return err_; }

  // Contents so far when built with in_memory(); empty otherwise.
  std::string as_string() const;

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
  Error err_;
};

}
