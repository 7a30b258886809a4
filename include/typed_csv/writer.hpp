#pragma once
#include "typed_csv/codec.hpp"
#include "typed_csv/csv_config.hpp"
#include "typed_csv/csv_writer.hpp"
#include "typed_csv/error.hpp"
#include "typed_csv/field_names.hpp"
#include "typed_csv/log.hpp"
#include "typed_csv/row_encoder.hpp"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tc {

// One write session for records of type T. The first encode() writes T's
// field names as the header row. Output is flushed on flush() and again on
// destruction.
template <class T>
class Writer {
public:
  explicit Writer(std::unique_ptr<RowSink> sink) : sink_(std::move(sink)) {}

  static Writer from_sink(std::unique_ptr<RowSink> sink) { return Writer(std::move(sink)); }

  static Writer from_stream(std::ostream& out, CsvWriterConfig cfg = {}) {
    return Writer(std::make_unique<CsvWriter>(out, std::move(cfg)));
  }

  static Writer from_file(const std::string& path, CsvWriterConfig cfg = {}) {
    return Writer(std::make_unique<CsvWriter>(CsvWriter::open_file(path, std::move(cfg))));
  }

  static Writer from_memory(CsvWriterConfig cfg = {}) {
    auto sink = std::make_unique<CsvWriter>(CsvWriter::in_memory(std::move(cfg)));
    CsvWriter* mem = sink.get();
    Writer w(std::move(sink));
    w.memory_ = mem;
    return w;
  }

  Writer(Writer&&) noexcept = default;
  Writer& operator=(Writer&&) noexcept = default;
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;

  ~Writer() {
    if (sink_ && !sink_->flush()) log(LogLevel::Error, "encode", sink_->error().what());
  }

  bool encode(const T& rec) {
    if (first_row_ && !extract_field_names<T>(names_, &err_)) return report();

    row_.clear();
    if (!encode_row(rec, row_, &err_)) return report();
    if (row_.empty()) row_.emplace_back();

    if (first_row_) {
      std::vector<std::string> header = names_.names;
      if (header.empty()) header.emplace_back();
      if (!sink_->write_row(header)) return sink_failed();
      first_row_ = false;
    }
    if (!sink_->write_row(row_)) return sink_failed();
    ++rows_;
    return true;
  }

  bool flush() {
    if (!sink_->flush()) return sink_failed();
    return true;
  }

  const Error& error() const noexcept { return err_; }
  std::uint64_t rows() const noexcept { return rows_; }

  // Output written so far; only meaningful for from_memory() writers.
  std::string as_string() const { return memory_ ? memory_->as_string() : std::string(); }

private:
  bool report() {
    if (err_.kind != ErrorKind::Io) err_.encoding = true;
    log(LogLevel::Error, "encode", err_.what());
    return false;
  }

  bool sink_failed() {
    err_ = sink_->error();
    return report();
  }

  std::unique_ptr<RowSink> sink_;
  CsvWriter* memory_{nullptr};
  bool first_row_{true};
  FieldNames names_;
  std::vector<std::string> row_;
  Error err_;
  std::uint64_t rows_{0};
};

}
