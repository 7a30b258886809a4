#pragma once
#include "typed_csv/chunk_reader.hpp"
#include "typed_csv/codec.hpp"
#include "typed_csv/column_mapper.hpp"
#include "typed_csv/csv_config.hpp"
#include "typed_csv/csv_reader.hpp"
#include "typed_csv/error.hpp"
#include "typed_csv/field_names.hpp"
#include "typed_csv/log.hpp"
#include "typed_csv/parse_policy.hpp"
#include "typed_csv/row_decoder.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tc {

struct ReaderConfig {
  CsvConfig csv;
  MatchPolicy match;
  ParsePolicy parse;
  ChunkReader::Config chunk;
};

// One read session: pulls records of type T from a row source. The header
// row is read and reconciled with T's field names on the first request and
// never again. Any error, and end of input, is final.
template <class T>
class DecodedRecords {
public:
  DecodedRecords(std::unique_ptr<RowSource> src, MatchPolicy match, ParsePolicy parse = {})
      : src_(std::move(src)), match_(std::move(match)), parse_(std::move(parse)) {}

  // Reads the next record into `out`. Returns false at end of input or on
  // error; failed() tells them apart. `out` is untouched unless true.
  bool next(T& out) {
    if (!start()) return false;
    if (terminated_) return false;

    row_.assign(names_.leaf_count, std::string());
    std::size_t column = 0;
    bool have_record = false;
    while (!have_record) {
      const NextField nf = src_->next_field();
      switch (nf.kind) {
        case NextField::Kind::Data:
          if (column >= mapping_.size()) {
            return terminate(ErrorKind::ExtraDataColumns, "More data columns than headers");
          }
          if (const auto& f = mapping_[column]) row_[names_.leaf_index[*f]].assign(nf.data);
          ++column;
          break;
        case NextField::Kind::EndOfRecord:
          have_record = column > 0;
          break;
        case NextField::Kind::EndOfInput:
          if (column == 0) {
            terminated_ = true;
            return false;
          }
          have_record = true;
          break;
        case NextField::Kind::Error:
          return terminate(src_->error());
      }
    }

    Error err;
    if (!decode_row(row_, out, &err, parse_)) return terminate(err);
    ++rows_;
    return true;
  }

  // Appends every remaining record to `out`; true when input ended cleanly.
  bool read_all(std::vector<T>& out) {
    T rec{};
    while (next(rec)) out.push_back(std::move(rec));
    return !failed();
  }

  // Header row of the input, read on first use. Empty when the input has
  // none or reading it failed.
  const std::vector<std::string>& headers() {
    start();
    return headers_;
  }

  const FieldNames& field_names() {
    start();
    return names_;
  }

  const ColumnMapping& column_mapping() {
    start();
    return mapping_;
  }

  bool failed() const noexcept { return static_cast<bool>(err_); }
  bool done() const noexcept { return terminated_; }
  const Error& error() const noexcept { return err_; }
  std::uint64_t rows() const noexcept { return rows_; }

private:
  // First-row processing; runs once per session.
  bool start() {
    if (header_processed_) return !terminated_;
    header_processed_ = true;

    const ReadStatus st = src_->read_header_row(headers_);
    if (st == ReadStatus::Error) return terminate(src_->error());
    if (st == ReadStatus::EndOfInput || headers_.empty()) {
      log(LogLevel::Debug, "decode", "empty header row; no records");
      headers_.clear();
      terminated_ = true;
      return false;
    }

    Error err;
    if (!extract_field_names<T>(names_, &err)) return terminate(err);
    auto m = map_columns(headers_, names_.names, match_, &err);
    if (!m) return terminate(err);
    mapping_ = std::move(*m);

    if (log_enabled(LogLevel::Debug)) {
      log(LogLevel::Debug, "decode",
          std::string(shape_name<T>()) + ": " + std::to_string(mapped_columns(mapping_)) +
          " of " + std::to_string(headers_.size()) + " columns mapped to " +
          std::to_string(names_.leaf_count) + " leaves");
    }
    return true;
  }

  bool terminate(const Error& err) {
    terminated_ = true;
    err_ = err;
    log(LogLevel::Error, "decode", err_.what());
    return false;
  }

  bool terminate(ErrorKind kind, std::string message) {
    Error err;
    fail(&err, kind, std::move(message));
    return terminate(err);
  }

  std::unique_ptr<RowSource> src_;
  MatchPolicy match_;
  ParsePolicy parse_;

  bool header_processed_{false};
  bool terminated_{false};
  std::vector<std::string> headers_;
  FieldNames names_;
  ColumnMapping mapping_;
  std::vector<std::string> row_;
  Error err_;
  std::uint64_t rows_{0};
};

// Owns a row source until decode() hands it to a session.
class Reader {
public:
  static Reader from_string(std::string data, ReaderConfig cfg = {});
  static Reader from_stream(std::istream& in, ReaderConfig cfg = {});
  static Reader from_file(const std::string& path, ReaderConfig cfg = {});
  static Reader from_source(std::unique_ptr<RowSource> src, ReaderConfig cfg = {});

  // Starts a session; the reader gives up its source.
  template <class T>
  DecodedRecords<T> decode() {
    return DecodedRecords<T>(std::move(src_), cfg_.match, cfg_.parse);
  }

  const ReaderConfig& config() const noexcept { return cfg_; }

private:
  Reader(std::unique_ptr<RowSource> src, ReaderConfig cfg)
      : src_(std::move(src)), cfg_(std::move(cfg)) {}

  std::unique_ptr<RowSource> src_;
  ReaderConfig cfg_;
};

}
