#include "typed_csv/csv_reader.hpp"
#include <cstring>
#include <string>
#include <vector>

namespace tc {

struct CsvReader::Impl {
  ChunkReader in;
  CsvConfig cfg;
  std::string field;
  bool pending_eor{false};
  bool at_record_start{true};
  bool failed{false};
  std::uint64_t records{0};
  std::uint64_t line{1};

  bool header_read{false};
  ReadStatus header_status{ReadStatus::EndOfInput};
  std::vector<std::string> header;

  bool is_term(char c) const {
    if (cfg.terminator == Terminator::CRLF) return c == '\r' || c == '\n';
    return c == cfg.terminator_char;
  }

  // Swallows the LF of a CRLF pair.
  void eat_term(char c) {
    if (cfg.terminator == Terminator::CRLF && c == '\r') {
      char n;
      if (in.peek(n) && n == '\n') in.get(n);
    }
    ++line;
  }

  NextField parse_fail(Error& err, const char* what) {
    failed = true;
    fail(&err, ErrorKind::Codec, std::string(what) + " (line " + std::to_string(line) + ")");
    return NextField::failure();
  }

  NextField io_fail(Error& err) {
    failed = true;
    fail(&err, ErrorKind::Io, std::string("read failed: ") + std::strerror(in.last_error()));
    return NextField::failure();
  }

  NextField end_field() {
    return NextField::of(field);
  }

  NextField end_field_and_record() {
    pending_eor = true;
    return NextField::of(field);
  }

  NextField next(Error& err) {
    if (failed) return NextField::failure();
    if (pending_eor) {
      pending_eor = false;
      at_record_start = true;
      ++records;
      return NextField::end_of_record();
    }
    field.clear();
    char c;

    if (at_record_start) {
      while (true) {
        if (!in.peek(c)) {
          if (!in.ok()) return io_fail(err);
          return NextField::end_of_input();
        }
        if (!is_term(c)) break;
        in.get(c);
        eat_term(c);
      }
      at_record_start = false;
    }

    enum class Mode { Start, Unquoted, Quoted, AfterQuote } mode = Mode::Start;
    while (true) {
      if (!in.get(c)) {
        if (!in.ok()) return io_fail(err);
        if (mode == Mode::Quoted) return parse_fail(err, "unterminated quoted field");
        return end_field_and_record();
      }
      switch (mode) {
        case Mode::Start:
          if (cfg.quoting && c == cfg.quote) { mode = Mode::Quoted; break; }
          mode = Mode::Unquoted;
          [[fallthrough]];
        case Mode::Unquoted:
          if (c == cfg.delimiter) return end_field();
          if (is_term(c)) { eat_term(c); return end_field_and_record(); }
          field.push_back(c);
          break;
        case Mode::Quoted:
          if (cfg.escape && c == *cfg.escape) {
            char n;
            if (!in.get(n)) return parse_fail(err, "unterminated quoted field");
            field.push_back(n);
            break;
          }
          if (c == cfg.quote) {
            char n;
            if (cfg.double_quote && in.peek(n) && n == cfg.quote) {
              in.get(n);
              field.push_back(n);     // escaped quote
            } else {
              mode = Mode::AfterQuote;
            }
            break;
          }
          if (c == '\n') ++line;
          field.push_back(c);
          break;
        case Mode::AfterQuote:
          if (c == cfg.delimiter) return end_field();
          if (is_term(c)) { eat_term(c); return end_field_and_record(); }
          return parse_fail(err, "quoted field mismatch");
      }
    }
  }
};

CsvReader::CsvReader(ChunkReader in, CsvConfig cfg)
  : p_(new Impl{std::move(in), cfg}) {}

CsvReader::~CsvReader() = default;
CsvReader::CsvReader(CsvReader&&) noexcept = default;
CsvReader& CsvReader::operator=(CsvReader&&) noexcept = default;

ReadStatus CsvReader::read_header_row(std::vector<std::string>& out) {
  if (!p_->header_read) {
    p_->header_read = true;
    while (true) {
      NextField nf = p_->next(err_);
      if (nf.kind == NextField::Kind::Data) { p_->header.emplace_back(nf.data); continue; }
      if (nf.kind == NextField::Kind::Error) { p_->header_status = ReadStatus::Error; break; }
      p_->header_status = p_->header.empty() ? ReadStatus::EndOfInput : ReadStatus::Ok;
      break;
    }
  }
  out = p_->header;
  return p_->header_status;
}

NextField CsvReader::next_field() {
  if (!p_->header_read) {
    std::vector<std::string> ignored;
    if (read_header_row(ignored) == ReadStatus::Error) return NextField::failure();
  }
  return p_->next(err_);
}

std::uint64_t CsvReader::records() const noexcept { return p_->records; }
std::uint64_t CsvReader::line() const noexcept { return p_->line; }
std::uint64_t CsvReader::bytes_read() const noexcept { return p_->in.bytes_read(); }

}
