#include "typed_csv/csv_writer.hpp"
#include "typed_csv/parse_policy.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ostream>
#include <sstream>

namespace tc {

struct CsvWriter::Impl {
  std::unique_ptr<std::ostream> owned;
  std::ostream* out{nullptr};
  std::ostringstream* memory{nullptr};
  CsvWriterConfig cfg;
  std::string line;

  bool needs_quotes(const std::string& s) const {
    switch (cfg.quote_style) {
      case QuoteStyle::Always: return true;
      case QuoteStyle::Never:  return false;
      case QuoteStyle::NonNumeric:
        if (!s.empty() && default_parse_policy().parse_double(s)) return false;
        if (s.empty()) return false;
        return true;
      case QuoteStyle::Necessary:
        break;
    }
    for (char c : s) {
      if (c == cfg.delimiter || c == cfg.quote || c == '\r' || c == '\n') return true;
    }
    return false;
  }

  void append_field(const std::string& s) {
    if (!needs_quotes(s)) { line += s; return; }
    line += cfg.quote;
    for (char c : s) {
      if (c == cfg.quote) line += cfg.double_quote ? cfg.quote : cfg.escape;
      line += c;
    }
    line += cfg.quote;
  }
};

CsvWriter::CsvWriter(std::ostream& out, CsvWriterConfig cfg) : p_(new Impl) {
  p_->out = &out;
  p_->cfg = std::move(cfg);
}

CsvWriter::CsvWriter(std::unique_ptr<std::ostream> out, CsvWriterConfig cfg) : p_(new Impl) {
  p_->owned = std::move(out);
  p_->out = p_->owned.get();
  p_->cfg = std::move(cfg);
}

CsvWriter CsvWriter::open_file(const std::string& path, CsvWriterConfig cfg) {
  auto f = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
  const bool opened = f->is_open();
  const int e = errno;
  CsvWriter w(std::move(f), std::move(cfg));
  if (!opened) {
    fail(&w.err_, ErrorKind::Io, "cannot open '" + path + "': " + std::strerror(e));
  }
  return w;
}

CsvWriter CsvWriter::in_memory(CsvWriterConfig cfg) {
  auto ss = std::make_unique<std::ostringstream>();
  std::ostringstream* raw = ss.get();
  CsvWriter w(std::move(ss), std::move(cfg));
  w.p_->memory = raw;
  return w;
}

CsvWriter::CsvWriter(CsvWriter&&) noexcept = default;
CsvWriter& CsvWriter::operator=(CsvWriter&&) noexcept = default;

CsvWriter::~CsvWriter() {
  if (p_ && p_->out) p_->out->flush();
}

bool CsvWriter::write_row(const std::vector<std::string>& fields) {
  if (err_) return false;
  p_->line.clear();
  if (fields.size() == 1 && fields[0].empty() && p_->cfg.quote_style != QuoteStyle::Never) {
    p_->line += p_->cfg.quote;
    p_->line += p_->cfg.quote;
  } else {
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (i) p_->line += p_->cfg.delimiter;
      p_->append_field(fields[i]);
    }
  }
  p_->line += p_->cfg.terminator;
  p_->out->write(p_->line.data(), static_cast<std::streamsize>(p_->line.size()));
  if (!*p_->out) return fail(&err_, ErrorKind::Io, "failed to write row");
  return true;
}

bool CsvWriter::flush() {
  if (err_) return false;
  p_->out->flush();
  if (!*p_->out) return fail(&err_, ErrorKind::Io, "flush failed");
  return true;
}

std::string CsvWriter::as_string() const {
  return p_->memory ? p_->memory->str() : std::string();
}

}
