#pragma once
#include <optional>
#include <string>

namespace tc {

enum class Terminator {
  CRLF,  // "\r", "\n" and "\r\n" all end a record
  Any    // only `terminator_char` ends a record
};

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool quoting   = true;                // false: quote bytes are ordinary data
  std::optional<char> escape;           // unset: quotes are escaped by doubling
  bool double_quote = true;
  Terminator terminator = Terminator::CRLF;
  char terminator_char = '\n';

  // ASCII delimited text: unit separator between fields, record separator
  // between records, no quoting.
  static CsvConfig ascii() {
    CsvConfig c;
    c.delimiter = '\x1f';
    c.quoting = false;
    c.terminator = Terminator::Any;
    c.terminator_char = '\x1e';
    return c;
  }
};

enum class QuoteStyle {
  Necessary,   // quote fields containing delimiter, quote, CR or LF
  Always,
  Never,
  NonNumeric   // quote everything that does not parse as a number
};

struct CsvWriterConfig {
  char delimiter = ',';
  char quote     = '"';
  QuoteStyle quote_style = QuoteStyle::Necessary;
  bool double_quote = true;             // false: prefix quotes with `escape`
  char escape = '\\';
  std::string terminator = "\n";

  static CsvWriterConfig ascii() {
    CsvWriterConfig c;
    c.delimiter = '\x1f';
    c.quote_style = QuoteStyle::Never;
    c.terminator = "\x1e";
    return c;
  }
};

}
