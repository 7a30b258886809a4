#pragma once
#include "typed_csv/error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tc {

enum class ReadStatus { Ok, EndOfInput, Error };

struct NextField {
  enum class Kind { Data, EndOfRecord, EndOfInput, Error };
  Kind kind = Kind::EndOfInput;
  // Valid until the next call on the source.
  std::string_view data;

  static NextField of(std::string_view s) { return {Kind::Data, s}; }
  static NextField end_of_record() { return {Kind::EndOfRecord, {}}; }
  static NextField end_of_input() { return {Kind::EndOfInput, {}}; }
  static NextField failure() { return {Kind::Error, {}}; }
};

// Tabular-text input. The header row is read once; repeated calls return the
// same row without advancing.
class RowSource {
public:
  virtual ~RowSource() = default;
  virtual ReadStatus read_header_row(std::vector<std::string>& out) = 0;
  virtual NextField next_field() = 0;
  virtual const Error& error() const = 0;
};

// Tabular-text output.
class RowSink {
public:
  virtual ~RowSink() = default;
  virtual bool write_row(const std::vector<std::string>& fields) = 0;
  virtual bool flush() = 0;
  virtual const Error& error() const = 0;
};

}
