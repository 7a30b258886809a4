#pragma once
#include <cstddef>
#include <string>

namespace tc {

enum class ErrorKind {
  None,
  HeaderCountMismatch,
  HeaderNameMismatch,
  ExtraDataColumns,
  LeafDecodeFailure,
  LeafEncodeFailure,
  UnsupportedShape,
  Codec,   // malformed CSV reported by the row source
  Io
};

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  // HeaderCountMismatch: field-name count vs header count.
  std::size_t expected = 0;
  std::size_t actual = 0;

  // Leaf failures: record type name and dotted path to the leaf.
  std::string record;
  std::string leaf_path;

  // Raised while writing; selects the encode prefix in what().
  bool encoding = false;

  explicit operator bool() const noexcept { return kind != ErrorKind::None; }
  std::string what() const;
};

const char* to_string(ErrorKind k) noexcept;

// Small helpers so call sites read `return fail(err, ...)`.
bool fail(Error* out, ErrorKind kind, std::string message);
bool fail_leaf(Error* out, ErrorKind kind, std::string record,
               std::string leaf_path, std::string cause);

}
