#include "typed_csv/error.hpp"
#include <utility>

namespace tc {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:                return "none";
    case ErrorKind::HeaderCountMismatch: return "header_count_mismatch";
    case ErrorKind::HeaderNameMismatch:  return "header_name_mismatch";
    case ErrorKind::ExtraDataColumns:    return "extra_data_columns";
    case ErrorKind::LeafDecodeFailure:   return "leaf_decode_failure";
    case ErrorKind::LeafEncodeFailure:   return "leaf_encode_failure";
    case ErrorKind::UnsupportedShape:    return "unsupported_shape";
    case ErrorKind::Codec:               return "codec";
    case ErrorKind::Io:                  return "io";
  }
  return "unknown";
}

std::string Error::what() const {
  std::string prefix;
  switch (kind) {
    case ErrorKind::None:              return "no error";
    case ErrorKind::LeafEncodeFailure: prefix = "CSV encode error: "; break;
    case ErrorKind::Codec:             prefix = "CSV parse error: "; break;
    case ErrorKind::Io:                prefix = "I/O error: "; break;
    default:
      prefix = encoding ? "CSV encode error: " : "CSV decode error: ";
      break;
  }
  if (kind == ErrorKind::LeafDecodeFailure || kind == ErrorKind::LeafEncodeFailure ||
      kind == ErrorKind::UnsupportedShape) {
    std::string where = record;
    if (!leaf_path.empty()) where += where.empty() ? leaf_path : ("." + leaf_path);
    if (!where.empty()) return prefix + where + ": " + message;
  }
  return prefix + message;
}

bool fail(Error* out, ErrorKind kind, std::string message) {
  if (out) {
    *out = Error{};
    out->kind = kind;
    out->message = std::move(message);
  }
  return false;
}

bool fail_leaf(Error* out, ErrorKind kind, std::string record,
               std::string leaf_path, std::string cause) {
  if (out) {
    *out = Error{};
    out->kind = kind;
    out->message = std::move(cause);
    out->record = std::move(record);
    out->leaf_path = std::move(leaf_path);
  }
  return false;
}

}
