#include "typed_csv/column_mapper.hpp"
#include <cctype>

namespace tc {

bool exact_equal(std::string_view header, std::string_view field) { return header == field; }

bool ascii_iequal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

namespace {

bool count_mismatch(Error* err, std::size_t fields, std::size_t headers, bool at_least) {
  std::string msg = "The record type has " + std::to_string(fields) + " field names, but there are ";
  if (at_least) msg += "only ";
  msg += std::to_string(headers) + " headers";
  fail(err, ErrorKind::HeaderCountMismatch, std::move(msg));
  if (err) { err->expected = fields; err->actual = headers; }
  return false;
}

bool name_mismatch(Error* err) {
  return fail(err, ErrorKind::HeaderNameMismatch, "Headers don't match field names");
}

bool field_not_found(Error* err, const std::string& field) {
  return fail(err, ErrorKind::HeaderNameMismatch,
              "Headers don't match field names: no header for field '" + field + "'");
}

// Greedy, left to right: each field takes the first unused matching header.
// Duplicate names on either side therefore pair up in order.
std::optional<ColumnMapping> map_reordered(const std::vector<std::string>& headers,
                                           const std::vector<std::string>& fields,
                                           const HeaderPredicate& eq, Error* err) {
  ColumnMapping mapping(headers.size());
  std::vector<bool> used(headers.size(), false);
  for (std::size_t f = 0; f < fields.size(); ++f) {
    bool found = false;
    for (std::size_t c = 0; c < headers.size(); ++c) {
      if (used[c] || !eq(headers[c], fields[f])) continue;
      used[c] = true;
      mapping[c] = f;
      found = true;
      break;
    }
    if (!found) {
      field_not_found(err, fields[f]);
      return std::nullopt;
    }
  }
  return mapping;
}

// Fields in declared order, each at or after the previous match.
std::optional<ColumnMapping> map_in_order_skipping(const std::vector<std::string>& headers,
                                                   const std::vector<std::string>& fields,
                                                   const HeaderPredicate& eq, Error* err) {
  ColumnMapping mapping(headers.size());
  std::size_t cursor = 0;
  for (std::size_t f = 0; f < fields.size(); ++f) {
    while (cursor < headers.size() && !eq(headers[cursor], fields[f])) ++cursor;
    if (cursor == headers.size()) {
      field_not_found(err, fields[f]);
      return std::nullopt;
    }
    mapping[cursor++] = f;
  }
  return mapping;
}

}

std::optional<ColumnMapping> map_columns(const std::vector<std::string>& headers,
                                         const std::vector<std::string>& field_names,
                                         const MatchPolicy& policy,
                                         Error* err) {
  const HeaderPredicate& eq = policy.header_equals ? policy.header_equals
                                                   : HeaderPredicate(exact_equal);

  if (policy.ignore_unused_columns) {
    if (headers.size() < field_names.size()) {
      count_mismatch(err, field_names.size(), headers.size(), true);
      return std::nullopt;
    }
    return policy.reorder_columns ? map_reordered(headers, field_names, eq, err)
                                  : map_in_order_skipping(headers, field_names, eq, err);
  }

  if (headers.size() != field_names.size()) {
    count_mismatch(err, field_names.size(), headers.size(), false);
    return std::nullopt;
  }
  if (policy.reorder_columns) return map_reordered(headers, field_names, eq, err);

  ColumnMapping mapping(headers.size());
  for (std::size_t i = 0; i < headers.size(); ++i) {
    if (!eq(headers[i], field_names[i])) {
      name_mismatch(err);
      return std::nullopt;
    }
    mapping[i] = i;
  }
  return mapping;
}

std::size_t mapped_columns(const ColumnMapping& m) noexcept {
  std::size_t n = 0;
  for (const auto& c : m) if (c) ++n;
  return n;
}

}
