#pragma once
#include "typed_csv/error.hpp"
#include "typed_csv/shape.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tc {

// Ordered names of a shape's named leaves. Duplicates are kept: a tuple of
// two identical records yields each name twice.
struct FieldNames {
  std::vector<std::string> names;
  // leaf_index[i] is the leaf position labelled by names[i].
  std::vector<std::size_t> leaf_index;
  // All leaves, positional ones included; this is the row width.
  std::size_t leaf_count = 0;

  std::size_t size() const noexcept { return names.size(); }
  bool empty() const noexcept { return names.empty(); }
};

// Name-collection walker. Runs over a value-initialised probe: optionals take
// the absent branch, variants their first alternative and sequences a single
// default element, so no data is needed.
class FieldNameCollector {
public:
  FieldNameCollector(FieldNames& out, std::string_view record, Error* err)
      : out_(out), record_(record), err_(err) {}

  template <class V>
  bool field(std::string_view name, std::size_t index, V& v) {
    if (is_positional_name(name, index)) return walk(*this, v);

    if (in_named_) {
      return fail_leaf(err_, ErrorKind::UnsupportedShape, std::string(record_), open_field_,
                       "named field '" + std::string(name) +
                       "' nested inside a named field; only tuples may hold records");
    }
    out_.names.emplace_back(name);
    out_.leaf_index.push_back(out_.leaf_count);

    in_named_ = true;
    open_field_.assign(name);
    const std::size_t first = out_.leaf_count;
    const bool ok = walk(*this, v);
    in_named_ = false;
    if (!ok) return false;
    const std::size_t spanned = out_.leaf_count - first;
    if (spanned != 1) {
      return fail_leaf(err_, ErrorKind::UnsupportedShape, std::string(record_), open_field_,
                       "named field spans " + std::to_string(spanned) +
                       " columns; a named field must hold exactly one");
    }
    return true;
  }

  template <class V>
  bool element(std::size_t, V& v) { return walk(*this, v); }

  template <class V>
  bool scalar(V&) { ++out_.leaf_count; return true; }

  template <class V>
  bool optional(V&) { ++out_.leaf_count; return true; }

  template <class V>
  bool choice(V&) { ++out_.leaf_count; return true; }

  template <class V>
  bool single(V&) {
    typename V::value_type probe{};
    return walk(*this, probe);
  }

  template <class V>
  bool record(std::string_view, V& v) {
    return Shape<std::remove_const_t<V>>::walk(*this, v);
  }

private:
  FieldNames& out_;
  std::string_view record_;
  Error* err_;
  bool in_named_ = false;
  std::string open_field_;
};

// Names and leaf count of T's shape. T must be value-initialisable.
template <class T>
bool extract_field_names(FieldNames& out, Error* err = nullptr) {
  out = FieldNames{};
  T probe{};
  FieldNameCollector c(out, shape_name<T>(), err);
  return walk(c, probe);
}

}
