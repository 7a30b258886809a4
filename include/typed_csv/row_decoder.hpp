#pragma once
#include "typed_csv/error.hpp"
#include "typed_csv/parse_policy.hpp"
#include "typed_csv/shape.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tc {

// Decode-mode walker: every leaf takes the next field of `row`, which must
// already be in leaf order. Reading past the end yields empty fields, so
// leaves the row never fed behave like empty columns.
class RowDecoder {
public:
  RowDecoder(const std::vector<std::string>& row, std::string_view record,
             const ParsePolicy& policy, Error* err)
      : row_(row), record_(record), policy_(policy), err_(err) {}

  std::size_t consumed() const noexcept { return pos_; }

  template <class V>
  bool field(std::string_view name, std::size_t, V& v) {
    detail::PathGuard g(path_, std::string(name));
    return walk(*this, v);
  }

  template <class V>
  bool element(std::size_t index, V& v) {
    detail::PathGuard g(path_, std::to_string(index));
    return walk(*this, v);
  }

  template <class T>
  bool scalar(T& v) {
    const std::string_view raw = next_raw();
    std::string why;
    if constexpr (std::is_same_v<T, std::string>) {
      v.assign(raw.data(), raw.size());
    } else if constexpr (std::is_same_v<T, bool>) {
      auto r = policy_.parse_bool(raw, &why);
      if (!r) return leaf_fail(why);
      v = *r;
    } else if constexpr (std::is_same_v<T, char>) {
      auto r = policy_.parse_char(raw, &why);
      if (!r) return leaf_fail(why);
      v = *r;
    } else if constexpr (std::is_same_v<T, float>) {
      auto r = policy_.parse_float(raw, &why);
      if (!r) return leaf_fail(why);
      v = *r;
    } else if constexpr (std::is_floating_point_v<T>) {
      auto r = policy_.parse_double(raw, &why);
      if (!r) return leaf_fail(why);
      v = static_cast<T>(*r);
    } else {
      auto r = policy_.template parse_integer<T>(raw, &why);
      if (!r) return leaf_fail(why);
      v = *r;
    }
    return true;
  }

  // Empty -> absent. Otherwise try the inner type and fall back to absent
  // when it does not parse.
  template <class T>
  bool optional(std::optional<T>& v) {
    const std::size_t mark = pos_;
    if (peek_raw().empty()) {
      ++pos_;
      v.reset();
      return true;
    }
    T inner{};
    const bool ok = attempt([&] { return walk(*this, inner); });
    if (ok && pos_ != mark + 1) {
      return shape_fail("optional must wrap a single column");
    }
    pos_ = mark + 1;
    if (ok) v = std::move(inner);
    else v.reset();
    return true;
  }

  // Alternatives are tried in declaration order against the same field.
  template <class... Alts>
  bool choice(std::variant<Alts...>& v) {
    const std::size_t mark = pos_;
    const std::string_view raw = peek_raw();
    const bool found = attempt([&] {
      return try_alternatives(v, mark, raw, std::index_sequence_for<Alts...>{});
    });
    pos_ = mark + 1;
    if (!found) return leaf_fail("no variant matches '" + std::string(raw) + "'");
    return true;
  }

  template <class T, class A>
  bool single(std::vector<T, A>& v) {
    T elem{};
    if (!element(0, elem)) return false;
    v.clear();
    v.push_back(std::move(elem));
    return true;
  }


  template <class V>
  bool record(std::string_view, V& v) { return Shape<V>::walk(*this, v); }

private:
  std::string_view peek_raw() const {
    return pos_ < row_.size() ? std::string_view(row_[pos_]) : std::string_view{};
  }

  std::string_view next_raw() {
    const std::string_view raw = peek_raw();
    ++pos_;
    return raw;
  }

  // Runs `fn` with failures routed to a scratch error.
  template <class Fn>
  bool attempt(Fn&& fn) {
    Error scratch;
    Error* outer = err_;
    err_ = &scratch;
    const bool ok = fn();
    err_ = outer;
    return ok;
  }

  template <class Var, std::size_t... I>
  bool try_alternatives(Var& v, std::size_t mark, std::string_view raw,
                        std::index_sequence<I...>) {
    return (try_alternative<I>(v, mark, raw) || ...);
  }

  template <std::size_t I, class Var>
  bool try_alternative(Var& v, std::size_t mark, std::string_view raw) {
    using Alt = std::variant_alternative_t<I, Var>;
    pos_ = mark;
    Alt alt{};
    if (!walk(*this, alt)) return false;
    if (pos_ == mark) {
      // Unit alternative: matched by name.
      if constexpr (has_shape_v<Alt>) {
        if (raw != Shape<Alt>::name) return false;
      } else {
        return false;
      }
    } else if (pos_ != mark + 1) {
      return false;
    }
    v.template emplace<I>(std::move(alt));
    return true;
  }

  bool leaf_fail(const std::string& cause) {
    return fail_leaf(err_, ErrorKind::LeafDecodeFailure, std::string(record_),
                     detail::join_path(path_), cause);
  }

  bool shape_fail(const std::string& cause) {
    return fail_leaf(err_, ErrorKind::UnsupportedShape, std::string(record_),
                     detail::join_path(path_), cause);
  }

  const std::vector<std::string>& row_;
  std::string_view record_;
  const ParsePolicy& policy_;
  Error* err_;
  std::size_t pos_{0};
  std::vector<std::string> path_;
};

// Decodes one leaf-ordered row into `out`. `out` is only assigned when the
// whole row decodes.
template <class T>
bool decode_row(const std::vector<std::string>& row, T& out, Error* err = nullptr,
                const ParsePolicy& policy = default_parse_policy()) {
  T tmp{};
  RowDecoder d(row, shape_name<T>(), policy, err);
  if (!walk(d, tmp)) return false;
  out = std::move(tmp);
  return true;
}

}
