#pragma once
#include "typed_csv/error.hpp"
#include "typed_csv/parse_policy.hpp"
#include "typed_csv/shape.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tc {

// Encode-mode walker: appends one rendered field per leaf to `out`.
class RowEncoder {
public:
  RowEncoder(std::vector<std::string>& out, std::string_view record, Error* err)
      : out_(out), record_(record), err_(err) {}

  template <class V>
  bool field(std::string_view name, std::size_t, const V& v) {
    detail::PathGuard g(path_, std::string(name));
    return walk(*this, v);
  }

  template <class V>
  bool element(std::size_t index, const V& v) {
    detail::PathGuard g(path_, std::to_string(index));
    return walk(*this, v);
  }

  template <class T>
  bool scalar(const T& v) {
    if constexpr (std::is_same_v<T, std::string>) {
      out_.push_back(v);
    } else if constexpr (std::is_same_v<T, bool>) {
      out_.push_back(render_bool(v));
    } else if constexpr (std::is_same_v<T, char>) {
      out_.push_back(std::string(1, v));
    } else if constexpr (std::is_same_v<T, float>) {
      out_.push_back(render_float(v));
    } else if constexpr (std::is_floating_point_v<T>) {
      out_.push_back(render_double(static_cast<double>(v)));
    } else {
      out_.push_back(render_integer(v));
    }
    return true;
  }

  template <class T>
  bool optional(const std::optional<T>& v) {
    if (!v) {
      out_.emplace_back();
      return true;
    }
    const std::size_t before = out_.size();
    if (!walk(*this, *v)) return false;
    if (out_.size() != before + 1) return shape_fail("optional must wrap a single column");
    return true;
  }

  // Unit alternatives render as their name, others as their payload.
  template <class... Alts>
  bool choice(const std::variant<Alts...>& v) {
    return std::visit([this](const auto& alt) {
      using Alt = std::decay_t<decltype(alt)>;
      const std::size_t before = out_.size();
      if (!walk(*this, alt)) return false;
      if (out_.size() == before) {
        if constexpr (has_shape_v<Alt>) out_.emplace_back(Shape<Alt>::name);
      }
      if (out_.size() != before + 1) {
        return shape_fail("variant alternative must fill a single column");
      }
      return true;
    }, v);
  }

  template <class T, class A>
  bool single(const std::vector<T, A>& v) {
    if (v.size() != 1) {
      return fail_leaf(err_, ErrorKind::LeafEncodeFailure, std::string(record_),
                       detail::join_path(path_),
                       "sequence of length " + std::to_string(v.size()) +
                       " cannot occupy a single column");
    }
    return element(0, v.front());
  }


  template <class V>
  bool record(std::string_view, const V& v) { return Shape<V>::walk(*this, v); }

private:
  bool shape_fail(const std::string& cause) {
    fail_leaf(err_, ErrorKind::UnsupportedShape, std::string(record_),
              detail::join_path(path_), cause);
    if (err_) err_->encoding = true;
    return false;
  }

  std::vector<std::string>& out_;
  std::string_view record_;
  Error* err_;
  std::vector<std::string> path_;
};

// Renders `rec` as one row of leaf_count fields, appended to `out`.
template <class T>
bool encode_row(const T& rec, std::vector<std::string>& out, Error* err = nullptr) {
  RowEncoder e(out, shape_name<T>(), err);
  return walk(e, rec);
}

}
