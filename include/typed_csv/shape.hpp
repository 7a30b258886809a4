#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tc {

// Describes a record type to the walkers. Specialise once per record:
//
//   template <> struct Shape<Animal> {
//     static constexpr std::string_view name = "Animal";
//     template <class W, class R> static bool walk(W& w, R& r) {
//       return w.field("count", 0, r.count) && w.field("animal", 1, r.animal);
//     }
//   };
//
// `R` is `Animal` when decoding or collecting names and `const Animal` when
// encoding. The index is the member's declared position. A single-member
// wrapper (newtype) names its member "_field0"; such names are treated as
// positional, so ordinary members must not be called "_field<N>".
// A record with no members is a unit value; inside a std::variant it is
// written and matched by `name`.
template <class T> struct Shape;

namespace detail {

template <class T> struct always_false : std::false_type {};

template <class T, class = void> struct has_shape : std::false_type {};
template <class T>
struct has_shape<T, std::void_t<decltype(Shape<T>::name)>> : std::true_type {};

template <class T> struct is_optional : std::false_type {};
template <class T> struct is_optional<std::optional<T>> : std::true_type {};

template <class T> struct is_variant : std::false_type {};
template <class... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

// Fixed-width aggregates with anonymous elements. A std::array is a tuple of
// N identical elements, so its width is known from the type alone.
template <class T> struct is_tuple_like : std::false_type {};
template <class... Ts> struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};
template <class A, class B> struct is_tuple_like<std::pair<A, B>> : std::true_type {};
template <class T, std::size_t N> struct is_tuple_like<std::array<T, N>> : std::true_type {};

// Run-time sized sequences are allowed only when they hold exactly one
// element.
template <class T> struct is_single_seq : std::false_type {};
template <class T, class A> struct is_single_seq<std::vector<T, A>> : std::true_type {};

}

template <class T>
inline constexpr bool is_scalar_leaf_v =
    std::is_arithmetic_v<T> || std::is_same_v<T, std::string>;

template <class T>
inline constexpr bool has_shape_v = detail::has_shape<T>::value;

// True when `name` is the synthetic positional name for member `index`.
inline bool is_positional_name(std::string_view name, std::size_t index) {
  return name == "_field" + std::to_string(index);
}

// Name used for T in error messages.
template <class T>
constexpr std::string_view shape_name() {
  if constexpr (has_shape_v<T>) return Shape<T>::name;
  else if constexpr (detail::is_tuple_like<T>::value) return "tuple";
  else if constexpr (detail::is_single_seq<T>::value) return "sequence";
  else if constexpr (detail::is_optional<T>::value) return "optional";
  else if constexpr (detail::is_variant<T>::value) return "variant";
  else return "scalar";
}

// Dispatches one value to the walker member that handles its kind. A walker
// provides field(), element(), scalar(), optional(), choice(), single() and
// record(); each returns false to abort the traversal.
template <class W, class V>
bool walk(W& w, V& v) {
  using T = std::remove_const_t<V>;
  if constexpr (is_scalar_leaf_v<T>) {
    return w.scalar(v);
  } else if constexpr (detail::is_optional<T>::value) {
    return w.optional(v);
  } else if constexpr (detail::is_variant<T>::value) {
    return w.choice(v);
  } else if constexpr (detail::is_tuple_like<T>::value) {
    return std::apply([&w](auto&... elems) {
      std::size_t i = 0;
      return (true && ... && w.element(i++, elems));
    }, v);
  } else if constexpr (detail::is_single_seq<T>::value) {
    return w.single(v);
  } else if constexpr (has_shape_v<T>) {
    return w.record(Shape<T>::name, v);
  } else {
    static_assert(detail::always_false<T>::value,
                  "type is not a scalar, optional, variant, tuple, array, "
                  "single-element vector or a record with a tc::Shape<> specialisation");
    return false;
  }
}

namespace detail {

// Keeps the walker's leaf path in step with the traversal, including on
// early return.
class PathGuard {
public:
  PathGuard(std::vector<std::string>& path, std::string part) : path_(path) {
    path_.push_back(std::move(part));
  }
  ~PathGuard() { path_.pop_back(); }
  PathGuard(const PathGuard&) = delete;
  PathGuard& operator=(const PathGuard&) = delete;

private:
  std::vector<std::string>& path_;
};

inline std::string join_path(const std::vector<std::string>& path) {
  std::string out;
  for (const auto& p : path) {
    if (!out.empty()) out += '.';
    out += p;
  }
  return out;
}

}

}
