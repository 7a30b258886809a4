#include "typed_csv/parse_policy.hpp"
#include "typed_csv/column_mapper.hpp"
#include <charconv>
#include <string_view>
#include <fast_float/fast_float.h>

namespace tc {

template <class F>
static std::optional<F> parse_fp(std::string_view s, std::string* why) {
  F out{};
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
    if (why) *why = "invalid float: '" + std::string(s) + "'";
    return std::nullopt;
  }
  return out;
}

std::optional<double> ParsePolicy::parse_double(std::string_view s, std::string* why) const {
  return parse_fp<double>(s, why);
}

std::optional<float> ParsePolicy::parse_float(std::string_view s, std::string* why) const {
  return parse_fp<float>(s, why);
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s, std::string* why) const {
  for (const auto& t : bool_policy.true_tokens) {
    if (bool_policy.case_sensitive ? (s == t) : ascii_iequal(s, t)) return true;
  }
  for (const auto& f : bool_policy.false_tokens) {
    if (bool_policy.case_sensitive ? (s == f) : ascii_iequal(s, f)) return false;
  }
  if (why) *why = "invalid bool: '" + std::string(s) + "'";
  return std::nullopt;
}

std::optional<char> ParsePolicy::parse_char(std::string_view s, std::string* why) const {
  if (s.size() != 1) {
    if (why) *why = "expected a single character, got '" + std::string(s) + "'";
    return std::nullopt;
  }
  return s.front();
}

const ParsePolicy& default_parse_policy() {
  static const ParsePolicy p{};
  return p;
}

template <class F>
static std::string render_fp(F v) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc()) return std::string();
  return std::string(buf, ptr);
}

std::string render_double(double v) { return render_fp(v); }
std::string render_float(float v) { return render_fp(v); }

}
