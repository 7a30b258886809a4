#pragma once
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace tc {

// Accepted spellings for bool leaves. Rendering always uses "true"/"false".
struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true","1","TRUE","True"};
  std::vector<std::string> false_tokens = {"false","0","FALSE","False"};
  bool case_sensitive = false;
};

// Text -> scalar conversions used by the row decoder. Every parse_* call
// consumes the whole field; on failure it returns nullopt and, when `why`
// is given, a short cause.
struct ParsePolicy {
  BoolPolicy bool_policy;

  // Floating point (fast_float in .cpp).
  std::optional<double> parse_double(std::string_view s, std::string* why = nullptr) const;
  std::optional<float>  parse_float(std::string_view s, std::string* why = nullptr) const;

  std::optional<bool> parse_bool(std::string_view s, std::string* why = nullptr) const;
  std::optional<char> parse_char(std::string_view s, std::string* why = nullptr) const;

  template <class Int>
  std::optional<Int> parse_integer(std::string_view s, std::string* why = nullptr) const {
    static_assert(std::is_integral_v<Int>, "parse_integer needs an integral type");
    std::string_view digits = s;
    bool signed_twice = false;
    if (!digits.empty() && digits.front() == '+') {
      digits.remove_prefix(1);
      signed_twice = !digits.empty() && digits.front() == '-';
    }
    Int out{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    if (!signed_twice && ec == std::errc::result_out_of_range) {
      if (why) *why = "integer out of range: '" + std::string(s) + "'";
      return std::nullopt;
    }
    if (signed_twice || digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
      if (why) *why = "invalid integer: '" + std::string(s) + "'";
      return std::nullopt;
    }
    return out;
  }
};

const ParsePolicy& default_parse_policy();

// Scalar -> text for the row encoder.
std::string render_double(double v);
std::string render_float(float v);
inline std::string render_bool(bool v) { return v ? "true" : "false"; }

template <class Int>
std::string render_integer(Int v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  (void)ec; // 24 bytes holds any 64-bit integer
  return std::string(buf, ptr);
}

}
