#pragma once
#include "typed_csv/shape.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

// Record types shared by the tests.

struct SimpleStruct {
  std::size_t a = 0;
  std::size_t b = 0;
  bool operator==(const SimpleStruct& o) const { return a == o.a && b == o.b; }
};

struct Animal {
  std::size_t count = 0;
  std::string animal;
  bool operator==(const Animal& o) const { return count == o.count && animal == o.animal; }
};

struct Sighting {
  std::size_t count = 0;
  std::string animal;
  std::string description;
  bool operator==(const Sighting& o) const {
    return count == o.count && animal == o.animal && description == o.description;
  }
};

// Newtype: one positional member.
struct MyUint {
  std::uint32_t value = 0;
  bool operator==(const MyUint& o) const { return value == o.value; }
};

// Unit values used as variant alternatives.
struct Unknown { bool operator==(const Unknown&) const { return true; } };
struct Missing { bool operator==(const Missing&) const { return true; } };

using Number = std::variant<std::int64_t, double>;
using Reading = std::variant<Unknown, Missing, double>;

struct Part1 {
  std::string name1;
  std::string name2;
  std::optional<MyUint> dist;
  Number dist2;
  bool operator==(const Part1& o) const {
    return name1 == o.name1 && name2 == o.name2 && dist == o.dist && dist2 == o.dist2;
  }
};

struct Part2 {
  std::size_t size = 0;
  bool operator==(const Part2& o) const { return size == o.size; }
};

struct StructWithLengthOneSeqs {
  std::array<std::size_t, 1> a{};
  std::vector<std::size_t> b;
  std::tuple<std::size_t> c{};
  bool operator==(const StructWithLengthOneSeqs& o) const { return a == o.a && b == o.b && c == o.c; }
};

struct StructOfStruct {
  SimpleStruct p;
  std::pair<std::size_t, std::size_t> q;
};

struct AllScalars {
  std::int8_t i8 = 0;
  std::int64_t i64 = 0;
  std::uint16_t u16 = 0;
  float f32 = 0;
  double f64 = 0;
  bool flag = false;
  char letter = ' ';
  std::string text;
  bool operator==(const AllScalars& o) const {
    return i8 == o.i8 && i64 == o.i64 && u16 == o.u16 && f32 == o.f32 && f64 == o.f64 &&
           flag == o.flag && letter == o.letter && text == o.text;
  }
};

struct Station {
  std::string station;
  std::optional<double> temp;
  Reading wind;
  bool operator==(const Station& o) const {
    return station == o.station && temp == o.temp && wind == o.wind;
  }
};

// A member whose name collides with the positional pattern.
struct Collides {
  int a = 0;
  int _field1 = 0;
};

struct Empty {};

// Members whose values would span more than one column.
struct WideOptional {
  std::optional<SimpleStruct> x;
  std::size_t y = 0;
};

struct WideChoice {
  std::variant<std::int64_t, SimpleStruct> x;
  std::size_t y = 0;
};

struct ArrayMember {
  std::array<std::size_t, 2> xy{};
};

namespace tc {

template <> struct Shape<SimpleStruct> {
  static constexpr std::string_view name = "SimpleStruct";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("a", 0, r.a) && w.field("b", 1, r.b);
  }
};

template <> struct Shape<Animal> {
  static constexpr std::string_view name = "Animal";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("count", 0, r.count) && w.field("animal", 1, r.animal);
  }
};

template <> struct Shape<Sighting> {
  static constexpr std::string_view name = "Sighting";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("count", 0, r.count) && w.field("animal", 1, r.animal) &&
           w.field("description", 2, r.description);
  }
};

template <> struct Shape<MyUint> {
  static constexpr std::string_view name = "MyUint";
  template <class W, class R> static bool walk(W& w, R& r) { return w.field("_field0", 0, r.value); }
};

template <> struct Shape<Unknown> {
  static constexpr std::string_view name = "Unknown";
  template <class W, class R> static bool walk(W&, R&) { return true; }
};

template <> struct Shape<Missing> {
  static constexpr std::string_view name = "Missing";
  template <class W, class R> static bool walk(W&, R&) { return true; }
};

template <> struct Shape<Part1> {
  static constexpr std::string_view name = "Part1";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("name1", 0, r.name1) && w.field("name2", 1, r.name2) &&
           w.field("dist", 2, r.dist) && w.field("dist2", 3, r.dist2);
  }
};

template <> struct Shape<Part2> {
  static constexpr std::string_view name = "Part2";
  template <class W, class R> static bool walk(W& w, R& r) { return w.field("size", 0, r.size); }
};

template <> struct Shape<StructWithLengthOneSeqs> {
  static constexpr std::string_view name = "StructWithLengthOneSeqs";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("a", 0, r.a) && w.field("b", 1, r.b) && w.field("c", 2, r.c);
  }
};

template <> struct Shape<StructOfStruct> {
  static constexpr std::string_view name = "StructOfStruct";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("p", 0, r.p) && w.field("q", 1, r.q);
  }
};

template <> struct Shape<AllScalars> {
  static constexpr std::string_view name = "AllScalars";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("i8", 0, r.i8) && w.field("i64", 1, r.i64) && w.field("u16", 2, r.u16) &&
           w.field("f32", 3, r.f32) && w.field("f64", 4, r.f64) && w.field("flag", 5, r.flag) &&
           w.field("letter", 6, r.letter) && w.field("text", 7, r.text);
  }
};

template <> struct Shape<Station> {
  static constexpr std::string_view name = "Station";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("station", 0, r.station) && w.field("temp", 1, r.temp) &&
           w.field("wind", 2, r.wind);
  }
};

template <> struct Shape<Collides> {
  static constexpr std::string_view name = "Collides";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("a", 0, r.a) && w.field("_field1", 1, r._field1);
  }
};

template <> struct Shape<WideOptional> {
  static constexpr std::string_view name = "WideOptional";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("x", 0, r.x) && w.field("y", 1, r.y);
  }
};

template <> struct Shape<WideChoice> {
  static constexpr std::string_view name = "WideChoice";
  template <class W, class R> static bool walk(W& w, R& r) {
    return w.field("x", 0, r.x) && w.field("y", 1, r.y);
  }
};

template <> struct Shape<ArrayMember> {
  static constexpr std::string_view name = "ArrayMember";
  template <class W, class R> static bool walk(W& w, R& r) { return w.field("xy", 0, r.xy); }
};

template <> struct Shape<Empty> {
  static constexpr std::string_view name = "Empty";
  template <class W, class R> static bool walk(W&, R&) { return true; }
};

}
