#include "typed_csv/writer.hpp"
#include "../support/check.hpp"
#include "../support/records.hpp"
#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;
using tc_test::check;

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

int main() {
  {
    auto w = tc::Writer<SimpleStruct>::from_memory();
    check(w.encode({0, 1}) && w.encode({3, 4}), "encode structs");
    check(w.as_string() == "a,b\n0,1\n3,4\n", "header written once before the first row");
    check(w.rows() == 2, "row counter");
  }
  {
    auto w = tc::Writer<std::tuple<SimpleStruct, SimpleStruct>>::from_memory();
    w.encode({SimpleStruct{0, 1}, SimpleStruct{2, 3}});
    w.encode({SimpleStruct{4, 5}, SimpleStruct{6, 7}});
    check(w.as_string() == "a,b,a,b\n0,1,2,3\n4,5,6,7\n", "tuple of structs");
  }
  {
    auto w = tc::Writer<std::array<SimpleStruct, 1>>::from_memory();
    w.encode({SimpleStruct{0, 1}});
    check(w.as_string() == "a,b\n0,1\n", "array of one struct");
  }
  {
    auto w = tc::Writer<std::vector<SimpleStruct>>::from_memory();
    check(w.encode({SimpleStruct{0, 1}}), "vector of one struct");
    check(!w.encode({SimpleStruct{0, 1}, SimpleStruct{2, 3}}) &&
          w.error().kind == tc::ErrorKind::LeafEncodeFailure, "vector of two structs rejected");
    check(w.encode({SimpleStruct{4, 5}}), "writer continues after a rejected record");
    check(w.as_string() == "a,b\n0,1\n4,5\n", "rejected record leaves no output");
  }
  {
    using Nested = std::tuple<SimpleStruct, std::tuple<SimpleStruct>,
                              std::pair<SimpleStruct, std::tuple<SimpleStruct>>>;
    auto w = tc::Writer<Nested>::from_memory();
    w.encode(Nested(SimpleStruct{0, 1}, std::make_tuple(SimpleStruct{2, 3}),
                    std::make_pair(SimpleStruct{4, 5}, std::make_tuple(SimpleStruct{6, 7}))));
    check(w.as_string() == "a,b,a,b,a,b,a,b\n0,1,2,3,4,5,6,7\n", "nested tuples of structs");
  }
  {
    auto w = tc::Writer<StructWithLengthOneSeqs>::from_memory();
    StructWithLengthOneSeqs s;
    s.a = {0}; s.b = {1}; s.c = std::tuple<std::size_t>{2};
    w.encode(s);
    check(w.as_string() == "a,b,c\n0,1,2\n", "struct with length-one sequences");
  }
  {
    auto w = tc::Writer<StructOfStruct>::from_memory();
    StructOfStruct s{{0, 1}, {2, 3}};
    check(!w.encode(s) && w.error().kind == tc::ErrorKind::UnsupportedShape, "struct of struct rejected");
    check(w.as_string().empty(), "nothing written for an unsupported shape");
    check(w.error().what().rfind("CSV encode error: StructOfStruct.p: ", 0) == 0,
          "shape error names the writer, record and field");
  }
  {
    auto w = tc::Writer<WideOptional>::from_memory();
    WideOptional r;
    r.y = 3;
    check(w.encode(r) && w.as_string() == "x,y\n,3\n", "absent optional record fills one column");
    r.x = SimpleStruct{1, 2};
    check(!w.encode(r) && w.error().kind == tc::ErrorKind::UnsupportedShape &&
          w.error().leaf_path == "x", "present optional spanning two columns rejected");
    check(w.as_string() == "x,y\n,3\n", "no row wider than the header is written");
  }
  {
    auto w = tc::Writer<WideChoice>::from_memory();
    WideChoice r;
    r.x = std::int64_t{5};
    check(w.encode(r), "scalar alternative fills one column");
    r.x = SimpleStruct{1, 2};
    check(!w.encode(r) && w.error().kind == tc::ErrorKind::UnsupportedShape &&
          w.error().leaf_path == "x", "record alternative spanning two columns rejected");
    check(w.as_string() == "x,y\n5,0\n", "only the fitting row is written");
  }
  {
    auto w = tc::Writer<std::array<SimpleStruct, 2>>::from_memory();
    w.encode({SimpleStruct{0, 1}, SimpleStruct{2, 3}});
    w.encode({SimpleStruct{4, 5}, SimpleStruct{6, 7}});
    check(w.as_string() == "a,b,a,b\n0,1,2,3\n4,5,6,7\n", "array of structs as the whole row");
  }
  {
    auto w = tc::Writer<ArrayMember>::from_memory();
    check(!w.encode(ArrayMember{}) && w.error().kind == tc::ErrorKind::UnsupportedShape,
          "array member spanning two columns rejected");
  }
  {
    auto w = tc::Writer<std::vector<int>>::from_memory();
    check(!w.encode({0, 1}), "bare vector of two rejected");
  }
  {
    auto w = tc::Writer<Station>::from_memory();
    w.encode({"north", 3.5, Reading{2.0}});
    w.encode({"south, east", std::nullopt, Reading{Unknown{}}});
    check(w.as_string() == "station,temp,wind\nnorth,3.5,2\n\"south, east\",,Unknown\n",
          "optional, variants and quoting");
  }
  {
    auto w = tc::Writer<Empty>::from_memory();
    w.encode(Empty{});
    check(w.as_string() == "\"\"\n\"\"\n", "zero-leaf record still writes a record");
  }
  {
    std::ostringstream os;
    {
      auto w = tc::Writer<Animal>::from_stream(os);
      w.encode({7, "penguin"});
    }
    check(os.str() == "count,animal\n7,penguin\n", "stream writer flushed on destruction");
  }
  {
    const fs::path p = fs::temp_directory_path() / "typed_csv_encode_test.csv";
    {
      auto w = tc::Writer<Animal>::from_file(p.string());
      w.encode({2, "red panda"});
      check(w.flush(), "explicit flush");
    }
    check(slurp(p) == "count,animal\n2,red panda\n", "file writer");
    std::error_code ec;
    fs::remove(p, ec);
  }
  {
    tc::CsvWriterConfig cfg;
    cfg.delimiter = '\t';
    auto w = tc::Writer<SimpleStruct>::from_memory(cfg);
    w.encode({1, 2});
    check(w.as_string() == "a\tb\n1\t2\n", "writer config is passed through");
  }
  {
    auto w = tc::Writer<SimpleStruct>::from_file("/nonexistent/typed-csv/out.csv");
    check(!w.encode({1, 2}) && w.error().kind == tc::ErrorKind::Io, "unwritable file");
  }
  return tc_test::finish("encode_records");
}
