#pragma once
#include "typed_csv/error.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tc {

using HeaderPredicate = std::function<bool(std::string_view header, std::string_view field)>;

bool exact_equal(std::string_view header, std::string_view field);
bool ascii_iequal(std::string_view header, std::string_view field);

// How a header row is reconciled with a record's field names.
struct MatchPolicy {
  bool reorder_columns = false;        // match by name instead of position
  bool ignore_unused_columns = false;  // headers may outnumber field names
  HeaderPredicate header_equals = exact_equal;
};

// Indexed by column; holds the field index the column feeds, or nullopt for
// a column that is skipped.
using ColumnMapping = std::vector<std::optional<std::size_t>>;

std::optional<ColumnMapping> map_columns(const std::vector<std::string>& headers,
                                         const std::vector<std::string>& field_names,
                                         const MatchPolicy& policy,
                                         Error* err = nullptr);

// Number of columns that feed a field.
std::size_t mapped_columns(const ColumnMapping& m) noexcept;

}
