#pragma once
#include "depver/registry.hpp"
#include "depver/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace depver {

// Reads the flat table the build orchestrator loads:
//
//   versions = struct(
//       # gazelle
//       GAZELLE_VERSION = "0.32.0",
//       GAZELLE_SHA256 = "2921...",
//   )
//
// <PREFIX>_VERSION opens a record named lowercase(PREFIX), <PREFIX>_SHA256
// pins it. Throws LoadError with the offending line number.
std::vector<DependencyRecord> parse_struct_table(std::string_view text);

// Throws std::invalid_argument for names that are not lowercase identifiers
// and for versions or hashes that cannot sit inside a "..." literal.
std::string render_struct_table(const Registry& registry,
                                std::string_view table_name = "versions");

} // namespace depver
