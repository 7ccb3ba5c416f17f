#pragma once
#include "depver/registry.hpp"
#include "depver/types.hpp"

#include <vector>

namespace depver {

// Versions pinned by this project's build: gazelle, rules_go with its Go
// toolchain, rules_rust with its Rust compiler.
std::vector<DependencyRecord> builtin_records();

// Rulesets must be hash pinned; plain toolchain versions are exempt.
ValidationPolicy builtin_policy();

Registry builtin_registry();

} // namespace depver
