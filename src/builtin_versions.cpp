#include "depver/builtin_versions.hpp"

#include <utility>

namespace depver {

std::vector<DependencyRecord> builtin_records() {
    return {
        {"gazelle", "0.32.0", "29218f8e0cebe583643cbf93cae6f971be8a2484cdcfa1e45057658df8d54002"},
        {"rules_go", "0.41.0", "278b7ff5a826f3dc10f04feaf0b70d48b68748ccd512d7f98bf442077f043fe3"},
        {"go", "1.21.0", std::nullopt},
        {"rules_rust", "0.36.2", "a761d54e49db06f863468e6bba4a13252b1bd499e8f706da65e279b3bcbc5c52"},
        {"rust", "1.71.0", std::nullopt},
    };
}

ValidationPolicy builtin_policy() {
    ValidationPolicy policy;
    policy.require_integrity = true;
    policy.integrity_exempt = {"go", "rust"};
    policy.check_integrity_format = true;
    return policy;
}

Registry builtin_registry() {
    RegistryBuilder builder;
    for (auto& rec : builtin_records()) builder.add(std::move(rec));
    return builder.build();
}

} // namespace depver
