#pragma once
#include <optional>
#include <set>
#include <string>

namespace depver {

struct DependencyRecord {
    std::string name;
    std::string version;                       // opaque, never parsed
    std::optional<std::string> integrity_hash; // e.g. "sha256:<hex>" or bare hex

    bool operator==(const DependencyRecord&) const = default;
};

enum class ViolationKind {
    DuplicateName,
    EmptyName,
    InvalidVersion,
    MalformedHash,
    MissingHash
};

struct Violation {
    ViolationKind kind;
    std::string name;   // offending record
    std::string detail;
};

struct ValidationPolicy {
    // Every record not listed in integrity_exempt must carry a hash.
    bool require_integrity = false;
    std::set<std::string> integrity_exempt;
    // Reject hashes that IntegrityHash::parse does not accept.
    bool check_integrity_format = false;
};

const char* to_string(ViolationKind kind);

} // namespace depver
