#include "depver/result.hpp"
#include "depver/errors.hpp"

namespace depver {

namespace {

std::string JoinViolations(const std::vector<Violation>& v) {
    std::string out;
    for (const auto& item : v) {
        if (!out.empty()) out += "; ";
        out += describe(item);
    }
    return out;
}

} // namespace

const char* to_string(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::DuplicateName:  return "duplicate-name";
        case ViolationKind::EmptyName:      return "empty-name";
        case ViolationKind::InvalidVersion: return "invalid-version";
        case ViolationKind::MalformedHash:  return "malformed-hash";
        case ViolationKind::MissingHash:    return "missing-hash";
    }
    return "unknown";
}

std::string describe(const Violation& v) {
    std::string s = std::string(to_string(v.kind)) + " '" + v.name + "'";
    if (!v.detail.empty()) s += ": " + v.detail;
    return s;
}

ValidationResult ValidationResult::Fail(std::vector<Violation> v) {
    ValidationResult r;
    r.ok = false;
    r.code = static_cast<int>(v.size());
    r.msg = "Registry validation failed: " + JoinViolations(v);
    r.violations = std::move(v);
    return r;
}

void ValidationResult::throw_if_failed() const {
    if (!ok) throw ValidationError(violations);
}

ValidationError::ValidationError(std::vector<Violation> v)
    : std::runtime_error("Registry validation failed: " + JoinViolations(v)),
      violations(std::move(v)) {}

} // namespace depver
