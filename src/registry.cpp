#include "depver/registry.hpp"
#include "depver/errors.hpp"
#include "depver/integrity.hpp"
#include "depver/log.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace depver {

namespace {

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// A version is opaque, but it must survive being quoted into a build file.
bool IsWellFormedVersion(const std::string& v) {
    if (v.empty()) return false;
    return std::none_of(v.begin(), v.end(), [](unsigned char c) {
        return std::isspace(c) != 0 || c == '"' || c == '\'' || c == '\\';
    });
}

} // namespace

Registry::Registry(std::vector<DependencyRecord> records)
    : records_(std::move(records)) {
    for (std::size_t i = 0; i < records_.size(); ++i) {
        index_.emplace(records_[i].name, i); // keeps the first on duplicates
    }
}

const DependencyRecord* Registry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &records_[it->second];
}

const DependencyRecord& Registry::get(const std::string& name) const {
    if (const auto* rec = find(name)) return *rec;
    throw NotFoundError(name);
}

ValidationResult Registry::validate(const ValidationPolicy& policy) const {
    std::vector<Violation> violations;

    std::map<std::string, std::size_t> occurrences;
    for (const auto& rec : records_) ++occurrences[rec.name];

    std::map<std::string, bool> reported_dup;
    for (const auto& rec : records_) {
        if (rec.name.empty() || IsBlank(rec.name)) {
            violations.push_back({ViolationKind::EmptyName, rec.name,
                                  "record with version '" + rec.version + "' has no name"});
        } else if (occurrences[rec.name] > 1 && !reported_dup[rec.name]) {
            reported_dup[rec.name] = true;
            violations.push_back({ViolationKind::DuplicateName, rec.name,
                                  "defined " + std::to_string(occurrences[rec.name]) + " times"});
        }

        if (!IsWellFormedVersion(rec.version)) {
            violations.push_back({ViolationKind::InvalidVersion, rec.name,
                                  rec.version.empty() ? "version is empty"
                                                      : "version '" + rec.version + "' is malformed"});
        }

        if (rec.integrity_hash) {
            if (policy.check_integrity_format && !IntegrityHash::parse(*rec.integrity_hash)) {
                violations.push_back({ViolationKind::MalformedHash, rec.name,
                                      "unrecognised integrity hash '" + *rec.integrity_hash + "'"});
            }
        } else if (policy.require_integrity && !policy.integrity_exempt.contains(rec.name)) {
            violations.push_back({ViolationKind::MissingHash, rec.name,
                                  "version " + rec.version + " is not hash pinned"});
        }
    }

    if (violations.empty()) {
        Logger::verbose("Registry valid: {} records", records_.size());
        return ValidationResult::Ok();
    }

    for (const auto& v : violations) {
        Logger::verbose("  - {}", describe(v));
    }
    return ValidationResult::Fail(std::move(violations));
}

void Registry::validate_or_throw(const ValidationPolicy& policy) const {
    auto result = validate(policy);
    if (!result.is_ok()) {
        Logger::error("{}", result.msg);
    }
    result.throw_if_failed();
}

RegistryBuilder& RegistryBuilder::add(DependencyRecord record) {
    records_.push_back(std::move(record));
    return *this;
}

RegistryBuilder& RegistryBuilder::add(std::string name, std::string version,
                                      std::optional<std::string> integrity_hash) {
    return add(DependencyRecord{std::move(name), std::move(version), std::move(integrity_hash)});
}

Registry RegistryBuilder::build() {
    Registry r(std::move(records_));
    records_.clear();
    return r;
}

} // namespace depver
