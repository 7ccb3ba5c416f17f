#pragma once
#include "depver/result.hpp"
#include "depver/types.hpp"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace depver {

// Read-only table of dependency records. Built once through RegistryBuilder
// and handed by reference to whoever needs it.
class Registry {
public:
    Registry() = default;

    // Throws NotFoundError. With duplicated names the first record wins.
    const DependencyRecord& get(const std::string& name) const;
    const DependencyRecord* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Insertion order; may be iterated any number of times.
    std::span<const DependencyRecord> all() const { return records_; }

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // Reports every violation, never throws.
    ValidationResult validate(const ValidationPolicy& policy = {}) const;
    void validate_or_throw(const ValidationPolicy& policy = {}) const;

private:
    friend class RegistryBuilder;
    explicit Registry(std::vector<DependencyRecord> records);

    std::vector<DependencyRecord> records_;
    std::map<std::string, std::size_t> index_; // name -> first position
};

class RegistryBuilder {
public:
    RegistryBuilder& add(DependencyRecord record);
    RegistryBuilder& add(std::string name, std::string version,
                         std::optional<std::string> integrity_hash = std::nullopt);

    std::size_t size() const { return records_.size(); }

    // Leaves the builder empty.
    Registry build();

private:
    std::vector<DependencyRecord> records_;
};

} // namespace depver
