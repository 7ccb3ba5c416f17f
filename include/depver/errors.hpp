#pragma once
#include "depver/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace depver {

struct NotFoundError : public std::runtime_error {
    explicit NotFoundError(const std::string& dep_name)
        : std::runtime_error("Unknown dependency: " + dep_name), name(dep_name) {}

    std::string name;
};

struct ValidationError : public std::runtime_error {
    explicit ValidationError(std::vector<Violation> v);

    std::vector<Violation> violations;
};

struct LoadError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace depver
