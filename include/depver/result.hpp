#pragma once
#include "depver/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace depver {

struct Result {
    bool ok{true};
    int code{0};
    std::string msg;

    static Result Ok() { return Result{}; }
    static Result Fail(int c, std::string m) { return Result{false, c, std::move(m)}; }

    [[nodiscard]] bool is_ok() const { return ok; }
};

// Outcome of Registry::validate(). On failure holds every violation found,
// in record order.
struct ValidationResult : Result {
    std::vector<Violation> violations;

    static ValidationResult Ok() { return ValidationResult{}; }
    static ValidationResult Fail(std::vector<Violation> v);

    // Throws ValidationError when not ok.
    void throw_if_failed() const;
};

std::string describe(const Violation& v);

} // namespace depver
