#include <gtest/gtest.h>

#include "depver/errors.hpp"
#include "depver/registry.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

depver::Registry TwoTools() {
    depver::RegistryBuilder b;
    b.add("toolA", "1.2.3", "sha256:abc");
    b.add("toolB", "9.9.9");
    return b.build();
}

bool HasViolation(const depver::ValidationResult& r, depver::ViolationKind kind, const std::string& name) {
    return std::any_of(r.violations.begin(), r.violations.end(), [&](const depver::Violation& v) {
        return v.kind == kind && v.name == name;
    });
}

TEST(RegistryTest, GetReturnsRecordUnchanged) {
    auto reg = TwoTools();

    const auto& a = reg.get("toolA");
    EXPECT_EQ(a.name, "toolA");
    EXPECT_EQ(a.version, "1.2.3");
    ASSERT_TRUE(a.integrity_hash.has_value());
    EXPECT_EQ(*a.integrity_hash, "sha256:abc");

    const auto& b = reg.get("toolB");
    EXPECT_EQ(b.version, "9.9.9");
    EXPECT_FALSE(b.integrity_hash.has_value());
}

TEST(RegistryTest, GetUnknownThrowsNotFound) {
    auto reg = TwoTools();

    try {
        (void)reg.get("toolC");
        FAIL() << "expected NotFoundError";
    } catch (const depver::NotFoundError& e) {
        EXPECT_EQ(e.name, "toolC");
    }
    EXPECT_EQ(reg.find("toolC"), nullptr);
    EXPECT_FALSE(reg.contains("toolC"));
    EXPECT_TRUE(reg.contains("toolB"));
}

TEST(RegistryTest, AllIsCompleteAndRestartable) {
    auto reg = TwoTools();

    const auto view = reg.all();
    std::vector<depver::DependencyRecord> first(view.begin(), view.end());
    const auto again = reg.all();
    std::vector<depver::DependencyRecord> second(again.begin(), again.end());

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].name, "toolA");
    EXPECT_EQ(first[1].name, "toolB");
    EXPECT_EQ(first, second);
    EXPECT_EQ(reg.size(), 2u);
}

TEST(RegistryTest, ExampleScenarioValidates) {
    auto reg = TwoTools();
    auto r = reg.validate();
    EXPECT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(r.violations.empty());
    EXPECT_NO_THROW(reg.validate_or_throw());
}

TEST(RegistryTest, DuplicateNameFailsValidation) {
    depver::RegistryBuilder b;
    b.add("toolA", "1.0.0");
    b.add("toolA", "2.0.0");
    auto reg = b.build();

    auto r = reg.validate();
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.violations.size(), 1u);
    EXPECT_EQ(r.violations[0].kind, depver::ViolationKind::DuplicateName);
    EXPECT_EQ(r.violations[0].name, "toolA");
    EXPECT_NE(r.msg.find("toolA"), std::string::npos);

    // lookups still work, first definition wins
    EXPECT_EQ(reg.get("toolA").version, "1.0.0");
    EXPECT_EQ(reg.all().size(), 2u);
}

TEST(RegistryTest, ReportsEveryViolationInOnePass) {
    depver::RegistryBuilder b;
    b.add("a", "1.0");
    b.add("a", "1.1");
    b.add("b", "");
    b.add("", "3.0");
    b.add("c", "1 .0");
    b.add("d", "2.0", "md5:xyz");
    b.add("e", "2.0");
    auto reg = b.build();

    depver::ValidationPolicy policy;
    policy.require_integrity = true;
    policy.integrity_exempt = {"a", "b", "", "c"};
    policy.check_integrity_format = true;

    auto r = reg.validate(policy);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.violations.size(), 6u);
    EXPECT_EQ(r.code, 6);
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::DuplicateName, "a"));
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::InvalidVersion, "b"));
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::EmptyName, ""));
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::InvalidVersion, "c"));
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::MalformedHash, "d"));
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::MissingHash, "e"));
}

TEST(RegistryTest, HashChecksAreOptIn) {
    depver::RegistryBuilder b;
    b.add("toolA", "1.0", "not-a-hash");
    b.add("toolB", "1.0");
    auto reg = b.build();

    EXPECT_TRUE(reg.validate().is_ok());

    depver::ValidationPolicy policy;
    policy.require_integrity = true;
    policy.check_integrity_format = true;
    auto r = reg.validate(policy);
    ASSERT_FALSE(r.is_ok());
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::MalformedHash, "toolA"));
    EXPECT_TRUE(HasViolation(r, depver::ViolationKind::MissingHash, "toolB"));
}

TEST(RegistryTest, ValidateOrThrowCarriesAllViolations) {
    depver::RegistryBuilder b;
    b.add("x", "1");
    b.add("x", "2");
    b.add("y", "");
    auto reg = b.build();

    try {
        reg.validate_or_throw();
        FAIL() << "expected ValidationError";
    } catch (const depver::ValidationError& e) {
        ASSERT_EQ(e.violations.size(), 2u);
        EXPECT_NE(std::string(e.what()).find("duplicate-name 'x'"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("invalid-version 'y'"), std::string::npos);
    }
}

TEST(RegistryTest, EmptyRegistryIsValid) {
    depver::RegistryBuilder b;
    auto reg = b.build();
    EXPECT_TRUE(reg.empty());
    EXPECT_TRUE(reg.all().empty());
    EXPECT_TRUE(reg.validate().is_ok());
}

TEST(RegistryTest, BuilderIsEmptyAfterBuild) {
    depver::RegistryBuilder b;
    b.add("toolA", "1.0");
    auto first = b.build();
    EXPECT_EQ(b.size(), 0u);

    b.add("toolB", "2.0");
    auto second = b.build();
    EXPECT_TRUE(first.contains("toolA"));
    EXPECT_FALSE(second.contains("toolA"));
    EXPECT_TRUE(second.contains("toolB"));
}

} // namespace
