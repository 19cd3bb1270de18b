#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/store_errors.hpp"

namespace runvault::session {

// Standard artifact names used by the typed wrappers.
inline constexpr const char* kSpecArtifact = "spec.md";
inline constexpr const char* kReviewArtifact = "review.json";
inline constexpr const char* kTestOutputArtifact = "test-output.json";
inline constexpr const char* kLintOutputArtifact = "lint-output.json";
inline constexpr const char* kDiffArtifact = "implementation.diff";

enum class ArtifactType {
    Specification,
    Diff,
    Json,
    Text,
    Code,
    Binary,
    Unknown
};

std::string to_string(ArtifactType type);

// Classifies by lowercased file extension. Advisory only: nothing in the
// store depends on the result.
ArtifactType infer_artifact_type(const std::string& name);

struct ReviewFinding {
    std::string file;
    int line = 0;
    int end_line = 0;
    std::string severity;  // critical, error, warning, info
    std::string category;  // security, performance, style, logic, test
    std::string message;
    std::string suggestion;
    std::string code;
};

struct ReviewMetrics {
    int lines_reviewed = 0;
    int files_reviewed = 0;
    int tokens_used = 0;
    double duration_seconds = 0.0;
};

struct ReviewResult {
    bool approved = false;
    std::string verdict;  // APPROVE, REQUEST_CHANGES, NEEDS_DISCUSSION
    std::string summary;
    std::vector<ReviewFinding> findings;
    ReviewMetrics metrics;

    bool has_critical_findings() const;
    // True when any finding is an error or critical.
    bool has_errors() const;
    std::map<std::string, std::vector<ReviewFinding>> findings_by_file() const;
    std::map<std::string, std::vector<ReviewFinding>> findings_by_severity() const;
};

struct TestFailure {
    std::string name;
    std::string package;
    std::string message;
    std::string file;
    int line = 0;
    std::string output;
    std::string expected;
    std::string actual;
};

struct TestCoverage {
    double percentage = 0.0;
    int lines = 0;
    int covered = 0;
    std::map<std::string, double> by_package;
};

struct TestOutput {
    bool passed = false;
    int total_tests = 0;
    int passed_tests = 0;
    int failed_tests = 0;
    int skipped_tests = 0;
    std::string duration;
    std::vector<TestFailure> failures;
    std::optional<TestCoverage> coverage;

    // Percentage of tests that passed; 0 when no tests ran.
    double success_rate() const;
};

struct LintIssue {
    std::string file;
    int line = 0;
    int column = 0;
    std::string rule;
    std::string severity;  // error, warning
    std::string message;
    bool fixable = false;
};

struct LintSummary {
    int total_issues = 0;
    int errors = 0;
    int warnings = 0;
    int fixable_count = 0;
    int files_checked = 0;
};

struct LintOutput {
    bool passed = false;
    std::string tool;
    std::vector<LintIssue> issues;
    LintSummary summary;
};

nlohmann::json to_json(const ReviewResult& review);
nlohmann::json to_json(const TestOutput& output);
nlohmann::json to_json(const LintOutput& output);

// Decoding errors carry code "invalid_artifact_json".
core::errors::Result<ReviewResult> review_from_json(const nlohmann::json& doc);
core::errors::Result<TestOutput> test_output_from_json(const nlohmann::json& doc);
core::errors::Result<LintOutput> lint_output_from_json(const nlohmann::json& doc);

}  // namespace runvault::session
