#include "session/artifact_types.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace runvault::session {

using core::errors::ErrorCategory;
using core::errors::StoreError;
using nlohmann::json;

namespace {

const std::unordered_map<std::string, ArtifactType>& extension_table() {
    static const std::unordered_map<std::string, ArtifactType> table = {
        {".md", ArtifactType::Specification},
        {".diff", ArtifactType::Diff},
        {".patch", ArtifactType::Diff},
        {".json", ArtifactType::Json},
        {".txt", ArtifactType::Text},
        {".log", ArtifactType::Text},
        {".go", ArtifactType::Code},
        {".py", ArtifactType::Code},
        {".js", ArtifactType::Code},
        {".ts", ArtifactType::Code},
        {".java", ArtifactType::Code},
        {".rb", ArtifactType::Code},
        {".c", ArtifactType::Code},
        {".cc", ArtifactType::Code},
        {".cpp", ArtifactType::Code},
        {".h", ArtifactType::Code},
        {".hpp", ArtifactType::Code},
        {".rs", ArtifactType::Code},
        {".png", ArtifactType::Binary},
        {".jpg", ArtifactType::Binary},
        {".jpeg", ArtifactType::Binary},
        {".gif", ArtifactType::Binary},
        {".pdf", ArtifactType::Binary},
        {".zip", ArtifactType::Binary},
        {".tar", ArtifactType::Binary},
        {".gz", ArtifactType::Binary},
    };
    return table;
}

StoreError invalid_json(const std::string& what, const std::string& detail) {
    return StoreError{ErrorCategory::Input, "Malformed " + what + " artifact: " + detail,
                      "invalid_artifact_json"};
}

template <typename T>
T field(const json& doc, const char* key, T fallback) {
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return fallback;
    }
    return doc.at(key).get<T>();
}

const json& array_field(const json& doc, const char* key) {
    static const json empty = json::array();
    if (!doc.contains(key) || !doc.at(key).is_array()) {
        return empty;
    }
    return doc.at(key);
}

}  // namespace

std::string to_string(const ArtifactType type) {
    switch (type) {
        case ArtifactType::Specification:
            return "specification";
        case ArtifactType::Diff:
            return "diff";
        case ArtifactType::Json:
            return "json";
        case ArtifactType::Text:
            return "text";
        case ArtifactType::Code:
            return "code";
        case ArtifactType::Binary:
            return "binary";
        case ArtifactType::Unknown:
        default:
            return "unknown";
    }
}

ArtifactType infer_artifact_type(const std::string& name) {
    std::string ext = std::filesystem::path(name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    const auto& table = extension_table();
    const auto it = table.find(ext);
    return it == table.end() ? ArtifactType::Unknown : it->second;
}

bool ReviewResult::has_critical_findings() const {
    return std::any_of(findings.begin(), findings.end(),
                       [](const ReviewFinding& f) { return f.severity == "critical"; });
}

bool ReviewResult::has_errors() const {
    return std::any_of(findings.begin(), findings.end(), [](const ReviewFinding& f) {
        return f.severity == "critical" || f.severity == "error";
    });
}

std::map<std::string, std::vector<ReviewFinding>> ReviewResult::findings_by_file() const {
    std::map<std::string, std::vector<ReviewFinding>> grouped;
    for (const auto& finding : findings) {
        grouped[finding.file].push_back(finding);
    }
    return grouped;
}

std::map<std::string, std::vector<ReviewFinding>> ReviewResult::findings_by_severity() const {
    std::map<std::string, std::vector<ReviewFinding>> grouped;
    for (const auto& finding : findings) {
        grouped[finding.severity].push_back(finding);
    }
    return grouped;
}

double TestOutput::success_rate() const {
    if (total_tests == 0) {
        return 0.0;
    }
    return static_cast<double>(passed_tests) / static_cast<double>(total_tests) * 100.0;
}

json to_json(const ReviewResult& review) {
    json findings = json::array();
    for (const auto& f : review.findings) {
        json item;
        item["file"] = f.file;
        if (f.line != 0) item["line"] = f.line;
        if (f.end_line != 0) item["endLine"] = f.end_line;
        item["severity"] = f.severity;
        item["category"] = f.category;
        item["message"] = f.message;
        if (!f.suggestion.empty()) item["suggestion"] = f.suggestion;
        if (!f.code.empty()) item["code"] = f.code;
        findings.push_back(item);
    }

    json metrics;
    metrics["linesReviewed"] = review.metrics.lines_reviewed;
    metrics["filesReviewed"] = review.metrics.files_reviewed;
    metrics["tokensUsed"] = review.metrics.tokens_used;
    if (review.metrics.duration_seconds != 0.0) {
        metrics["durationSeconds"] = review.metrics.duration_seconds;
    }

    json doc;
    doc["approved"] = review.approved;
    if (!review.verdict.empty()) {
        doc["verdict"] = review.verdict;
    }
    doc["summary"] = review.summary;
    if (!findings.empty()) {
        doc["findings"] = findings;
    }
    doc["metrics"] = metrics;
    return doc;
}

json to_json(const TestOutput& output) {
    json doc;
    doc["passed"] = output.passed;
    doc["totalTests"] = output.total_tests;
    doc["passedTests"] = output.passed_tests;
    doc["failedTests"] = output.failed_tests;
    doc["skippedTests"] = output.skipped_tests;
    doc["duration"] = output.duration;
    if (!output.failures.empty()) {
        json failures = json::array();
        for (const auto& f : output.failures) {
            json item;
            item["name"] = f.name;
            if (!f.package.empty()) item["package"] = f.package;
            item["message"] = f.message;
            if (!f.file.empty()) item["file"] = f.file;
            if (f.line != 0) item["line"] = f.line;
            if (!f.output.empty()) item["output"] = f.output;
            if (!f.expected.empty()) item["expected"] = f.expected;
            if (!f.actual.empty()) item["actual"] = f.actual;
            failures.push_back(item);
        }
        doc["failures"] = failures;
    }
    if (output.coverage.has_value()) {
        const auto& coverage = output.coverage.value();
        json item;
        item["percentage"] = coverage.percentage;
        item["lines"] = coverage.lines;
        item["covered"] = coverage.covered;
        if (!coverage.by_package.empty()) {
            item["byPackage"] = coverage.by_package;
        }
        doc["coverage"] = item;
    }
    return doc;
}

json to_json(const LintOutput& output) {
    json doc;
    doc["passed"] = output.passed;
    doc["tool"] = output.tool;
    if (!output.issues.empty()) {
        json issues = json::array();
        for (const auto& issue : output.issues) {
            json item;
            item["file"] = issue.file;
            item["line"] = issue.line;
            if (issue.column != 0) item["column"] = issue.column;
            item["rule"] = issue.rule;
            item["severity"] = issue.severity;
            item["message"] = issue.message;
            if (issue.fixable) item["fixable"] = true;
            issues.push_back(item);
        }
        doc["issues"] = issues;
    }
    json summary;
    summary["totalIssues"] = output.summary.total_issues;
    summary["errors"] = output.summary.errors;
    summary["warnings"] = output.summary.warnings;
    summary["fixableCount"] = output.summary.fixable_count;
    summary["filesChecked"] = output.summary.files_checked;
    doc["summary"] = summary;
    return doc;
}

core::errors::Result<ReviewResult> review_from_json(const json& doc) {
    if (!doc.is_object()) {
        return invalid_json("review", "root must be an object");
    }
    ReviewResult review;
    try {
        review.approved = field<bool>(doc, "approved", false);
        review.verdict = field<std::string>(doc, "verdict", "");
        review.summary = field<std::string>(doc, "summary", "");
        for (const auto& item : array_field(doc, "findings")) {
            ReviewFinding f;
            f.file = field<std::string>(item, "file", "");
            f.line = field<int>(item, "line", 0);
            f.end_line = field<int>(item, "endLine", 0);
            f.severity = field<std::string>(item, "severity", "");
            f.category = field<std::string>(item, "category", "");
            f.message = field<std::string>(item, "message", "");
            f.suggestion = field<std::string>(item, "suggestion", "");
            f.code = field<std::string>(item, "code", "");
            review.findings.push_back(std::move(f));
        }
        if (doc.contains("metrics") && doc.at("metrics").is_object()) {
            const auto& metrics = doc.at("metrics");
            review.metrics.lines_reviewed = field<int>(metrics, "linesReviewed", 0);
            review.metrics.files_reviewed = field<int>(metrics, "filesReviewed", 0);
            review.metrics.tokens_used = field<int>(metrics, "tokensUsed", 0);
            review.metrics.duration_seconds = field<double>(metrics, "durationSeconds", 0.0);
        }
    } catch (const json::exception& e) {
        return invalid_json("review", e.what());
    }
    return review;
}

core::errors::Result<TestOutput> test_output_from_json(const json& doc) {
    if (!doc.is_object()) {
        return invalid_json("test output", "root must be an object");
    }
    TestOutput output;
    try {
        output.passed = field<bool>(doc, "passed", false);
        output.total_tests = field<int>(doc, "totalTests", 0);
        output.passed_tests = field<int>(doc, "passedTests", 0);
        output.failed_tests = field<int>(doc, "failedTests", 0);
        output.skipped_tests = field<int>(doc, "skippedTests", 0);
        output.duration = field<std::string>(doc, "duration", "");
        for (const auto& item : array_field(doc, "failures")) {
            TestFailure f;
            f.name = field<std::string>(item, "name", "");
            f.package = field<std::string>(item, "package", "");
            f.message = field<std::string>(item, "message", "");
            f.file = field<std::string>(item, "file", "");
            f.line = field<int>(item, "line", 0);
            f.output = field<std::string>(item, "output", "");
            f.expected = field<std::string>(item, "expected", "");
            f.actual = field<std::string>(item, "actual", "");
            output.failures.push_back(std::move(f));
        }
        if (doc.contains("coverage") && doc.at("coverage").is_object()) {
            const auto& item = doc.at("coverage");
            TestCoverage coverage;
            coverage.percentage = field<double>(item, "percentage", 0.0);
            coverage.lines = field<int>(item, "lines", 0);
            coverage.covered = field<int>(item, "covered", 0);
            coverage.by_package =
                field<std::map<std::string, double>>(item, "byPackage", {});
            output.coverage = coverage;
        }
    } catch (const json::exception& e) {
        return invalid_json("test output", e.what());
    }
    return output;
}

core::errors::Result<LintOutput> lint_output_from_json(const json& doc) {
    if (!doc.is_object()) {
        return invalid_json("lint output", "root must be an object");
    }
    LintOutput output;
    try {
        output.passed = field<bool>(doc, "passed", false);
        output.tool = field<std::string>(doc, "tool", "");
        for (const auto& item : array_field(doc, "issues")) {
            LintIssue issue;
            issue.file = field<std::string>(item, "file", "");
            issue.line = field<int>(item, "line", 0);
            issue.column = field<int>(item, "column", 0);
            issue.rule = field<std::string>(item, "rule", "");
            issue.severity = field<std::string>(item, "severity", "");
            issue.message = field<std::string>(item, "message", "");
            issue.fixable = field<bool>(item, "fixable", false);
            output.issues.push_back(std::move(issue));
        }
        if (doc.contains("summary") && doc.at("summary").is_object()) {
            const auto& summary = doc.at("summary");
            output.summary.total_issues = field<int>(summary, "totalIssues", 0);
            output.summary.errors = field<int>(summary, "errors", 0);
            output.summary.warnings = field<int>(summary, "warnings", 0);
            output.summary.fixable_count = field<int>(summary, "fixableCount", 0);
            output.summary.files_checked = field<int>(summary, "filesChecked", 0);
        }
    } catch (const json::exception& e) {
        return invalid_json("lint output", e.what());
    }
    return output;
}

}  // namespace runvault::session
