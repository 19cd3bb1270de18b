#include "policy/path_guard.hpp"

namespace runvault::policy {

using core::errors::ErrorCategory;
using core::errors::StoreError;

bool PathGuard::is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child) {
    const auto normal_root = root.lexically_normal();
    const auto normal_child = child.lexically_normal();
    auto root_it = normal_root.begin();
    auto child_it = normal_child.begin();
    for (; root_it != normal_root.end() && child_it != normal_child.end();
         ++root_it, ++child_it) {
        if (root_it->empty()) {
            // trailing separator on root
            continue;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    for (; root_it != normal_root.end(); ++root_it) {
        if (!root_it->empty()) {
            return false;
        }
    }
    return true;
}

core::errors::Result<std::filesystem::path> PathGuard::resolve_within(
    const std::filesystem::path& root,
    const std::string& relative) {
    if (relative.empty()) {
        return StoreError{ErrorCategory::Input, "Path cannot be empty.", "invalid_path"};
    }
    const std::filesystem::path candidate(relative);
    if (candidate.is_absolute() || candidate.has_root_name() || relative.front() == '/') {
        return StoreError{ErrorCategory::Input, "Path must be relative: " + relative,
                          "invalid_path"};
    }

    const std::filesystem::path normal = candidate.lexically_normal();
    if (!normal.empty() && *normal.begin() == "..") {
        return StoreError{ErrorCategory::Input, "Path escapes its root: " + relative,
                          "path_outside_root"};
    }
    if (normal.empty() || normal == ".") {
        return StoreError{ErrorCategory::Input, "Path does not name an entry: " + relative,
                          "invalid_path"};
    }

    const std::filesystem::path resolved = (root / normal).lexically_normal();
    if (!is_within_root(root, resolved)) {
        return StoreError{ErrorCategory::Input, "Path escapes its root: " + relative,
                          "path_outside_root"};
    }
    return resolved;
}

core::errors::Result<std::string> PathGuard::validate_name(const std::string& name) {
    if (name.empty()) {
        return StoreError{ErrorCategory::Input, "Name cannot be empty.", "invalid_name"};
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name.find('\0') != std::string::npos) {
        return StoreError{ErrorCategory::Input, "Name must be a single path component: " + name,
                          "invalid_name"};
    }
    return name;
}

}  // namespace runvault::policy
