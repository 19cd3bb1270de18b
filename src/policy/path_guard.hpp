#pragma once

#include <filesystem>
#include <string>
#include "core/errors/store_errors.hpp"

namespace runvault::policy {

// Lexical containment checks for paths derived from untrusted names:
// artifact names, workspace-relative file paths and archive entry names.
class PathGuard {
public:
    // Resolves `relative` beneath `root` and rejects anything that is empty,
    // absolute, or escapes `root` through "..". Symlinks are not followed.
    static core::errors::Result<std::filesystem::path> resolve_within(
        const std::filesystem::path& root,
        const std::string& relative);

    // Validates a single path component (an artifact or run name).
    static core::errors::Result<std::string> validate_name(const std::string& name);

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace runvault::policy
