/*
 * taintguard C++17 - Workspace Boundary Implementation
 */
#include <taintguard/core/workspace.hpp>
#include <taintguard/core/logger.hpp>
#include <taintguard/core/utils.hpp>

#include <climits>
#include <cstdlib>
#include <sys/stat.h>

namespace taintguard {

namespace {

// Canonicalize the deepest existing ancestor of an absolute, lexically
// normalized path and re-append the components that do not exist yet.
// Returns false when a component exists but cannot be resolved (a dangling
// symlink, or a directory we may not search).
bool resolve_through_ancestors(const std::string& lexical, std::string& out) {
    char resolved[PATH_MAX];
    std::string prefix = lexical;
    std::string suffix;

    while (!realpath(prefix.c_str(), resolved)) {
        struct stat st;
        if (lstat(prefix.c_str(), &st) == 0) {
            return false;
        }
        size_t slash = prefix.rfind('/');
        if (slash == std::string::npos) {
            return false;
        }
        const std::string name = prefix.substr(slash + 1);
        suffix = suffix.empty() ? name : name + "/" + suffix;
        prefix = slash == 0 ? "/" : prefix.substr(0, slash);
    }

    out = suffix.empty() ? std::string(resolved) : join_path(resolved, suffix);
    return true;
}

} // anonymous namespace

Workspace::Workspace() {}

Workspace::Workspace(const std::string& root) {
    set_root(root);
}

std::string Workspace::canonical_dir(const std::string& dir) {
    if (dir.empty()) return dir;
    std::string lexical = normalize_path(dir);
    std::string canonical;
    if (!lexical.empty() && lexical[0] == '/' && resolve_through_ancestors(lexical, canonical)) {
        return canonical;
    }
    // Relative or unresolvable; keep the lexical form
    return lexical;
}

void Workspace::set_root(const std::string& root) {
    root_ = canonical_dir(root);
    LOG_DEBUG("[Workspace] root=%s", root_.c_str());
}

void Workspace::allow_path(const std::string& path) {
    std::string canonical = canonical_dir(path);
    if (!canonical.empty()) {
        extra_paths_.push_back(canonical);
    }
}

bool Workspace::is_under(const std::string& path, const std::string& dir) {
    if (dir.empty()) return false;
    if (dir == "/") return !path.empty() && path[0] == '/';
    if (path.size() >= dir.size() &&
        path.compare(0, dir.size(), dir) == 0) {
        return (path.size() == dir.size() || path[dir.size()] == '/');
    }
    return false;
}

std::string Workspace::resolve(const std::string& path) const {
    if (path.empty() || path == ".") {
        return root_;
    }
    if (path[0] == '/') {
        return normalize_path(path);
    }
    if (path[0] == '~') {
        // Never expand: a home-relative path is outside by construction
        return path;
    }
    return normalize_path(join_path(root_, path));
}

bool Workspace::contains(const std::string& path) const {
    if (root_.empty()) return false;

    std::string lexical = resolve(path);
    if (lexical.empty() || lexical[0] != '/') {
        return false;
    }

    // Follow symlinks along the longest existing prefix, so a link anywhere
    // above a not-yet-created file is still honored
    std::string check_path;
    if (!resolve_through_ancestors(lexical, check_path)) {
        LOG_DEBUG("[Workspace] Unresolvable component in %s", lexical.c_str());
        return false;
    }

    if (is_under(check_path, root_)) {
        return true;
    }
    for (size_t i = 0; i < extra_paths_.size(); ++i) {
        if (is_under(check_path, extra_paths_[i])) {
            return true;
        }
    }
    return false;
}

} // namespace taintguard
