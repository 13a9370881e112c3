/*
 * taintguard C++17 - Workspace Boundary
 *
 * Answers "does this path stay inside the session workspace?" for the tool
 * interceptor. The root is passed in explicitly; nothing here reads HOME or
 * the current directory.
 */
#ifndef taintguard_CORE_WORKSPACE_HPP
#define taintguard_CORE_WORKSPACE_HPP

#include <string>
#include <vector>

namespace taintguard {

class Workspace {
public:
    Workspace();
    explicit Workspace(const std::string& root);

    // Replace the root. An empty root makes every path "outside".
    void set_root(const std::string& root);
    const std::string& root() const { return root_; }

    // Extra directories treated like the root (e.g. a shared scratch dir)
    void allow_path(const std::string& path);
    const std::vector<std::string>& extra_paths() const { return extra_paths_; }

    // Resolve a tool-supplied path against the root. Relative paths are
    // joined to the root, then "." and ".." are folded lexically.
    std::string resolve(const std::string& path) const;

    // True if `path` (after resolve) lies under the root or an extra path.
    // The deepest existing ancestor is checked through realpath() so that
    // symlinks pointing out of the workspace are rejected, even below
    // directories that do not exist yet. Dangling symlinks are rejected.
    bool contains(const std::string& path) const;

private:
    std::string root_;
    std::vector<std::string> extra_paths_;

    static bool is_under(const std::string& path, const std::string& dir);
    static std::string canonical_dir(const std::string& dir);
};

} // namespace taintguard

#endif // taintguard_CORE_WORKSPACE_HPP
