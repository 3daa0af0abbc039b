#pragma once

#include "nsclient/error.hpp"

#include <functional>
#include <string>
#include <vector>

namespace nsclient {

/// Absolute form of path with duplicate slashes collapsed, "." segments
/// dropped and ".." segments removing their parent (never above root).
std::string normalize_path(const std::string& path);

/// normalize_path("/" + base_prefix + "/" + target_path)
std::string join_target(const std::string& base_prefix, const std::string& target_path);

/// Ancestor directories of a normalized absolute path, shortest first.
/// "/a/b/c.txt" -> {"/a", "/a/b"}; "/c.txt" -> {}.
std::vector<std::string> directory_chain(const std::string& absolute_path);

/// Creates the ancestor directories of a target path, parent before child.
///
/// "Already exists" (409) counts as success, so running it again over an
/// existing tree only produces redundant conflicts. Any other failure stops
/// the walk; directories created so far are left in place.
class PathMaterializer {
public:
    using CreateDirectory = std::function<ActionResult(const std::string& path)>;

    /// @param create_directory  Issues one mkdir for an absolute path.
    /// @param diagnostics       Appended to error messages (masked configuration).
    PathMaterializer(CreateDirectory create_directory, std::string diagnostics);

    Status ensure_ancestors(const std::string& base_prefix,
                            const std::string& target_path) const;

    Status ensure_chain(const std::vector<std::string>& chain) const;

private:
    CreateDirectory create_directory_;
    std::string diagnostics_;
};

}  // namespace nsclient
