#include "cmdtree/types.hpp"

#include <algorithm>

namespace cmdtree {

std::string join_path(const TreePath& path) {
    std::string result;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) result += '.';
        result += path[i];
    }
    return result;
}

std::string normalize_module_path(const TreePath& path) {
    std::string result = join_path(path);
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}

TreePath child_path(const TreePath& path, const std::string& name) {
    TreePath result = path;
    result.push_back(name);
    return result;
}

} // namespace cmdtree
