#include "cmdtree/module_catalog.hpp"

#include <algorithm>

namespace cmdtree {

ModuleCatalog& ModuleCatalog::global() {
    static ModuleCatalog catalog;
    return catalog;
}

void ModuleCatalog::add(const std::string& module_path, ModuleBuilder builder) {
    builders_[module_path] = std::move(builder);
}

void ModuleCatalog::set_fallback(ModuleBuilder builder) {
    fallback_ = std::move(builder);
}

bool ModuleCatalog::contains(const std::string& module_path) const {
    return builders_.count(module_path) > 0;
}

const ModuleBuilder* ModuleCatalog::find(const std::string& module_path) const {
    auto it = builders_.find(module_path);
    if (it != builders_.end()) {
        return &it->second;
    }
    return fallback_ ? &fallback_ : nullptr;
}

std::vector<std::string> ModuleCatalog::registered_paths() const {
    std::vector<std::string> paths;
    paths.reserve(builders_.size());
    for (const auto& kv : builders_) {
        paths.push_back(kv.first);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace cmdtree
