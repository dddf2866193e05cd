#include "ghostpir/retrieval/module_cache.hpp"

namespace ghostpir::retrieval {

std::optional<ModuleArtifact> InMemoryModuleCache::get(const std::string& module_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(module_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryModuleCache::put(const ModuleArtifact& artifact) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(artifact.descriptor.id, artifact);
}

bool InMemoryModuleCache::contains(const std::string& module_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(module_id) > 0;
}

void InMemoryModuleCache::erase(const std::string& module_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(module_id);
}

void InMemoryModuleCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t InMemoryModuleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> InMemoryModuleCache::module_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, artifact] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace ghostpir::retrieval
