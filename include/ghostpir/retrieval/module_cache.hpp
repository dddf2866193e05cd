#pragma once

#include "ghostpir/core/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ghostpir::retrieval {

// ============================================================================
// Module Cache Interface
// ============================================================================

/// Completed artifacts keyed by module id. Only whole artifacts are stored.
class ModuleCache {
public:
    virtual ~ModuleCache() = default;

    virtual std::optional<ModuleArtifact> get(const std::string& module_id) const = 0;

    /// Replaces any artifact already stored under the same id
    virtual void put(const ModuleArtifact& artifact) = 0;

    virtual bool contains(const std::string& module_id) const = 0;

    virtual void erase(const std::string& module_id) = 0;

    virtual void clear() = 0;
};

// ============================================================================
// In-Memory Cache
// ============================================================================

class InMemoryModuleCache : public ModuleCache {
private:
    mutable std::mutex mutex_;
    std::map<std::string, ModuleArtifact> entries_;

public:
    std::optional<ModuleArtifact> get(const std::string& module_id) const override;
    void put(const ModuleArtifact& artifact) override;
    bool contains(const std::string& module_id) const override;
    void erase(const std::string& module_id) override;
    void clear() override;

    size_t size() const;
    std::vector<std::string> module_ids() const;
};

} // namespace ghostpir::retrieval
